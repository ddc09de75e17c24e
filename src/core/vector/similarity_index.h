#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace hnswlib {
class InnerProductSpace;

template <typename dist_t>
class BruteforceSearch;
} // namespace hnswlib

namespace gt {

// SimilarityIndex — exact inner-product search over L2-normalized vectors.
// Labels are caller-chosen (typically a candidate's position in a snapshot).
// Vectors whose dimension differs from the index are rejected.
class SimilarityIndex {
public:
    struct Hit {
        uint64_t label = 0;
        float cosine = 0.0f;
    };

    SimilarityIndex(int dimensions, size_t capacity);
    ~SimilarityIndex();

    SimilarityIndex(const SimilarityIndex&) = delete;
    SimilarityIndex& operator=(const SimilarityIndex&) = delete;

    bool add(uint64_t label, const std::vector<float>& vector);

    // Nearest k by cosine, best first. k is clamped to the element count.
    std::vector<Hit> search(const std::vector<float>& query, size_t k) const;

    // Cosine of every stored vector, keyed by label.
    std::vector<Hit> scoreAll(const std::vector<float>& query) const;

    size_t size() const { return m_count; }
    int dimensions() const { return m_dimensions; }
    bool isAvailable() const { return m_index != nullptr; }

    // 100 / (1 + ||q - p||) for unit vectors, where ||q - p|| = sqrt(2 - 2 cos).
    static double similarityPercent(double cosine);

private:
    int m_dimensions;
    size_t m_capacity;
    size_t m_count = 0;
    std::unique_ptr<hnswlib::InnerProductSpace> m_space;
    std::unique_ptr<hnswlib::BruteforceSearch<float>> m_index;
};

} // namespace gt
