#include "core/vector/similarity_index.h"

#include "core/shared/logging.h"

#include "hnswlib/hnswlib.h"

#include <algorithm>
#include <cmath>

namespace gt {

SimilarityIndex::SimilarityIndex(int dimensions, size_t capacity)
    : m_dimensions(dimensions)
    , m_capacity(std::max<size_t>(capacity, 1))
{
    if (m_dimensions <= 0) {
        LOG_WARN(gotoRanking, "SimilarityIndex rejected invalid dimensions: %d", m_dimensions);
        return;
    }

    try {
        m_space = std::make_unique<hnswlib::InnerProductSpace>(static_cast<size_t>(m_dimensions));
        m_index = std::make_unique<hnswlib::BruteforceSearch<float>>(m_space.get(), m_capacity);
    } catch (const std::exception& e) {
        LOG_ERROR(gotoRanking, "SimilarityIndex create failed: %s", e.what());
        m_index.reset();
        m_space.reset();
    }
}

SimilarityIndex::~SimilarityIndex() = default;

bool SimilarityIndex::add(uint64_t label, const std::vector<float>& vector)
{
    if (!m_index || static_cast<int>(vector.size()) != m_dimensions || m_count >= m_capacity) {
        return false;
    }
    try {
        m_index->addPoint(vector.data(), static_cast<hnswlib::labeltype>(label));
        ++m_count;
        return true;
    } catch (const std::exception& e) {
        LOG_WARN(gotoRanking, "SimilarityIndex add failed: %s", e.what());
        return false;
    }
}

std::vector<SimilarityIndex::Hit> SimilarityIndex::search(const std::vector<float>& query,
                                                          size_t k) const
{
    std::vector<Hit> hits;
    if (!m_index || m_count == 0 || k == 0 || static_cast<int>(query.size()) != m_dimensions) {
        return hits;
    }

    try {
        auto queue = m_index->searchKnn(query.data(), std::min(k, m_count));
        hits.reserve(queue.size());
        while (!queue.empty()) {
            const auto& top = queue.top();
            // InnerProductSpace distance is 1 - dot.
            hits.push_back({static_cast<uint64_t>(top.second), 1.0f - top.first});
            queue.pop();
        }
    } catch (const std::exception& e) {
        LOG_WARN(gotoRanking, "SimilarityIndex search failed: %s", e.what());
        return {};
    }

    // The queue yields farthest first.
    std::reverse(hits.begin(), hits.end());
    return hits;
}

std::vector<SimilarityIndex::Hit> SimilarityIndex::scoreAll(const std::vector<float>& query) const
{
    return search(query, m_count);
}

double SimilarityIndex::similarityPercent(double cosine)
{
    const double clamped = std::clamp(cosine, -1.0, 1.0);
    const double distance = std::sqrt(std::max(0.0, 2.0 - 2.0 * clamped));
    return 100.0 / (1.0 + distance);
}

} // namespace gt
