#pragma once

#include <QString>

#include <vector>

namespace gt {

// Text → fixed-length vector capability. An unavailable provider returns
// empty vectors; callers treat that as "no embedding" and degrade to
// lexical-only scoring.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual bool isAvailable() const = 0;
    virtual int dimensions() const = 0;
    virtual QString modelId() const = 0;

    // Query-side embedding (the model's query prefix is applied).
    virtual std::vector<float> embedQuery(const QString& text) = 0;

    // Passage-side embeddings, one per input in order. Returns an empty
    // vector when the whole batch failed.
    virtual std::vector<std::vector<float>> embedBatch(const std::vector<QString>& texts) = 0;
};

} // namespace gt
