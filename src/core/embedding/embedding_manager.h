#pragma once

#include "core/embedding/embedding_provider.h"
#include "core/models/embedder_spec.h"

#include <QString>

#include <memory>
#include <mutex>
#include <vector>

namespace gt {

class OnnxEncoder;
class WordPieceTokenizer;
struct HiddenStates;
struct TokenBatch;

// EmbeddingManager — EmbeddingProvider backed by a local ONNX encoder.
// initialize() reads <modelsDir>/manifest.json, downloads missing
// artifacts within fetchTimeoutMs, then opens the vocab and the session.
class EmbeddingManager : public EmbeddingProvider {
public:
    EmbeddingManager(const QString& modelsDir, int fetchTimeoutMs);
    ~EmbeddingManager() override;

    EmbeddingManager(const EmbeddingManager&) = delete;
    EmbeddingManager& operator=(const EmbeddingManager&) = delete;

    bool initialize(QString* errorOut = nullptr);

    // False before initialize() succeeds and after kMaxConsecutiveFailures
    // inference runs in a row have failed.
    bool isAvailable() const override;
    int dimensions() const override { return m_spec.dimensions; }
    QString modelId() const override { return m_spec.modelId; }

    std::vector<float> embedQuery(const QString& text) override;
    std::vector<std::vector<float>> embedBatch(const std::vector<QString>& texts) override;

    static constexpr int kMaxConsecutiveFailures = 3;

    // One unit vector per batch row, or empty when the output shape does
    // not match the batch and dimension count.
    static std::vector<std::vector<float>> poolHiddenStates(const HiddenStates& states,
                                                            const TokenBatch& batch,
                                                            Pooling pooling, int dimensions);
    static std::vector<float> normalizeEmbedding(std::vector<float> embedding);

private:
    std::vector<std::vector<float>> encode(const std::vector<QString>& texts);

    QString m_modelsDir;
    int m_fetchTimeoutMs;
    EmbedderSpec m_spec;
    std::unique_ptr<WordPieceTokenizer> m_tokenizer;
    std::unique_ptr<OnnxEncoder> m_encoder;
    int m_consecutiveFailures = 0;
    mutable std::mutex m_mutex;
};

} // namespace gt
