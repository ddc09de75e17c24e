#include "core/embedding/embedding_manager.h"

#include "core/embedding/onnx_encoder.h"
#include "core/embedding/tokenizer.h"
#include "core/models/model_fetcher.h"
#include "core/shared/logging.h"

#include <QDir>

#include <cmath>

namespace gt {

EmbeddingManager::EmbeddingManager(const QString& modelsDir, int fetchTimeoutMs)
    : m_modelsDir(modelsDir)
    , m_fetchTimeoutMs(fetchTimeoutMs)
{
}

EmbeddingManager::~EmbeddingManager() = default;

bool EmbeddingManager::initialize(QString* errorOut)
{
    const QDir dir(m_modelsDir);
    std::optional<EmbedderSpec> spec = loadEmbedderSpec(dir.filePath(QStringLiteral("manifest.json")),
                                                        errorOut);
    if (!spec) {
        return false;
    }

#ifdef GOTO_WITH_ONNX
    ModelFetcher fetcher(m_fetchTimeoutMs);
    if (!fetcher.ensureArtifacts(spec->artifacts(), m_modelsDir, errorOut)) {
        return false;
    }

    std::unique_ptr<WordPieceTokenizer> tokenizer =
        WordPieceTokenizer::load(dir.filePath(spec->vocab.fileName), spec->maxSeqLength, errorOut);
    if (!tokenizer) {
        return false;
    }
    std::unique_ptr<OnnxEncoder> encoder =
        OnnxEncoder::open(dir.filePath(spec->model.fileName), *spec, errorOut);
    if (!encoder) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_spec = std::move(*spec);
    m_tokenizer = std::move(tokenizer);
    m_encoder = std::move(encoder);
    m_consecutiveFailures = 0;
    LOG_INFO(gotoEmbedding, "Embedding model ready: %s (%d dims, %s pooling)",
             qPrintable(m_spec.modelId), m_spec.dimensions, poolingName(m_spec.pooling));
    return true;
#else
    // Nothing could run the model, so skip the download.
    if (errorOut) {
        *errorOut = QStringLiteral("built without ONNX Runtime");
    }
    return false;
#endif
}

bool EmbeddingManager::isAvailable() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_encoder && m_consecutiveFailures < kMaxConsecutiveFailures;
}

std::vector<float> EmbeddingManager::normalizeEmbedding(std::vector<float> embedding)
{
    double squares = 0.0;
    for (const float v : embedding) {
        squares += double(v) * double(v);
    }
    if (squares <= 0.0) {
        return embedding;
    }
    const double norm = std::sqrt(squares);
    for (float& v : embedding) {
        v = float(double(v) / norm);
    }
    return embedding;
}

std::vector<std::vector<float>> EmbeddingManager::poolHiddenStates(const HiddenStates& states,
                                                                   const TokenBatch& batch,
                                                                   Pooling pooling, int dimensions)
{
    const std::vector<int64_t>& shape = states.shape;
    const bool pooled = shape.size() == 2;
    if ((shape.size() != 2 && shape.size() != 3) || shape.front() != batch.rows
        || shape.back() != dimensions) {
        return {};
    }

    const size_t dims = size_t(dimensions);
    const size_t steps = pooled ? 1 : size_t(shape[1]);
    if (states.values.size() < size_t(batch.rows) * steps * dims) {
        return {};
    }

    std::vector<std::vector<float>> vectors;
    vectors.reserve(size_t(batch.rows));
    for (int row = 0; row < batch.rows; ++row) {
        const float* base = states.values.data() + size_t(row) * steps * dims;
        std::vector<float> vector(base, base + dims);

        // Token states: CLS is the first step, mean averages attended steps.
        if (!pooled && pooling == Pooling::Mean) {
            std::vector<double> sum(dims, 0.0);
            int attended = 0;
            for (size_t step = 0; step < steps && int(step) < batch.columns; ++step) {
                if (!batch.attends(row, int(step))) {
                    continue;
                }
                const float* state = base + step * dims;
                for (size_t d = 0; d < dims; ++d) {
                    sum[d] += state[d];
                }
                ++attended;
            }
            if (attended > 0) {
                for (size_t d = 0; d < dims; ++d) {
                    vector[d] = float(sum[d] / attended);
                }
            }
        }
        vectors.push_back(normalizeEmbedding(std::move(vector)));
    }
    return vectors;
}

std::vector<std::vector<float>> EmbeddingManager::encode(const std::vector<QString>& texts)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_encoder || texts.empty() || m_consecutiveFailures >= kMaxConsecutiveFailures) {
        return {};
    }

    const TokenBatch batch = m_tokenizer->encodeBatch(texts);
    HiddenStates states;
    QString error;
    std::vector<std::vector<float>> vectors;
    if (m_encoder->run(batch, &states, &error)) {
        vectors = poolHiddenStates(states, batch, m_spec.pooling, m_spec.dimensions);
        if (vectors.empty()) {
            error = QStringLiteral("unexpected output shape");
        }
    }

    if (vectors.empty()) {
        ++m_consecutiveFailures;
        LOG_WARN(gotoEmbedding, "Embedding %zu text(s) failed (%d in a row): %s", texts.size(),
                 m_consecutiveFailures, qPrintable(error));
        if (m_consecutiveFailures == kMaxConsecutiveFailures) {
            LOG_WARN(gotoEmbedding, "Giving up on the embedding model for this run");
        }
        return {};
    }
    m_consecutiveFailures = 0;
    return vectors;
}

std::vector<float> EmbeddingManager::embedQuery(const QString& text)
{
    std::vector<std::vector<float>> vectors = encode({m_spec.queryPrefix + text});
    return vectors.empty() ? std::vector<float>() : std::move(vectors.front());
}

std::vector<std::vector<float>> EmbeddingManager::embedBatch(const std::vector<QString>& texts)
{
    if (m_spec.passagePrefix.isEmpty()) {
        return encode(texts);
    }
    std::vector<QString> prefixed;
    prefixed.reserve(texts.size());
    for (const QString& text : texts) {
        prefixed.push_back(m_spec.passagePrefix + text);
    }
    return encode(prefixed);
}

} // namespace gt
