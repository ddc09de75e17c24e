#include "core/embedding/embedding_handle.h"

#include "core/embedding/embedding_manager.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <utility>

namespace gt {

EmbeddingHandle::EmbeddingHandle(Factory factory, QString disabledReason)
    : m_factory(std::move(factory))
    , m_failureReason(std::move(disabledReason))
{
    if (!m_factory) {
        m_attempted = true;
        m_disabled = true;
        if (m_failureReason.isEmpty()) {
            m_failureReason = QStringLiteral("embeddings disabled");
        }
    }
}

EmbeddingProvider* EmbeddingHandle::get()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_attempted) {
        return m_provider.get();
    }
    m_attempted = true;

    QElapsedTimer timer;
    timer.start();
    QString error;
    std::unique_ptr<EmbeddingProvider> provider = m_factory(&error);
    if (!provider || !provider->isAvailable()) {
        m_failureReason = error.isEmpty() ? QStringLiteral("embedding provider unavailable") : error;
        LOG_WARN(gotoEmbedding, "Embedding provider unavailable: %s", qPrintable(m_failureReason));
        return nullptr;
    }

    LOG_DEBUG(gotoEmbedding, "Embedding provider %s initialized in %lld ms",
              qPrintable(provider->modelId()), static_cast<long long>(timer.elapsed()));
    m_provider = std::move(provider);
    return m_provider.get();
}

QString EmbeddingHandle::failureReason() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_failureReason;
}

EmbeddingHandle::Factory EmbeddingHandle::onnxFactory(const QString& modelsDir, int fetchTimeoutMs)
{
    return [modelsDir, fetchTimeoutMs](QString* errorOut) -> std::unique_ptr<EmbeddingProvider> {
        auto manager = std::make_unique<EmbeddingManager>(modelsDir, fetchTimeoutMs);
        if (!manager->initialize(errorOut)) {
            return nullptr;
        }
        return manager;
    };
}

} // namespace gt
