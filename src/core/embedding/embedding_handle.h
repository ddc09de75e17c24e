#pragma once

#include "core/embedding/embedding_provider.h"

#include <QString>

#include <functional>
#include <memory>
#include <mutex>

namespace gt {

// EmbeddingHandle — construct-on-first-use slot for the embedding provider.
// The factory runs at most once per handle; a failed construction leaves the
// slot empty for the rest of the process and get() returns nullptr.
class EmbeddingHandle {
public:
    using Factory = std::function<std::unique_ptr<EmbeddingProvider>(QString* errorOut)>;

    // A null factory yields a permanently disabled handle.
    explicit EmbeddingHandle(Factory factory, QString disabledReason = QString());

    EmbeddingHandle(const EmbeddingHandle&) = delete;
    EmbeddingHandle& operator=(const EmbeddingHandle&) = delete;

    EmbeddingProvider* get();

    bool disabled() const { return m_disabled; }
    QString failureReason() const;

    // Factory that builds an EmbeddingManager over the given model directory.
    static Factory onnxFactory(const QString& modelsDir, int fetchTimeoutMs);

private:
    Factory m_factory;
    std::unique_ptr<EmbeddingProvider> m_provider;
    QString m_failureReason;
    bool m_attempted = false;
    bool m_disabled = false;
    mutable std::mutex m_mutex;
};

} // namespace gt
