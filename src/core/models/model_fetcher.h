#pragma once

#include "core/models/embedder_spec.h"

#include <QString>

#include <vector>

namespace gt {

// ModelFetcher — one-time acquisition of model artifacts over HTTP(S).
//
// Each artifact is written to "<dest>.part" and renamed into place only
// after a complete, successful transfer, so a killed download never leaves
// a truncated model behind. All transfers of one fetcher share a single
// deadline.
class ModelFetcher {
public:
    explicit ModelFetcher(int totalTimeoutMs);

    // Downloads each artifact missing from modelsDir. Returns true when all
    // of them are present afterwards.
    bool ensureArtifacts(const std::vector<ModelArtifact>& artifacts, const QString& modelsDir,
                         QString* errorOut = nullptr);

    bool download(const QString& url, const QString& destPath, QString* errorOut = nullptr);

    static constexpr long kConnectTimeoutMs = 10000;

private:
    long remainingMs() const;

    int m_totalTimeoutMs;
    qint64 m_deadlineMs = 0;
};

} // namespace gt
