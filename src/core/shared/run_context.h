#pragma once

#include "core/embedding/embedding_handle.h"
#include "core/extraction/tech_signatures.h"
#include "core/shared/scoring_types.h"
#include "core/shared/settings.h"

#include <QString>

#include <memory>

namespace gt {

// Everything one invocation needs, built once at process entry and passed
// down by reference. Settings are read-only for the lifetime of the run.
struct RunContext {
    Settings settings;
    QString configDir;
    QString databasePath;
    RankingWeights weights;
    TechSignatureTable techSignatures;
    std::unique_ptr<EmbeddingHandle> embeddings;
    bool debug = false;
    bool cdOnly = false;

    // Builds the context from the on-disk locations: tech table overrides
    // from <config>/tech_signatures.json and an ONNX-backed embedding handle
    // unless embeddings are disabled in settings.
    static std::unique_ptr<RunContext> create(Settings settings, QString* errorOut = nullptr);
};

} // namespace gt
