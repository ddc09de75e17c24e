#include "core/shared/run_context.h"

#include "core/models/model_cache.h"
#include "core/shared/app_paths.h"
#include "core/shared/logging.h"

#include <QDir>

#include <utility>

namespace gt {

std::unique_ptr<RunContext> RunContext::create(Settings settings, QString* errorOut)
{
    auto context = std::make_unique<RunContext>();
    context->settings = std::move(settings);
    context->configDir = configDirectory();
    context->databasePath = databasePath();

    context->techSignatures = TechSignatureTable::builtin();
    const QString overridesPath = QDir(context->configDir).filePath(QStringLiteral("tech_signatures.json"));
    if (!context->techSignatures.loadOverrides(overridesPath, errorOut)) {
        return nullptr;
    }

    if (context->settings.embeddingEnabled) {
        // Resolving the directory only seeds the manifest; nothing is loaded
        // until the handle is first used.
        context->embeddings = std::make_unique<EmbeddingHandle>(
            EmbeddingHandle::onnxFactory(resolveModelsDir(),
                                         context->settings.embeddingTimeoutMs));
    } else {
        context->embeddings = std::make_unique<EmbeddingHandle>(
            nullptr, QStringLiteral("embeddings disabled in configuration"));
    }

    LOG_DEBUG(gotoCore, "Run context: config=%s db=%s roots=%zu",
              qPrintable(context->configDir), qPrintable(context->databasePath),
              context->settings.scanPaths.size());
    return context;
}

} // namespace gt
