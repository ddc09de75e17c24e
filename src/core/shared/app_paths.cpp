#include "core/shared/app_paths.h"

#include <QDir>
#include <QStandardPaths>

namespace gt {

namespace {

QString fromEnvOr(const char* name, QStandardPaths::StandardLocation location)
{
    const QString overrideDir = qEnvironmentVariable(name);
    if (!overrideDir.isEmpty()) {
        return QDir::cleanPath(overrideDir);
    }
    return QStandardPaths::writableLocation(location);
}

} // anonymous namespace

QString configDirectory()
{
    return fromEnvOr("GOTO_CONFIG_DIR", QStandardPaths::AppConfigLocation);
}

QString dataDirectory()
{
    return fromEnvOr("GOTO_DATA_DIR", QStandardPaths::AppDataLocation);
}

QString databasePath()
{
    return dataDirectory() + QStringLiteral("/cache.db");
}

QString writableModelsDirectory()
{
    return dataDirectory() + QStringLiteral("/models");
}

} // namespace gt
