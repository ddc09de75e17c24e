#include "core/shared/settings_manager.h"
#include "core/shared/app_paths.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include <algorithm>

namespace gt {

namespace {

QStringList toStringList(const QJsonValue& value)
{
    QStringList out;
    const QJsonArray array = value.toArray();
    out.reserve(array.size());
    for (const QJsonValue& entry : array) {
        const QString str = entry.toString().trimmed();
        if (!str.isEmpty()) {
            out.append(str);
        }
    }
    return out;
}

ScanPath scanPathFromJson(const QJsonValue& value)
{
    ScanPath scanPath;
    // Older files store scan paths as plain strings.
    if (value.isString()) {
        scanPath.path = value.toString();
        return scanPath;
    }

    const QJsonObject obj = value.toObject();
    scanPath.path = obj.value(QStringLiteral("path")).toString();
    scanPath.recursive = obj.value(QStringLiteral("recursive")).toBool(true);
    scanPath.maxDepth = std::max(0, obj.value(QStringLiteral("maxDepth")).toInt(0));
    scanPath.excludePatterns = toStringList(obj.value(QStringLiteral("exclude")));
    return scanPath;
}

QJsonObject scanPathToJson(const ScanPath& scanPath)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("path"), scanPath.path);
    obj.insert(QStringLiteral("recursive"), scanPath.recursive);
    if (scanPath.maxDepth > 0) {
        obj.insert(QStringLiteral("maxDepth"), scanPath.maxDepth);
    }
    if (!scanPath.excludePatterns.isEmpty()) {
        obj.insert(QStringLiteral("exclude"), QJsonArray::fromStringList(scanPath.excludePatterns));
    }
    return obj;
}

} // anonymous namespace

std::optional<Settings> SettingsManager::load(QString* errorOut)
{
    const QString filePath = settingsFilePath();
    if (!QFile::exists(filePath)) {
        Settings defaults;
        if (!saveToFile(defaults, filePath)) {
            // Defaults still work for this run.
            LOG_WARN(gotoCore, "Could not write default config to %s", qUtf8Printable(filePath));
        }
        return defaults;
    }
    return loadFromFile(filePath, errorOut);
}

std::optional<Settings> SettingsManager::loadFromFile(const QString& filePath, QString* errorOut)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(gotoCore, "Failed to open config file for read: %s", qUtf8Printable(filePath));
        if (errorOut) {
            *errorOut = QStringLiteral("cannot read %1").arg(filePath);
        }
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(gotoCore,
                 "Failed to parse config JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        if (errorOut) {
            *errorOut = QStringLiteral("invalid JSON in %1: %2")
                            .arg(filePath, parseError.errorString());
        }
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings)
{
    return saveToFile(settings, settingsFilePath());
}

bool SettingsManager::saveToFile(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(gotoCore, "Failed to create config directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(gotoCore, "Failed to open config file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(gotoCore, "Failed to write config file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    return configDirectory() + QStringLiteral("/config.json");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;

    QJsonArray scanPaths;
    for (const ScanPath& scanPath : settings.scanPaths) {
        scanPaths.append(scanPathToJson(scanPath));
    }
    json.insert(QStringLiteral("scanPaths"), scanPaths);
    json.insert(QStringLiteral("discoveryAssist"), settings.discoveryAssist);
    json.insert(QStringLiteral("discoveryPaths"), QJsonArray::fromStringList(settings.discoveryPaths));
    json.insert(QStringLiteral("maxDepth"), settings.maxDepth);
    json.insert(QStringLiteral("postCommand"),
                settings.postCommand.has_value()
                    ? QJsonValue(postCommandToString(*settings.postCommand))
                    : QJsonValue(QJsonValue::Null));
    json.insert(QStringLiteral("excludePatterns"), QJsonArray::fromStringList(settings.excludePatterns));
    json.insert(QStringLiteral("embeddingEnabled"), settings.embeddingEnabled);
    json.insert(QStringLiteral("embeddingTimeoutMs"), settings.embeddingTimeoutMs);
    json.insert(QStringLiteral("scanWorkers"), settings.scanWorkers);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    const QJsonArray scanPathsArray = json.value(QStringLiteral("scanPaths")).toArray();
    settings.scanPaths.reserve(static_cast<size_t>(scanPathsArray.size()));
    for (const QJsonValue& value : scanPathsArray) {
        ScanPath scanPath = scanPathFromJson(value);
        if (scanPath.path.isEmpty()) {
            LOG_WARN(gotoCore, "Ignoring scan path entry without a path");
            continue;
        }
        settings.scanPaths.push_back(std::move(scanPath));
    }

    settings.discoveryAssist = json.value(QStringLiteral("discoveryAssist"))
                                   .toBool(settings.discoveryAssist);
    settings.discoveryPaths = toStringList(json.value(QStringLiteral("discoveryPaths")));

    if (json.contains(QStringLiteral("maxDepth"))) {
        const int depth = json.value(QStringLiteral("maxDepth")).toInt(settings.maxDepth);
        if (depth > 0) {
            settings.maxDepth = depth;
        } else {
            LOG_WARN(gotoCore, "Ignoring non-positive maxDepth %d", depth);
        }
    }

    const QJsonValue postCommand = json.value(QStringLiteral("postCommand"));
    if (postCommand.isNull()) {
        settings.postCommand.reset();
    } else if (postCommand.isString()) {
        const QString name = postCommand.toString();
        if (name.trimmed().isEmpty()) {
            settings.postCommand.reset();
        } else {
            settings.postCommand = postCommandFromString(name);
            if (!settings.postCommand.has_value()) {
                LOG_WARN(gotoCore,
                         "Rejecting postCommand '%s' (allowed: %s)",
                         qUtf8Printable(name),
                         qUtf8Printable(allowedPostCommandNames().join(QStringLiteral(", "))));
            }
        }
    }

    settings.excludePatterns = toStringList(json.value(QStringLiteral("excludePatterns")));

    settings.embeddingEnabled = json.value(QStringLiteral("embeddingEnabled"))
                                    .toBool(settings.embeddingEnabled);

    if (json.contains(QStringLiteral("embeddingTimeoutMs"))) {
        settings.embeddingTimeoutMs = std::max(
            1000, json.value(QStringLiteral("embeddingTimeoutMs")).toInt(settings.embeddingTimeoutMs));
    }

    settings.scanWorkers = std::max(0, json.value(QStringLiteral("scanWorkers")).toInt(0));

    return settings;
}

} // namespace gt
