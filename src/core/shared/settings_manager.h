#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace gt {

// SettingsManager -- JSON save/load for the user configuration.
//
// Settings are stored as a JSON file at:
//   <configDirectory()>/config.json   (e.g. ~/.config/goto/config.json)
class SettingsManager {
public:
    // Load settings from disk. Returns defaults (and writes them back) when
    // the file doesn't exist, nullopt when it exists but cannot be parsed.
    static std::optional<Settings> load(QString* errorOut = nullptr);

    // Load from an explicit file without the write-back.
    static std::optional<Settings> loadFromFile(const QString& filePath,
                                                QString* errorOut = nullptr);

    // Save settings to disk. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const Settings& settings);
    static bool saveToFile(const Settings& settings, const QString& filePath);

    static QString settingsFilePath();

    // Convert settings to/from JSON.
    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace gt
