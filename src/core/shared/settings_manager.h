#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace rw {

// SettingsManager -- JSON save/load for daemon settings.
//
// Settings are stored as a JSON file at:
//   <GenericDataLocation>/ragwatch/settings.json
// unless RAGWATCH_SETTINGS names another file.
class SettingsManager {
public:
    // Load settings from the default file. Returns nullopt if the file
    // doesn't exist or cannot be parsed.
    static std::optional<Settings> load();
    static std::optional<Settings> load(const QString& filePath);

    // Save settings, creating the parent directory if needed.
    static bool save(const Settings& settings);
    static bool save(const Settings& settings, const QString& filePath);

    static QString settingsFilePath();
    static QString defaultStorePath();

    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace rw
