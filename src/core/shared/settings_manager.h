#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace mm {

// SettingsManager -- JSON save/load for core settings.
//
// Settings are stored as a JSON file at:
//   <GenericDataLocation>/mailmind/settings.json
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if file doesn't exist
    // or cannot be parsed.
    static std::optional<Settings> load();
    static std::optional<Settings> loadFrom(const QString& filePath);

    // Save settings to disk. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const Settings& settings);
    static bool saveTo(const Settings& settings, const QString& filePath);

    // Returns the default file path for the settings file.
    static QString settingsFilePath();

    // Convert settings to/from JSON. fromJson clamps out-of-range values.
    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace mm
