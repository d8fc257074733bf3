#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <algorithm>

namespace mm {

namespace {

constexpr int kMinPoolSize = 2;
constexpr int kMaxPoolSize = 5;
constexpr int kMinTimeoutMs = 100;

int readInt(const QJsonObject& json, const QString& key, int fallback)
{
    if (!json.contains(key)) {
        return fallback;
    }
    return json.value(key).toVariant().toInt();
}

} // namespace

std::optional<Settings> SettingsManager::load()
{
    return loadFrom(settingsFilePath());
}

std::optional<Settings> SettingsManager::loadFrom(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(mmCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(mmCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings)
{
    return saveTo(settings, settingsFilePath());
}

bool SettingsManager::saveTo(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(mmCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(mmCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(mmCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/mailmind/settings.json");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("poolSize"), settings.poolSize);
    json.insert(QStringLiteral("acquireTimeoutMs"), settings.acquireTimeoutMs);
    json.insert(QStringLiteral("itemTimeoutMs"), settings.itemTimeoutMs);
    json.insert(QStringLiteral("ollamaBaseUrl"), settings.ollamaBaseUrl);
    json.insert(QStringLiteral("primaryModel"), settings.primaryModel);
    json.insert(QStringLiteral("fallbackModel"), settings.fallbackModel);
    json.insert(QStringLiteral("temperature"), settings.temperature);
    json.insert(QStringLiteral("contextWindow"), settings.contextWindow);
    json.insert(QStringLiteral("requestTimeoutMs"), settings.requestTimeoutMs);
    json.insert(QStringLiteral("eventRetentionDays"), settings.eventRetentionDays);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);

    const int poolSize = readInt(json, QStringLiteral("poolSize"), settings.poolSize);
    if (poolSize < kMinPoolSize || poolSize > kMaxPoolSize) {
        LOG_WARN(mmCore, "poolSize %d outside [%d, %d], clamping",
                 poolSize, kMinPoolSize, kMaxPoolSize);
    }
    settings.poolSize = std::clamp(poolSize, kMinPoolSize, kMaxPoolSize);

    settings.acquireTimeoutMs = std::max(
        kMinTimeoutMs, readInt(json, QStringLiteral("acquireTimeoutMs"), settings.acquireTimeoutMs));
    settings.itemTimeoutMs = std::max(
        kMinTimeoutMs, readInt(json, QStringLiteral("itemTimeoutMs"), settings.itemTimeoutMs));
    settings.requestTimeoutMs = std::max(
        kMinTimeoutMs, readInt(json, QStringLiteral("requestTimeoutMs"), settings.requestTimeoutMs));

    settings.ollamaBaseUrl = json.value(QStringLiteral("ollamaBaseUrl")).toString(settings.ollamaBaseUrl);
    settings.primaryModel = json.value(QStringLiteral("primaryModel")).toString(settings.primaryModel);
    settings.fallbackModel = json.value(QStringLiteral("fallbackModel")).toString(settings.fallbackModel);

    settings.temperature = std::clamp(
        json.value(QStringLiteral("temperature")).toDouble(settings.temperature), 0.0, 2.0);
    settings.contextWindow = std::max(
        512, readInt(json, QStringLiteral("contextWindow"), settings.contextWindow));
    settings.eventRetentionDays = std::max(
        1, readInt(json, QStringLiteral("eventRetentionDays"), settings.eventRetentionDays));

    return settings;
}

} // namespace mm
