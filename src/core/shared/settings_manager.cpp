#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <algorithm>

namespace rw {

namespace {

int readInt(const QJsonObject& json, const char* key, int fallback, int minValue)
{
    const QString name = QString::fromLatin1(key);
    if (!json.contains(name)) {
        return fallback;
    }
    return std::max(json.value(name).toInt(fallback), minValue);
}

double readDouble(const QJsonObject& json, const char* key, double fallback)
{
    return json.value(QString::fromLatin1(key)).toDouble(fallback);
}

QString readString(const QJsonObject& json, const char* key, const QString& fallback)
{
    return json.value(QString::fromLatin1(key)).toString(fallback);
}

} // namespace

std::optional<Settings> SettingsManager::load()
{
    return load(settingsFilePath());
}

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(rwCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(rwCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings)
{
    return save(settings, settingsFilePath());
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QString parentDir = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(rwCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(rwCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(rwCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString overridePath = qEnvironmentVariable("RAGWATCH_SETTINGS");
    if (!overridePath.isEmpty()) {
        return QDir::cleanPath(overridePath);
    }
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/ragwatch/settings.json");
}

QString SettingsManager::defaultStorePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/ragwatch/index.db");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("storePath"), settings.storePath);
    json.insert(QStringLiteral("collectionPrefix"), settings.collectionPrefix);
    json.insert(QStringLiteral("chunkSizeWords"), settings.chunkSizeWords);
    json.insert(QStringLiteral("chunkOverlapRatio"), settings.chunkOverlapRatio);
    json.insert(QStringLiteral("minContentChars"), settings.minContentChars);
    json.insert(QStringLiteral("previewChars"), settings.previewChars);
    json.insert(QStringLiteral("debounceMs"), settings.debounceMs);
    json.insert(QStringLiteral("workerCount"), settings.workerCount);
    json.insert(QStringLiteral("queueDepth"), settings.queueDepth);
    json.insert(QStringLiteral("retryBaseDelayMs"), settings.retryBaseDelayMs);
    json.insert(QStringLiteral("retryMaxDelayMs"), settings.retryMaxDelayMs);
    json.insert(QStringLiteral("retryMaxAttempts"), settings.retryMaxAttempts);
    json.insert(QStringLiteral("errorSweepIntervalMs"), settings.errorSweepIntervalMs);
    json.insert(QStringLiteral("persistIntervalMs"), settings.persistIntervalMs);
    json.insert(QStringLiteral("maxFileSize"), static_cast<qint64>(settings.maxFileSize));
    json.insert(QStringLiteral("extractionTimeoutMs"), static_cast<int>(settings.extractionTimeoutMs));
    json.insert(QStringLiteral("textFallbackEncoding"), settings.textFallbackEncoding);
    json.insert(QStringLiteral("vectorDimensions"), settings.vectorDimensions);
    json.insert(QStringLiteral("embeddingModelPath"), settings.embeddingModelPath);
    json.insert(QStringLiteral("embeddingVocabPath"), settings.embeddingVocabPath);
    json.insert(QStringLiteral("passagePrefix"), settings.passagePrefix);
    json.insert(QStringLiteral("queryPrefix"), settings.queryPrefix);
    json.insert(QStringLiteral("rerankerModelPath"), settings.rerankerModelPath);
    json.insert(QStringLiteral("rerankerVocabPath"), settings.rerankerVocabPath);
    json.insert(QStringLiteral("searchScoreThreshold"), settings.searchScoreThreshold);
    json.insert(QStringLiteral("rerankScoreThreshold"), settings.rerankScoreThreshold);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.storePath = readString(json, "storePath", settings.storePath);
    settings.collectionPrefix = readString(json, "collectionPrefix", settings.collectionPrefix);

    settings.chunkSizeWords = readInt(json, "chunkSizeWords", settings.chunkSizeWords, 1);
    settings.chunkOverlapRatio = std::clamp(
        readDouble(json, "chunkOverlapRatio", settings.chunkOverlapRatio), 0.0, 0.95);
    settings.minContentChars = readInt(json, "minContentChars", settings.minContentChars, 0);
    settings.previewChars = readInt(json, "previewChars", settings.previewChars, 0);

    settings.debounceMs = readInt(json, "debounceMs", settings.debounceMs, 0);
    settings.workerCount = readInt(json, "workerCount", settings.workerCount, 1);
    settings.queueDepth = readInt(json, "queueDepth", settings.queueDepth, 1);

    settings.retryBaseDelayMs = readInt(json, "retryBaseDelayMs", settings.retryBaseDelayMs, 0);
    settings.retryMaxDelayMs = readInt(json, "retryMaxDelayMs", settings.retryMaxDelayMs, 0);
    settings.retryMaxAttempts = readInt(json, "retryMaxAttempts", settings.retryMaxAttempts, 0);
    settings.errorSweepIntervalMs =
        readInt(json, "errorSweepIntervalMs", settings.errorSweepIntervalMs, 100);
    settings.persistIntervalMs = readInt(json, "persistIntervalMs", settings.persistIntervalMs, 0);

    if (json.contains(QStringLiteral("maxFileSize"))) {
        settings.maxFileSize = static_cast<int64_t>(
            json.value(QStringLiteral("maxFileSize")).toVariant().toLongLong());
    }
    if (json.contains(QStringLiteral("extractionTimeoutMs"))) {
        settings.extractionTimeoutMs = json.value(QStringLiteral("extractionTimeoutMs"))
                                           .toVariant()
                                           .toUInt();
    }
    settings.textFallbackEncoding =
        readString(json, "textFallbackEncoding", settings.textFallbackEncoding);

    settings.vectorDimensions = readInt(json, "vectorDimensions", settings.vectorDimensions, 1);
    settings.embeddingModelPath = readString(json, "embeddingModelPath", settings.embeddingModelPath);
    settings.embeddingVocabPath = readString(json, "embeddingVocabPath", settings.embeddingVocabPath);
    settings.passagePrefix = readString(json, "passagePrefix", settings.passagePrefix);
    settings.queryPrefix = readString(json, "queryPrefix", settings.queryPrefix);
    settings.rerankerModelPath = readString(json, "rerankerModelPath", settings.rerankerModelPath);
    settings.rerankerVocabPath = readString(json, "rerankerVocabPath", settings.rerankerVocabPath);

    settings.searchScoreThreshold =
        readDouble(json, "searchScoreThreshold", settings.searchScoreThreshold);
    settings.rerankScoreThreshold =
        readDouble(json, "rerankScoreThreshold", settings.rerankScoreThreshold);

    return settings;
}

} // namespace rw
