#include "core/indexing/persisted_state.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

namespace rw {

namespace {

QJsonObject folderToJson(const PersistedFolder& entry)
{
    const WatchedFolder& folder = entry.folder;
    QJsonObject json;
    json[QStringLiteral("id")] = folder.id;
    json[QStringLiteral("path")] = folder.rootPath;
    json[QStringLiteral("collection")] = folder.collection;
    json[QStringLiteral("categories")] =
        QJsonArray::fromStringList(contentCategoriesToStrings(folder.categories));
    json[QStringLiteral("status")] = folderStatusToString(folder.status);
    json[QStringLiteral("progress")] = folder.progressPercent;
    json[QStringLiteral("createdAt")] = static_cast<qint64>(folder.createdAtMs);
    json[QStringLiteral("clean")] = entry.clean;
    return json;
}

std::optional<PersistedFolder> folderFromJson(const QJsonObject& json, QString* error)
{
    PersistedFolder entry;
    WatchedFolder& folder = entry.folder;
    folder.id = json.value(QStringLiteral("id")).toString();
    folder.rootPath = json.value(QStringLiteral("path")).toString();
    folder.collection = json.value(QStringLiteral("collection")).toString();
    if (folder.id.isEmpty() || folder.rootPath.isEmpty() || folder.collection.isEmpty()) {
        if (error) {
            *error = QStringLiteral("folder entry without id, path or collection");
        }
        return std::nullopt;
    }

    const QJsonArray categories = json.value(QStringLiteral("categories")).toArray();
    for (const QJsonValue& value : categories) {
        const auto category = contentCategoryFromString(value.toString());
        if (!category.has_value()) {
            if (error) {
                *error = QStringLiteral("unknown content category '%1'").arg(value.toString());
            }
            return std::nullopt;
        }
        folder.categories.push_back(category.value());
    }
    if (folder.categories.empty()) {
        folder.categories.push_back(ContentCategory::Text);
    }

    folder.status = folderStatusFromString(json.value(QStringLiteral("status")).toString());
    folder.progressPercent = json.value(QStringLiteral("progress")).toInt();
    folder.createdAtMs = static_cast<int64_t>(
        json.value(QStringLiteral("createdAt")).toVariant().toLongLong());
    entry.clean = json.value(QStringLiteral("clean")).toBool(false);
    return entry;
}

} // namespace

QByteArray PersistedState::serialize() const
{
    QJsonArray array;
    for (const PersistedFolder& entry : folders) {
        array.append(folderToJson(entry));
    }

    QJsonObject root;
    root[QStringLiteral("version")] = kSchemaVersion;
    root[QStringLiteral("folders")] = array;
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

std::optional<PersistedState> PersistedState::deserialize(const QByteArray& data, QString* error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) {
            *error = QStringLiteral("invalid persisted state: %1").arg(parseError.errorString());
        }
        return std::nullopt;
    }

    const QJsonObject root = doc.object();
    const int version = root.value(QStringLiteral("version")).toInt(-1);
    if (version != kSchemaVersion) {
        if (error) {
            *error = QStringLiteral("unsupported persisted state version %1").arg(version);
        }
        return std::nullopt;
    }

    PersistedState state;
    const QJsonArray array = root.value(QStringLiteral("folders")).toArray();
    for (const QJsonValue& value : array) {
        auto entry = folderFromJson(value.toObject(), error);
        if (!entry.has_value()) {
            return std::nullopt;
        }
        state.folders.push_back(std::move(entry.value()));
    }
    return state;
}

} // namespace rw
