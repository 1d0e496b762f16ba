#include "core/shared/types.h"

namespace rw {

QString contentCategoryToString(ContentCategory category)
{
    switch (category) {
    case ContentCategory::Text: return QStringLiteral("text");
    case ContentCategory::Pdf:  return QStringLiteral("pdf");
    }
    return QStringLiteral("text");
}

std::optional<ContentCategory> contentCategoryFromString(const QString& str)
{
    const QString normalized = str.trimmed().toLower();
    if (normalized == QLatin1String("text")) return ContentCategory::Text;
    if (normalized == QLatin1String("pdf"))  return ContentCategory::Pdf;
    return std::nullopt;
}

QStringList contentCategoriesToStrings(const std::vector<ContentCategory>& categories)
{
    QStringList out;
    out.reserve(static_cast<qsizetype>(categories.size()));
    for (ContentCategory category : categories) {
        out.append(contentCategoryToString(category));
    }
    return out;
}

QString folderStatusToString(FolderStatus status)
{
    switch (status) {
    case FolderStatus::Initializing:     return QStringLiteral("initializing");
    case FolderStatus::ScanningExisting: return QStringLiteral("scanning");
    case FolderStatus::Watching:         return QStringLiteral("watching");
    case FolderStatus::Paused:           return QStringLiteral("paused");
    case FolderStatus::Error:            return QStringLiteral("error");
    case FolderStatus::Removed:          return QStringLiteral("removed");
    }
    return QStringLiteral("error");
}

FolderStatus folderStatusFromString(const QString& str)
{
    if (str == QLatin1String("initializing")) return FolderStatus::Initializing;
    if (str == QLatin1String("scanning"))     return FolderStatus::ScanningExisting;
    if (str == QLatin1String("watching"))     return FolderStatus::Watching;
    if (str == QLatin1String("paused"))       return FolderStatus::Paused;
    if (str == QLatin1String("removed"))      return FolderStatus::Removed;
    return FolderStatus::Error;
}

QString countTypeToString(CountType type)
{
    return type == CountType::Chunks ? QStringLiteral("chunks") : QStringLiteral("files");
}

QString settledEventKindToString(SettledEvent::Kind kind)
{
    switch (kind) {
    case SettledEvent::Kind::Changed: return QStringLiteral("changed");
    case SettledEvent::Kind::Removed: return QStringLiteral("removed");
    case SettledEvent::Kind::Moved:   return QStringLiteral("moved");
    }
    return QStringLiteral("changed");
}

} // namespace rw
