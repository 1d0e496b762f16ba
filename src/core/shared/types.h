#pragma once

#include <QString>
#include <QStringList>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rw {

// Content categories a watched folder accepts.
enum class ContentCategory {
    Text,
    Pdf,
};

QString contentCategoryToString(ContentCategory category);
std::optional<ContentCategory> contentCategoryFromString(const QString& str);
QStringList contentCategoriesToStrings(const std::vector<ContentCategory>& categories);

// Folder lifecycle:
//   Initializing -> ScanningExisting -> Watching <-> {Paused, Error} -> Removed
enum class FolderStatus {
    Initializing,
    ScanningExisting,
    Watching,
    Paused,
    Error,
    Removed,
};

QString folderStatusToString(FolderStatus status);
FolderStatus folderStatusFromString(const QString& str);

// What totalFiles/processedFiles count. A folder restored clean reports
// its stored fragment count instead of a file count.
enum class CountType {
    Files,
    Chunks,
};

QString countTypeToString(CountType type);

// Raw notification as delivered by a FileMonitor, before debouncing.
struct RawFsEvent {
    enum class Kind {
        Created,
        Modified,
        MovedFrom,
        MovedTo,
        Deleted,
    };

    Kind kind = Kind::Modified;
    std::string path;
    uint32_t cookie = 0;        // pairs MovedFrom with MovedTo, 0 if unknown
    bool isDirectory = false;
};

// Logical change emitted by the EventDebouncer once a path settles.
struct SettledEvent {
    enum class Kind {
        Changed,
        Removed,
        Moved,
    };

    Kind kind = Kind::Changed;
    std::string path;           // new path for Moved
    std::string oldPath;        // Moved only
    bool isDirectory = false;
};

QString settledEventKindToString(SettledEvent::Kind kind);

// Persistent description of one watched root.
struct WatchedFolder {
    QString id;
    QString rootPath;
    std::vector<ContentCategory> categories;
    QString collection;
    FolderStatus status = FolderStatus::Initializing;
    int progressPercent = 0;
    int64_t createdAtMs = 0;
};

// Status surface returned by WatcherOrchestrator::watchedFolders().
struct FolderSnapshot {
    QString id;
    QString path;
    QString collection;
    std::vector<ContentCategory> categories;
    FolderStatus status = FolderStatus::Initializing;
    int progressPercent = 0;
    uint64_t totalFiles = 0;
    uint64_t processedFiles = 0;
    CountType countType = CountType::Files;
    int errorCount = 0;
    int64_t createdAtMs = 0;
};

} // namespace rw
