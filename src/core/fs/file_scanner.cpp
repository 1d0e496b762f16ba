#include "core/fs/file_scanner.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFileInfo>
#include <QString>

#include <cinttypes>

namespace rw {

FileScanner::FileScanner(const ContentFilter& filter)
    : m_filter(filter)
{
}

FileScanner::ScanStats FileScanner::scanDirectory(const std::string& root,
                                                  const Visitor& visitor,
                                                  const std::atomic<bool>* cancelled) const
{
    ScanStats stats;

    const QString qRoot = QString::fromStdString(root);
    if (!QDir(qRoot).exists()) {
        LOG_WARN(rwFs, "Scan root does not exist: %s", root.c_str());
        return stats;
    }

    LOG_INFO(rwFs, "Starting directory scan: %s", root.c_str());

    stats.completed = scanRecursive(qRoot, visitor, cancelled, stats);

    LOG_INFO(rwFs, "Scan %s: %s - %" PRIu64 " files visited, %" PRIu64 " accepted, "
                   "%" PRIu64 " excluded",
             stats.completed ? "complete" : "stopped",
             root.c_str(), stats.visitedFiles, stats.acceptedFiles, stats.excludedEntries);
    return stats;
}

bool FileScanner::scanRecursive(const QString& dirPath,
                                const Visitor& visitor,
                                const std::atomic<bool>* cancelled,
                                ScanStats& stats,
                                int depth) const
{
    if (depth >= kMaxDepth) {
        LOG_WARN(rwFs, "Max scan depth (%d) reached at: %s", kMaxDepth,
                 qUtf8Printable(dirPath));
        return true;
    }

    QDir dir(dirPath);
    const QFileInfoList entries = dir.entryInfoList(
        QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden,
        QDir::Name);

    for (const QFileInfo& fi : entries) {
        if (cancelled && cancelled->load()) {
            return false;
        }

        if (fi.isDir()) {
            // Symlinked directories can form cycles.
            if (fi.isSymLink() || m_filter.isExcludedDirectory(fi.fileName())) {
                ++stats.excludedEntries;
                continue;
            }
            if (!scanRecursive(fi.absoluteFilePath(), visitor, cancelled, stats, depth + 1)) {
                return false;
            }
            continue;
        }

        ++stats.visitedFiles;
        if (!m_filter.classify(fi.absoluteFilePath(), fi.size()).has_value()) {
            ++stats.excludedEntries;
            continue;
        }

        ++stats.acceptedFiles;
        if (!visitor(fi.absoluteFilePath().toStdString())) {
            return false;
        }
    }
    return true;
}

} // namespace rw
