#pragma once

#include "core/fs/content_filter.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace rw {

// FileScanner - recursive directory walker for the initial scan.
//
// Walks a directory tree with QDir, prunes excluded directories before
// entering them, skips symlinked directories, and hands every file the
// ContentFilter accepts to the visitor. The visitor may block (the walk
// then suspends) and returns false to stop the walk.
class FileScanner {
public:
    struct ScanStats {
        uint64_t visitedFiles = 0;
        uint64_t acceptedFiles = 0;
        uint64_t excludedEntries = 0;
        bool completed = false;
    };

    using Visitor = std::function<bool(const std::string& filePath)>;

    explicit FileScanner(const ContentFilter& filter);

    // Walk root. `cancelled` is polled between entries.
    ScanStats scanDirectory(const std::string& root,
                            const Visitor& visitor,
                            const std::atomic<bool>* cancelled = nullptr) const;

private:
    // Returns false when the walk must stop.
    bool scanRecursive(const QString& dirPath,
                       const Visitor& visitor,
                       const std::atomic<bool>* cancelled,
                       ScanStats& stats,
                       int depth = 0) const;

    static constexpr int kMaxDepth = 64;

    const ContentFilter& m_filter;
};

} // namespace rw
