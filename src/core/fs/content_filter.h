#pragma once

#include "core/shared/types.h"

#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

namespace rw {

// ContentFilter - decides which files and directories of a watched root
// are indexed, and under which content category.
//
// Decision order:
//   1. Directory names on the built-in exclusion list (.git, node_modules,
//      ...) are never entered.
//   2. Files larger than maxFileSize are skipped.
//   3. text: MIME type text/* or a known text extension.
//   4. pdf:  MIME type application/pdf.
// A category is only returned when the folder accepts it.
class ContentFilter {
public:
    explicit ContentFilter(std::vector<ContentCategory> categories,
                           int64_t maxFileSize = 0);

    // Category the file would be indexed under, or nullopt if rejected.
    // fileSize < 0 skips the size check.
    std::optional<ContentCategory> classify(const QString& filePath,
                                            int64_t fileSize = -1) const;

    bool accepts(ContentCategory category) const;
    bool isExcludedDirectory(const QString& dirName) const;

    // True if any component of path (relative to root) is an excluded
    // directory name.
    bool isInsideExcludedDirectory(const QString& root, const QString& path) const;

    const std::vector<ContentCategory>& categories() const { return m_categories; }

    static bool isTextFile(const QString& filePath);
    static bool isPdfFile(const QString& filePath);

private:
    std::vector<ContentCategory> m_categories;
    int64_t m_maxFileSize = 0;
};

} // namespace rw
