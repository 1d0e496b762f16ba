#include "core/fs/content_filter.h"

#include <QFileInfo>
#include <QMimeDatabase>
#include <QSet>

#include <algorithm>

namespace rw {

namespace {

const QSet<QString>& textExtensions()
{
    static const QSet<QString> kExtensions = {
        // Programming languages
        QStringLiteral("c"), QStringLiteral("cpp"), QStringLiteral("cs"),
        QStringLiteral("csproj"), QStringLiteral("go"), QStringLiteral("h"),
        QStringLiteral("hpp"), QStringLiteral("java"), QStringLiteral("js"),
        QStringLiteral("php"), QStringLiteral("py"), QStringLiteral("rb"),
        QStringLiteral("rs"), QStringLiteral("sln"), QStringLiteral("ts"),
        // Scripts and configs
        QStringLiteral("bat"), QStringLiteral("cfg"), QStringLiteral("ini"),
        QStringLiteral("sh"), QStringLiteral("toml"), QStringLiteral("yaml"),
        QStringLiteral("yml"),
        // Markup and web
        QStringLiteral("txt"), QStringLiteral("css"), QStringLiteral("html"),
        QStringLiteral("ipynb"), QStringLiteral("json"), QStringLiteral("log"),
        QStringLiteral("md"), QStringLiteral("xml"),
    };
    return kExtensions;
}

const QSet<QString>& excludedDirectoryNames()
{
    static const QSet<QString> kNames = {
        QStringLiteral(".git"),
        QStringLiteral(".hg"),
        QStringLiteral(".svn"),
        QStringLiteral("node_modules"),
        QStringLiteral("__pycache__"),
        QStringLiteral(".venv"),
        QStringLiteral(".mypy_cache"),
        QStringLiteral(".pytest_cache"),
    };
    return kNames;
}

QString mimeNameFor(const QString& filePath)
{
    // Extension-based lookup, no content sniffing.
    static const QMimeDatabase db;
    return db.mimeTypeForFile(filePath, QMimeDatabase::MatchExtension).name();
}

} // namespace

ContentFilter::ContentFilter(std::vector<ContentCategory> categories, int64_t maxFileSize)
    : m_categories(std::move(categories))
    , m_maxFileSize(maxFileSize)
{
    if (m_categories.empty()) {
        m_categories.push_back(ContentCategory::Text);
    }
}

std::optional<ContentCategory> ContentFilter::classify(const QString& filePath,
                                                       int64_t fileSize) const
{
    if (m_maxFileSize > 0 && fileSize > m_maxFileSize) {
        return std::nullopt;
    }
    if (accepts(ContentCategory::Pdf) && isPdfFile(filePath)) {
        return ContentCategory::Pdf;
    }
    if (accepts(ContentCategory::Text) && isTextFile(filePath)) {
        return ContentCategory::Text;
    }
    return std::nullopt;
}

bool ContentFilter::accepts(ContentCategory category) const
{
    return std::find(m_categories.begin(), m_categories.end(), category) != m_categories.end();
}

bool ContentFilter::isExcludedDirectory(const QString& dirName) const
{
    return excludedDirectoryNames().contains(dirName);
}

bool ContentFilter::isInsideExcludedDirectory(const QString& root, const QString& path) const
{
    if (!path.startsWith(root)) {
        return false;
    }
    const QStringList parts = path.mid(root.size()).split(QLatin1Char('/'), Qt::SkipEmptyParts);
    // The last component is the entry itself.
    for (int i = 0; i + 1 < parts.size(); ++i) {
        if (isExcludedDirectory(parts.at(i))) {
            return true;
        }
    }
    return false;
}

bool ContentFilter::isTextFile(const QString& filePath)
{
    if (mimeNameFor(filePath).startsWith(QLatin1String("text/"))) {
        return true;
    }
    return textExtensions().contains(QFileInfo(filePath).suffix().toLower());
}

bool ContentFilter::isPdfFile(const QString& filePath)
{
    return mimeNameFor(filePath) == QLatin1String("application/pdf");
}

} // namespace rw
