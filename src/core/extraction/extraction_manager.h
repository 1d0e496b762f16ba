#pragma once

#include "core/extraction/extractor.h"
#include "core/shared/types.h"

#include <QByteArray>
#include <QSemaphore>

#include <map>
#include <memory>
#include <vector>

namespace rw {

struct ExtractionConfig {
    int64_t maxFileSize = 100LL * 1024 * 1024;
    int timeoutMs = 30000;
    int maxConcurrent = 4;
    QByteArray textFallbackEncoding = QByteArrayLiteral("ISO-8859-1");
};

// ExtractionManager - the gateway that gets normalized text out of a file.
//
// Holds an ordered list of backends per content category:
//   text: TextExtractor
//   pdf:  PdfExtractor (Poppler), then PdftotextExtractor
// Each backend failure is logged and the next backend is tried; the call
// fails only when every backend has failed. Successful output is passed
// through TextCleaner.
//
// Thread safety: multiple worker threads may call extract() concurrently.
// A semaphore bounds in-flight extractions; PDFs additionally go through
// a single-slot semaphore. A call that cannot get a slot within timeoutMs
// returns Status::Busy without touching the file.
class ExtractionManager {
public:
    explicit ExtractionManager(const ExtractionConfig& config = {});
    ~ExtractionManager();

    // Non-copyable, non-movable (owns semaphore state)
    ExtractionManager(const ExtractionManager&) = delete;
    ExtractionManager& operator=(const ExtractionManager&) = delete;
    ExtractionManager(ExtractionManager&&) = delete;
    ExtractionManager& operator=(ExtractionManager&&) = delete;

    ExtractionResult extract(const QString& filePath, ContentCategory category);

    // Replaces the backend chain of a category.
    void setBackends(ContentCategory category,
                     std::vector<std::unique_ptr<FileExtractor>> backends);
    size_t backendCount(ContentCategory category) const;

    const ExtractionConfig& config() const { return m_config; }

private:
    ExtractionConfig m_config;
    std::map<ContentCategory, std::vector<std::unique_ptr<FileExtractor>>> m_backends;

    QSemaphore m_concurrencySemaphore;
    QSemaphore m_pdfSemaphore{1};
};

} // namespace rw
