#include "core/extraction/extraction_manager.h"
#include "core/extraction/pdf_extractor.h"
#include "core/extraction/pdftotext_extractor.h"
#include "core/extraction/text_cleaner.h"
#include "core/extraction/text_extractor.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QFileInfo>

namespace rw {

QString extractionStatusToString(ExtractionResult::Status status)
{
    switch (status) {
    case ExtractionResult::Status::Success:           return QStringLiteral("success");
    case ExtractionResult::Status::Timeout:           return QStringLiteral("timeout");
    case ExtractionResult::Status::CorruptedFile:     return QStringLiteral("corrupted");
    case ExtractionResult::Status::UnsupportedFormat: return QStringLiteral("unsupported");
    case ExtractionResult::Status::SizeExceeded:      return QStringLiteral("size_exceeded");
    case ExtractionResult::Status::Inaccessible:      return QStringLiteral("inaccessible");
    case ExtractionResult::Status::Busy:              return QStringLiteral("busy");
    case ExtractionResult::Status::Unknown:           return QStringLiteral("unknown");
    }
    return QStringLiteral("unknown");
}

// ── Construction / destruction ──────────────────────────────

ExtractionManager::ExtractionManager(const ExtractionConfig& config)
    : m_config(config)
    , m_concurrencySemaphore(config.maxConcurrent > 0 ? config.maxConcurrent : 1)
{
    std::vector<std::unique_ptr<FileExtractor>> text;
    text.push_back(std::make_unique<TextExtractor>(m_config.textFallbackEncoding));
    m_backends[ContentCategory::Text] = std::move(text);

    std::vector<std::unique_ptr<FileExtractor>> pdf;
    pdf.push_back(std::make_unique<PdfExtractor>());
    pdf.push_back(std::make_unique<PdftotextExtractor>(m_config.timeoutMs));
    m_backends[ContentCategory::Pdf] = std::move(pdf);

    LOG_INFO(rwExtraction, "ExtractionManager initialised (concurrency=%d, timeout=%d ms, maxSize=%lld)",
             m_config.maxConcurrent, m_config.timeoutMs,
             static_cast<long long>(m_config.maxFileSize));
}

ExtractionManager::~ExtractionManager() = default;

void ExtractionManager::setBackends(ContentCategory category,
                                    std::vector<std::unique_ptr<FileExtractor>> backends)
{
    m_backends[category] = std::move(backends);
}

size_t ExtractionManager::backendCount(ContentCategory category) const
{
    auto it = m_backends.find(category);
    return it == m_backends.end() ? 0 : it->second.size();
}

// ── Main extraction entry point ─────────────────────────────

ExtractionResult ExtractionManager::extract(const QString& filePath, ContentCategory category)
{
    ExtractionResult result;

    auto chainIt = m_backends.find(category);
    if (chainIt == m_backends.end() || chainIt->second.empty()) {
        result.status = ExtractionResult::Status::UnsupportedFormat;
        result.errorMessage = QString("No extractor for category '%1'")
                                  .arg(contentCategoryToString(category));
        return result;
    }

    // Pre-flight checks shared by every backend
    {
        QFileInfo info(filePath);
        if (!info.exists() || !info.isFile()) {
            result.status = ExtractionResult::Status::Inaccessible;
            result.errorMessage = QStringLiteral("File does not exist or is not a regular file");
            return result;
        }

        if (m_config.maxFileSize > 0 && info.size() > m_config.maxFileSize) {
            result.status = ExtractionResult::Status::SizeExceeded;
            result.errorMessage = QString("File size %1 exceeds configured limit %2")
                                      .arg(info.size())
                                      .arg(m_config.maxFileSize);
            LOG_INFO(rwExtraction, "Skipping oversized file: %s (%lld bytes, limit %lld)",
                     qUtf8Printable(filePath),
                     static_cast<long long>(info.size()),
                     static_cast<long long>(m_config.maxFileSize));
            return result;
        }
    }

    if (!m_concurrencySemaphore.tryAcquire(1, m_config.timeoutMs)) {
        result.status = ExtractionResult::Status::Busy;
        result.errorMessage = QStringLiteral("Timed out waiting for extraction slot");
        LOG_WARN(rwExtraction, "Extraction slot timeout for: %s", qUtf8Printable(filePath));
        return result;
    }

    QSemaphore* heavySemaphore = category == ContentCategory::Pdf ? &m_pdfSemaphore : nullptr;
    if (heavySemaphore && !heavySemaphore->tryAcquire(1, m_config.timeoutMs)) {
        m_concurrencySemaphore.release();
        result.status = ExtractionResult::Status::Busy;
        result.errorMessage = QStringLiteral("Timed out waiting for PDF extraction slot");
        LOG_WARN(rwExtraction, "PDF slot timeout for: %s", qUtf8Printable(filePath));
        return result;
    }

    QElapsedTimer timer;
    timer.start();

    QStringList failures;
    for (const std::unique_ptr<FileExtractor>& backend : chainIt->second) {
        result = backend->extract(filePath);
        if (result.ok()) {
            break;
        }
        const QString reason = result.errorMessage.value_or(extractionStatusToString(result.status));
        failures.append(QStringLiteral("%1: %2").arg(backend->name(), reason));
        LOG_WARN(rwExtraction, "Extractor '%s' failed for %s (%s)",
                 qUtf8Printable(backend->name()), qUtf8Printable(filePath),
                 qUtf8Printable(reason));
    }

    if (heavySemaphore) {
        heavySemaphore->release();
    }
    m_concurrencySemaphore.release();

    result.durationMs = static_cast<int>(timer.elapsed());

    if (!result.ok()) {
        result.content.reset();
        result.errorMessage = QStringLiteral("All extractors failed: %1")
                                  .arg(failures.join(QStringLiteral("; ")));
        return result;
    }

    result.content = TextCleaner::clean(result.content.value_or(QString()));
    LOG_DEBUG(rwExtraction, "Extraction succeeded via %s: %s (%d ms, %lld chars)",
              qUtf8Printable(result.backend), qUtf8Printable(filePath), result.durationMs,
              static_cast<long long>(result.content->size()));
    return result;
}

} // namespace rw
