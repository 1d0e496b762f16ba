#include "core/extraction/pdf_extractor.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QFileInfo>

#include <poppler-document.h>
#include <poppler-page.h>

#include <algorithm>
#include <memory>

namespace rw {

namespace {

constexpr int kMaxPages = 1000;
constexpr int64_t kMaxExtractedTextBytes = 10LL * 1024 * 1024;

} // namespace

ExtractionResult PdfExtractor::extract(const QString& filePath)
{
    QElapsedTimer timer;
    timer.start();

    ExtractionResult result;
    result.backend = name();

    QFileInfo info(filePath);
    if (!info.exists() || !info.isFile() || !info.isReadable()) {
        result.status = ExtractionResult::Status::Inaccessible;
        result.errorMessage = QStringLiteral("File does not exist or is not readable");
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    }

    std::unique_ptr<poppler::document> doc(
        poppler::document::load_from_file(filePath.toStdString()));
    if (!doc) {
        result.status = ExtractionResult::Status::CorruptedFile;
        result.errorMessage = QStringLiteral("Failed to load PDF document");
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    }

    if (doc->is_locked()) {
        result.status = ExtractionResult::Status::CorruptedFile;
        result.errorMessage = QStringLiteral("PDF is encrypted or password-protected");
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    }

    const int pageCount = doc->pages();
    const int pagesToProcess = std::min(pageCount, kMaxPages);
    if (pageCount > kMaxPages) {
        LOG_INFO(rwExtraction, "PDF has %d pages, capping at %d: %s",
                 pageCount, kMaxPages, qUtf8Printable(filePath));
    }

    QString fullText;
    fullText.reserve(4096);
    int64_t extractedBytes = 0;

    for (int i = 0; i < pagesToProcess; ++i) {
        std::unique_ptr<poppler::page> page(doc->create_page(i));
        if (!page) {
            LOG_DEBUG(rwExtraction, "Null page %d in %s", i, qUtf8Printable(filePath));
            continue;
        }

        const poppler::byte_array utf8Page = page->text().to_utf8();
        if (utf8Page.empty()) {
            continue;
        }
        if (!fullText.isEmpty()) {
            fullText += QLatin1Char('\n');
        }
        fullText += QString::fromUtf8(utf8Page.data(), static_cast<int>(utf8Page.size()));

        extractedBytes += static_cast<int64_t>(utf8Page.size());
        if (extractedBytes > kMaxExtractedTextBytes) {
            LOG_INFO(rwExtraction, "Extracted text exceeded %lld bytes at page %d: %s",
                     static_cast<long long>(kMaxExtractedTextBytes), i + 1,
                     qUtf8Printable(filePath));
            break;
        }
    }

    if (fullText.trimmed().isEmpty() && pageCount > 0) {
        // Scanned documents have pages but no text layer; let the next
        // backend try.
        result.status = ExtractionResult::Status::UnsupportedFormat;
        result.errorMessage = QStringLiteral("PDF has no extractable text layer");
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    }

    result.status = ExtractionResult::Status::Success;
    result.content = std::move(fullText);
    result.durationMs = static_cast<int>(timer.elapsed());

    LOG_DEBUG(rwExtraction, "Extracted %d pages from PDF %s in %d ms",
              pagesToProcess, qUtf8Printable(filePath), result.durationMs);
    return result;
}

} // namespace rw
