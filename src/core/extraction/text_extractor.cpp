#include "core/extraction/text_extractor.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QStringConverter>

namespace rw {

TextExtractor::TextExtractor(QByteArray fallbackEncoding)
    : m_fallbackEncoding(std::move(fallbackEncoding))
{
}

ExtractionResult TextExtractor::extract(const QString& filePath)
{
    QElapsedTimer timer;
    timer.start();

    ExtractionResult result;
    result.backend = name();

    QFileInfo info(filePath);
    if (!info.exists() || !info.isFile()) {
        result.status = ExtractionResult::Status::Inaccessible;
        result.errorMessage = QStringLiteral("File does not exist or is not a regular file");
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        result.status = ExtractionResult::Status::Inaccessible;
        result.errorMessage = QString("Failed to open file: %1").arg(file.errorString());
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    }

    const QByteArray rawBytes = file.readAll();
    file.close();

    if (rawBytes.isEmpty()) {
        // An empty file extracts to empty content
        result.status = ExtractionResult::Status::Success;
        result.content = QString();
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    }

    if (rawBytes.contains('\0')) {
        result.status = ExtractionResult::Status::UnsupportedFormat;
        result.errorMessage = QStringLiteral("File contains NUL bytes (binary payload)");
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    }

    QString decoded;
    {
        auto toUtf8 = QStringDecoder(QStringDecoder::Utf8, QStringDecoder::Flag::Stateless);
        decoded = toUtf8(rawBytes);

        if (toUtf8.hasError()) {
            QStringDecoder fallback(m_fallbackEncoding.constData(),
                                    QStringDecoder::Flag::Stateless);
            if (!fallback.isValid()) {
                result.status = ExtractionResult::Status::UnsupportedFormat;
                result.errorMessage = QString("Not UTF-8 and fallback encoding '%1' is unavailable")
                                          .arg(QString::fromLatin1(m_fallbackEncoding));
                result.durationMs = static_cast<int>(timer.elapsed());
                return result;
            }
            decoded = fallback(rawBytes);
            if (fallback.hasError()) {
                result.status = ExtractionResult::Status::UnsupportedFormat;
                result.errorMessage = QString("Undecodable as UTF-8 or %1")
                                          .arg(QString::fromLatin1(m_fallbackEncoding));
                result.durationMs = static_cast<int>(timer.elapsed());
                return result;
            }
            LOG_DEBUG(rwExtraction, "UTF-8 decode failed for %s, using %s fallback",
                      qUtf8Printable(filePath), m_fallbackEncoding.constData());
        }
    }

    result.status = ExtractionResult::Status::Success;
    result.content = std::move(decoded);
    result.durationMs = static_cast<int>(timer.elapsed());

    LOG_DEBUG(rwExtraction, "Extracted %lld chars from %s in %d ms",
              static_cast<long long>(result.content->size()),
              qUtf8Printable(filePath),
              result.durationMs);

    return result;
}

} // namespace rw
