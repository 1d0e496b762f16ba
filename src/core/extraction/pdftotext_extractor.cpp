#include "core/extraction/pdftotext_extractor.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QProcess>

namespace rw {

PdftotextExtractor::PdftotextExtractor(int timeoutMs, QString program)
    : m_timeoutMs(timeoutMs)
    , m_program(std::move(program))
{
}

ExtractionResult PdftotextExtractor::extract(const QString& filePath)
{
    QElapsedTimer timer;
    timer.start();

    ExtractionResult result;
    result.backend = name();

    const QStringList args = {
        QStringLiteral("-q"),
        QStringLiteral("-enc"), QStringLiteral("UTF-8"),
        filePath,
        QStringLiteral("-"),
    };

    QProcess process;
    process.start(m_program, args);

    if (!process.waitForStarted(m_timeoutMs)) {
        result.status = ExtractionResult::Status::UnsupportedFormat;
        result.errorMessage = QStringLiteral("Failed to start process: %1").arg(m_program);
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    }

    if (!process.waitForFinished(m_timeoutMs)) {
        process.kill();
        process.waitForFinished();
        result.status = ExtractionResult::Status::Timeout;
        result.errorMessage = QStringLiteral("%1 timed out after %2 ms").arg(m_program).arg(m_timeoutMs);
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        const QString stderrText = QString::fromUtf8(process.readAllStandardError()).trimmed();
        result.status = ExtractionResult::Status::CorruptedFile;
        result.errorMessage = stderrText.isEmpty()
                                  ? QStringLiteral("Process failed: %1").arg(m_program)
                                  : QStringLiteral("%1 failed: %2").arg(m_program, stderrText.left(300));
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    }

    result.status = ExtractionResult::Status::Success;
    result.content = QString::fromUtf8(process.readAllStandardOutput());
    result.durationMs = static_cast<int>(timer.elapsed());
    LOG_DEBUG(rwExtraction, "pdftotext extracted %lld chars from %s",
              static_cast<long long>(result.content->size()), qUtf8Printable(filePath));
    return result;
}

} // namespace rw
