#pragma once

#include <QString>
#include <optional>

namespace rw {

// Result of a content extraction attempt.
// Every extraction produces a status; content is present only on Success.
struct ExtractionResult {
    enum class Status {
        Success,
        Timeout,
        CorruptedFile,
        UnsupportedFormat,
        SizeExceeded,
        Inaccessible,
        Busy,               // no extraction slot freed up in time
        Unknown,
    };

    Status status = Status::Unknown;
    std::optional<QString> content;
    std::optional<QString> errorMessage;
    QString backend;            // extractor that produced the result
    int durationMs = 0;

    bool ok() const { return status == Status::Success; }
};

QString extractionStatusToString(ExtractionResult::Status status);

// FileExtractor - one way of getting text out of a file.
//
// The ExtractionManager holds an ordered list of extractors per content
// category and moves to the next one when an extractor fails.
// Implementations must be safe to call from several threads.
class FileExtractor {
public:
    virtual ~FileExtractor() = default;

    virtual QString name() const = 0;

    // Extract textual content from the file at filePath.
    virtual ExtractionResult extract(const QString& filePath) = 0;
};

} // namespace rw
