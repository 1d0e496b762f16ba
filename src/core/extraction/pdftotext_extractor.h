#pragma once

#include "core/extraction/extractor.h"

namespace rw {

// PdftotextExtractor - second PDF backend, runs the poppler-utils
// `pdftotext` tool and reads the text from its stdout.
class PdftotextExtractor : public FileExtractor {
public:
    explicit PdftotextExtractor(int timeoutMs = 30000,
                                QString program = QStringLiteral("pdftotext"));

    QString name() const override { return QStringLiteral("pdftotext"); }
    ExtractionResult extract(const QString& filePath) override;

private:
    int m_timeoutMs;
    QString m_program;
};

} // namespace rw
