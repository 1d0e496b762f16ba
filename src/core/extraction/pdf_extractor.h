#pragma once

#include "core/extraction/extractor.h"

namespace rw {

// PdfExtractor - extracts text from PDF files using Poppler's C++ API.
//
// Limits:
//   - 1000-page cap per document
//   - 10 MB extracted text cap
//   - Encrypted PDFs are rejected (CorruptedFile status)
class PdfExtractor : public FileExtractor {
public:
    QString name() const override { return QStringLiteral("poppler"); }
    ExtractionResult extract(const QString& filePath) override;
};

} // namespace rw
