#pragma once

#include "core/extraction/extractor.h"

#include <QByteArray>

namespace rw {

// TextExtractor - reads plain-text and source files.
//
// Decodes as UTF-8 first and falls back to the configured encoding
// (ISO-8859-1 by default). Payloads containing NUL bytes are binary and
// fail with UnsupportedFormat, as does a file neither encoding decodes.
class TextExtractor : public FileExtractor {
public:
    explicit TextExtractor(QByteArray fallbackEncoding = QByteArrayLiteral("ISO-8859-1"));

    QString name() const override { return QStringLiteral("text"); }
    ExtractionResult extract(const QString& filePath) override;

private:
    QByteArray m_fallbackEncoding;
};

} // namespace rw
