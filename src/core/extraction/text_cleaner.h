#pragma once

#include <QString>

namespace rw {

// TextCleaner - normalizes extractor output before chunking.
//
// Control characters (C0 except whitespace, DEL, C1) are removed and every
// run of whitespace, line breaks included, becomes a single space. The
// result is trimmed.
class TextCleaner {
public:
    static QString clean(const QString& raw);
};

} // namespace rw
