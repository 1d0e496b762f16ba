#pragma once

#include <QString>

namespace rw {

// Fragment - one embedded window of a file's text as stored in the index.
// Immutable once written; a new fingerprint produces new fragments.
struct Fragment {
    QString id;
    QString path;
    QString fingerprint;
    int ordinal = 0;
    int totalFragments = 0;
    QString text;
    int wordOffset = 0;
    int wordCount = 0;
    int charOffset = 0;
    int charLength = 0;
    double mtime = 0.0;
};

// Stable fragment ID: SHA-256 of "path\0fingerprint\0ordinal", first
// 16 bytes rendered as a UUID. Identical inputs give identical IDs; any
// change to the fingerprint gives a disjoint set.
QString computeFragmentId(const QString& path, const QString& fingerprint, int ordinal);

} // namespace rw
