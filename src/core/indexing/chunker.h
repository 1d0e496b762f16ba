#pragma once

#include <QString>
#include <cstddef>
#include <vector>

namespace rw {

// Configuration for the Chunker.
struct ChunkerConfig {
    int sizeWords = 150;
    double overlapRatio = 0.15;
};

// One window of consecutive words. Offsets are in words and in QChar units
// of the chunked text.
struct TextWindow {
    int ordinal = 0;
    int wordOffset = 0;
    int wordCount = 0;
    int charOffset = 0;
    int charLength = 0;
    QString text;
};

// Chunker - splits extracted text into overlapping fixed-size word windows.
//
// Consecutive windows share round(sizeWords * overlapRatio) words (ties
// round to even). Every window is non-empty and holds at most sizeWords
// words; the last one may be shorter. The walk stops at the first window
// that reaches the end of the text, so no window is contained in the
// previous one. Pure function of its inputs.
class Chunker {
public:
    using Config = ChunkerConfig;

    explicit Chunker(const Config& config = {});

    std::vector<TextWindow> chunk(const QString& text) const;

    int sizeWords() const { return m_config.sizeWords; }
    int overlapWords() const;
    int stepWords() const;

    static int overlapWordsFor(int sizeWords, double overlapRatio);

private:
    Config m_config;
};

// Convenience form of Chunker(config).chunk(text).
std::vector<TextWindow> chunkText(const QString& text, int sizeWords, double overlapRatio);

} // namespace rw
