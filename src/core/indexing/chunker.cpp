#include "core/indexing/chunker.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>

namespace rw {

namespace {

struct WordSpan {
    int start = 0;
    int end = 0;
};

std::vector<WordSpan> findWords(const QString& text)
{
    std::vector<WordSpan> words;
    const int length = static_cast<int>(text.size());
    int pos = 0;
    while (pos < length) {
        while (pos < length && text.at(pos).isSpace()) {
            ++pos;
        }
        if (pos >= length) {
            break;
        }
        const int start = pos;
        while (pos < length && !text.at(pos).isSpace()) {
            ++pos;
        }
        words.push_back(WordSpan{start, pos});
    }
    return words;
}

int roundHalfToEven(double value)
{
    const double floorValue = std::floor(value);
    const double fraction = value - floorValue;
    int rounded = static_cast<int>(floorValue);
    if (fraction > 0.5 || (fraction == 0.5 && (rounded % 2) != 0)) {
        ++rounded;
    }
    return rounded;
}

} // namespace

// ── Construction ────────────────────────────────────────────

Chunker::Chunker(const Config& config)
    : m_config(config)
{
    if (m_config.sizeWords < 1) {
        m_config.sizeWords = 1;
    }
    m_config.overlapRatio = std::clamp(m_config.overlapRatio, 0.0, 1.0);
}

int Chunker::overlapWordsFor(int sizeWords, double overlapRatio)
{
    return roundHalfToEven(static_cast<double>(sizeWords) * overlapRatio);
}

int Chunker::overlapWords() const
{
    return overlapWordsFor(m_config.sizeWords, m_config.overlapRatio);
}

int Chunker::stepWords() const
{
    return std::max(1, m_config.sizeWords - overlapWords());
}

// ── Public API ──────────────────────────────────────────────

std::vector<TextWindow> Chunker::chunk(const QString& text) const
{
    std::vector<TextWindow> windows;

    const std::vector<WordSpan> words = findWords(text);
    if (words.empty()) {
        return windows;
    }

    const int totalWords = static_cast<int>(words.size());
    const int step = stepWords();

    for (int first = 0; first < totalWords; first += step) {
        const int last = std::min(first + m_config.sizeWords, totalWords);

        TextWindow window;
        window.ordinal = static_cast<int>(windows.size());
        window.wordOffset = first;
        window.wordCount = last - first;
        window.charOffset = words[static_cast<size_t>(first)].start;
        window.charLength = words[static_cast<size_t>(last - 1)].end - window.charOffset;
        window.text = text.mid(window.charOffset, window.charLength);
        windows.push_back(std::move(window));

        if (last == totalWords) {
            break;
        }
    }

    LOG_DEBUG(rwIndex, "Chunked %d words into %d windows (size=%d, step=%d)",
              totalWords, static_cast<int>(windows.size()), m_config.sizeWords, step);
    return windows;
}

std::vector<TextWindow> chunkText(const QString& text, int sizeWords, double overlapRatio)
{
    ChunkerConfig config;
    config.sizeWords = sizeWords;
    config.overlapRatio = overlapRatio;
    return Chunker(config).chunk(text);
}

} // namespace rw
