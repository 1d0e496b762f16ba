#pragma once

#include <QString>
#include <QStringList>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rw {

// Row-major [batchSize x seqLength] model inputs, padded to the longest row.
struct TokenBatch {
    std::vector<int64_t> inputIds;
    std::vector<int64_t> attentionMask;
    std::vector<int64_t> tokenTypeIds;
    int batchSize = 0;
    int seqLength = 0;

    bool isEmpty() const { return batchSize <= 0 || seqLength <= 0; }
};

// WordPieceTokenizer: BERT uncased tokenization against a vocab.txt.
//
// Text is lower-cased, accents are stripped (NFD minus combining marks),
// punctuation is split into its own tokens and every word is matched
// greedily longest-first against the vocabulary ("##" continuation
// pieces). Sequences are [CLS] a [SEP] or [CLS] a [SEP] b [SEP], truncated
// to maxSequenceLength.
class WordPieceTokenizer {
public:
    static constexpr int kDefaultMaxSequenceLength = 512;

    explicit WordPieceTokenizer(const QString& vocabPath,
                                int maxSequenceLength = kDefaultMaxSequenceLength);

    bool isLoaded() const { return m_loaded; }
    int vocabSize() const { return static_cast<int>(m_vocab.size()); }
    int maxSequenceLength() const { return m_maxSequenceLength; }

    // Word-piece ids of text without special tokens.
    std::vector<int64_t> wordPieces(const QString& text) const;

    TokenBatch encode(const std::vector<QString>& texts) const;

    // Pairs are truncated second segment first.
    TokenBatch encodePairs(const std::vector<std::pair<QString, QString>>& pairs) const;

    std::optional<int64_t> tokenId(const std::string& token) const;

private:
    struct Row {
        std::vector<int64_t> ids;
        std::vector<int64_t> types;
    };

    QStringList basicTokens(const QString& text) const;
    void appendPieces(const QString& word, std::vector<int64_t>* out) const;
    Row buildRow(std::vector<int64_t> first, std::optional<std::vector<int64_t>> second) const;
    TokenBatch pad(std::vector<Row> rows) const;

    std::unordered_map<std::string, int64_t> m_vocab;
    int64_t m_padId = 0;
    int64_t m_unkId = 100;
    int64_t m_clsId = 101;
    int64_t m_sepId = 102;
    int m_maxSequenceLength;
    bool m_loaded = false;
};

} // namespace rw
