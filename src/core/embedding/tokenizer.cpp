#include "core/embedding/tokenizer.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QStringConverter>
#include <QTextStream>

#include <algorithm>

namespace rw {

namespace {

constexpr int kMaxCharsPerWord = 100;

bool isPunctuation(QChar ch)
{
    const ushort u = ch.unicode();
    // ASCII symbols count as punctuation for BERT even when Unicode says otherwise.
    if ((u >= 33 && u <= 47) || (u >= 58 && u <= 64) || (u >= 91 && u <= 96)
        || (u >= 123 && u <= 126)) {
        return true;
    }
    return ch.isPunct();
}

bool isCombiningMark(QChar ch)
{
    const QChar::Category category = ch.category();
    return category == QChar::Mark_NonSpacing || category == QChar::Mark_SpacingCombining
           || category == QChar::Mark_Enclosing;
}

} // namespace

WordPieceTokenizer::WordPieceTokenizer(const QString& vocabPath, int maxSequenceLength)
    : m_maxSequenceLength(std::max(8, maxSequenceLength))
{
    QFile file(vocabPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        LOG_WARN(rwModels, "WordPieceTokenizer: cannot open vocab %s", qUtf8Printable(vocabPath));
        return;
    }

    QTextStream in(&file);
    in.setEncoding(QStringConverter::Utf8);
    int64_t index = 0;
    while (!in.atEnd()) {
        const QString token = in.readLine().trimmed();
        if (!token.isEmpty()) {
            m_vocab.emplace(token.toStdString(), index);
        }
        ++index;
    }

    if (m_vocab.empty()) {
        LOG_WARN(rwModels, "WordPieceTokenizer: empty vocab in %s", qUtf8Printable(vocabPath));
        return;
    }

    const auto special = [this](const char* token, int64_t fallback) {
        return tokenId(token).value_or(fallback);
    };
    m_padId = special("[PAD]", 0);
    m_unkId = special("[UNK]", 100);
    m_clsId = special("[CLS]", 101);
    m_sepId = special("[SEP]", 102);
    m_loaded = true;

    LOG_DEBUG(rwModels, "WordPieceTokenizer: %d tokens from %s", vocabSize(),
              qUtf8Printable(vocabPath));
}

std::optional<int64_t> WordPieceTokenizer::tokenId(const std::string& token) const
{
    const auto it = m_vocab.find(token);
    if (it == m_vocab.end()) {
        return std::nullopt;
    }
    return it->second;
}

QStringList WordPieceTokenizer::basicTokens(const QString& text) const
{
    const QString decomposed = text.toLower().normalized(QString::NormalizationForm_D);

    QStringList tokens;
    QString current;
    auto flush = [&]() {
        if (!current.isEmpty()) {
            tokens.append(current);
            current.clear();
        }
    };

    for (const QChar ch : decomposed) {
        if (isCombiningMark(ch) || ch.unicode() == 0 || ch.unicode() == 0xFFFD) {
            continue;
        }
        if (ch.isSpace()) {
            flush();
        } else if (isPunctuation(ch)) {
            flush();
            tokens.append(QString(ch));
        } else {
            current.append(ch);
        }
    }
    flush();
    return tokens;
}

void WordPieceTokenizer::appendPieces(const QString& word, std::vector<int64_t>* out) const
{
    if (word.size() > kMaxCharsPerWord) {
        out->push_back(m_unkId);
        return;
    }

    std::vector<int64_t> pieces;
    int start = 0;
    while (start < word.size()) {
        int end = word.size();
        std::optional<int64_t> match;
        while (end > start) {
            QString piece = word.mid(start, end - start);
            if (start > 0) {
                piece.prepend(QStringLiteral("##"));
            }
            match = tokenId(piece.toStdString());
            if (match.has_value()) {
                break;
            }
            --end;
        }
        if (!match.has_value()) {
            // The whole word becomes [UNK], never a partial match.
            out->push_back(m_unkId);
            return;
        }
        pieces.push_back(match.value());
        start = end;
    }
    out->insert(out->end(), pieces.begin(), pieces.end());
}

std::vector<int64_t> WordPieceTokenizer::wordPieces(const QString& text) const
{
    std::vector<int64_t> ids;
    if (!m_loaded) {
        return ids;
    }
    const size_t cap = static_cast<size_t>(m_maxSequenceLength);
    for (const QString& word : basicTokens(text)) {
        appendPieces(word, &ids);
        if (ids.size() >= cap) {
            break;
        }
    }
    if (ids.size() > cap) {
        ids.resize(cap);
    }
    return ids;
}

WordPieceTokenizer::Row WordPieceTokenizer::buildRow(
    std::vector<int64_t> first, std::optional<std::vector<int64_t>> second) const
{
    const size_t specials = second.has_value() ? 3 : 2;
    const size_t budget = static_cast<size_t>(m_maxSequenceLength) - specials;

    if (second.has_value()) {
        std::vector<int64_t>& b = second.value();
        while (first.size() + b.size() > budget) {
            if (b.size() >= first.size() && !b.empty()) {
                b.pop_back();
            } else {
                first.pop_back();
            }
        }
    } else if (first.size() > budget) {
        first.resize(budget);
    }

    Row row;
    row.ids.push_back(m_clsId);
    row.ids.insert(row.ids.end(), first.begin(), first.end());
    row.ids.push_back(m_sepId);
    row.types.assign(row.ids.size(), 0);
    if (second.has_value()) {
        const std::vector<int64_t>& b = second.value();
        row.ids.insert(row.ids.end(), b.begin(), b.end());
        row.ids.push_back(m_sepId);
        row.types.resize(row.ids.size(), 1);
    }
    return row;
}

TokenBatch WordPieceTokenizer::pad(std::vector<Row> rows) const
{
    TokenBatch batch;
    if (rows.empty()) {
        return batch;
    }

    size_t longest = 0;
    for (const Row& row : rows) {
        longest = std::max(longest, row.ids.size());
    }

    batch.batchSize = static_cast<int>(rows.size());
    batch.seqLength = static_cast<int>(longest);
    const size_t total = rows.size() * longest;
    batch.inputIds.reserve(total);
    batch.attentionMask.reserve(total);
    batch.tokenTypeIds.reserve(total);

    for (Row& row : rows) {
        const size_t length = row.ids.size();
        batch.inputIds.insert(batch.inputIds.end(), row.ids.begin(), row.ids.end());
        batch.inputIds.insert(batch.inputIds.end(), longest - length, m_padId);
        batch.attentionMask.insert(batch.attentionMask.end(), length, 1);
        batch.attentionMask.insert(batch.attentionMask.end(), longest - length, 0);
        batch.tokenTypeIds.insert(batch.tokenTypeIds.end(), row.types.begin(), row.types.end());
        batch.tokenTypeIds.insert(batch.tokenTypeIds.end(), longest - length, 0);
    }
    return batch;
}

TokenBatch WordPieceTokenizer::encode(const std::vector<QString>& texts) const
{
    if (!m_loaded) {
        return {};
    }
    std::vector<Row> rows;
    rows.reserve(texts.size());
    for (const QString& text : texts) {
        rows.push_back(buildRow(wordPieces(text), std::nullopt));
    }
    return pad(std::move(rows));
}

TokenBatch WordPieceTokenizer::encodePairs(
    const std::vector<std::pair<QString, QString>>& pairs) const
{
    if (!m_loaded) {
        return {};
    }
    std::vector<Row> rows;
    rows.reserve(pairs.size());
    for (const auto& [first, second] : pairs) {
        rows.push_back(buildRow(wordPieces(first), wordPieces(second)));
    }
    return pad(std::move(rows));
}

} // namespace rw
