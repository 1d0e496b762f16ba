#include <QtTest/QtTest>
#include "core/embedding/tokenizer.h"

#include <QFile>
#include <QTemporaryDir>
#include <QTextStream>

namespace {

using Ids = std::vector<int64_t>;

Ids row(const rw::TokenBatch& batch, int index)
{
    const auto begin = batch.inputIds.begin() + static_cast<std::ptrdiff_t>(index) * batch.seqLength;
    return Ids(begin, begin + batch.seqLength);
}

} // namespace

class TestTokenizer : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();

    // ── Vocabulary ──────────────────────────────────────────
    void testMissingVocabNotLoaded();
    void testSpecialTokensFromVocab();

    // ── Basic tokenization ──────────────────────────────────
    void testLowercasesAndStripsAccents();
    void testPunctuationSplit();
    void testWordPiecesLongestFirst();
    void testUnknownWordIsSingleUnk();

    // ── Batches ─────────────────────────────────────────────
    void testEmptyTextGivesSpecialsOnly();
    void testPaddingAndMask();
    void testSingleSequenceTruncated();
    void testPairSegments();
    void testPairTruncatesLongerSegment();

private:
    QTemporaryDir m_tempDir;
    QString m_vocabPath;
};

void TestTokenizer::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_vocabPath = m_tempDir.path() + QStringLiteral("/vocab.txt");

    QFile vocab(m_vocabPath);
    QVERIFY(vocab.open(QIODevice::WriteOnly | QIODevice::Text));
    QTextStream out(&vocab);
    // Line number is the token id.
    out << "[PAD]\n"     // 0
        << "[UNK]\n"     // 1
        << "[CLS]\n"     // 2
        << "[SEP]\n"     // 3
        << "hello\n"     // 4
        << "world\n"     // 5
        << "un\n"        // 6
        << "##aff\n"     // 7
        << "##able\n"    // 8
        << "cafe\n"      // 9
        << "!\n"         // 10
        << ",\n";        // 11
}

// ── Vocabulary ──────────────────────────────────────────────

void TestTokenizer::testMissingVocabNotLoaded()
{
    rw::WordPieceTokenizer tokenizer(QStringLiteral("/definitely/missing/vocab.txt"));
    QVERIFY(!tokenizer.isLoaded());
    QVERIFY(tokenizer.encode({QStringLiteral("hello")}).isEmpty());
    QVERIFY(tokenizer.wordPieces(QStringLiteral("hello")).empty());
}

void TestTokenizer::testSpecialTokensFromVocab()
{
    rw::WordPieceTokenizer tokenizer(m_vocabPath);
    QVERIFY(tokenizer.isLoaded());
    QCOMPARE(tokenizer.vocabSize(), 12);
    QCOMPARE(tokenizer.tokenId("[CLS]").value_or(-1), static_cast<int64_t>(2));
    QVERIFY(!tokenizer.tokenId("missing").has_value());

    const rw::TokenBatch batch = tokenizer.encode({QStringLiteral("hello world")});
    QCOMPARE(batch.batchSize, 1);
    QCOMPARE(row(batch, 0), (Ids{2, 4, 5, 3}));
}

// ── Basic tokenization ──────────────────────────────────────

void TestTokenizer::testLowercasesAndStripsAccents()
{
    rw::WordPieceTokenizer tokenizer(m_vocabPath);
    QCOMPARE(tokenizer.wordPieces(QString::fromUtf8("HELLO Caf\xc3\xa9")), (Ids{4, 9}));
}

void TestTokenizer::testPunctuationSplit()
{
    rw::WordPieceTokenizer tokenizer(m_vocabPath);
    QCOMPARE(tokenizer.wordPieces(QStringLiteral("hello,world!")), (Ids{4, 11, 5, 10}));
}

void TestTokenizer::testWordPiecesLongestFirst()
{
    rw::WordPieceTokenizer tokenizer(m_vocabPath);
    QCOMPARE(tokenizer.wordPieces(QStringLiteral("unaffable")), (Ids{6, 7, 8}));
}

void TestTokenizer::testUnknownWordIsSingleUnk()
{
    rw::WordPieceTokenizer tokenizer(m_vocabPath);
    QCOMPARE(tokenizer.wordPieces(QStringLiteral("zebra")), (Ids{1}));
    // A word that only partly matches is still one [UNK].
    QCOMPARE(tokenizer.wordPieces(QStringLiteral("unaffxyz hello")), (Ids{1, 4}));
    QCOMPARE(tokenizer.wordPieces(QString(150, QLatin1Char('a'))), (Ids{1}));
}

// ── Batches ─────────────────────────────────────────────────

void TestTokenizer::testEmptyTextGivesSpecialsOnly()
{
    rw::WordPieceTokenizer tokenizer(m_vocabPath);
    const rw::TokenBatch batch = tokenizer.encode({QString()});
    QCOMPARE(batch.seqLength, 2);
    QCOMPARE(row(batch, 0), (Ids{2, 3}));
    QVERIFY(tokenizer.encode({}).isEmpty());
}

void TestTokenizer::testPaddingAndMask()
{
    rw::WordPieceTokenizer tokenizer(m_vocabPath);
    const rw::TokenBatch batch =
        tokenizer.encode({QStringLiteral("hello"), QStringLiteral("hello world !")});
    QCOMPARE(batch.batchSize, 2);
    QCOMPARE(batch.seqLength, 5);
    QCOMPARE(static_cast<int>(batch.inputIds.size()), 10);
    QCOMPARE(row(batch, 0), (Ids{2, 4, 3, 0, 0}));
    QCOMPARE(row(batch, 1), (Ids{2, 4, 5, 10, 3}));
    QCOMPARE(batch.attentionMask, (Ids{1, 1, 1, 0, 0, 1, 1, 1, 1, 1}));
    QCOMPARE(batch.tokenTypeIds, Ids(10, 0));
}

void TestTokenizer::testSingleSequenceTruncated()
{
    rw::WordPieceTokenizer tokenizer(m_vocabPath, 8);
    QStringList words;
    for (int i = 0; i < 20; ++i) {
        words.append(QStringLiteral("hello"));
    }
    const rw::TokenBatch batch = tokenizer.encode({words.join(QLatin1Char(' '))});
    QCOMPARE(batch.seqLength, 8);
    QCOMPARE(row(batch, 0), (Ids{2, 4, 4, 4, 4, 4, 4, 3}));
}

void TestTokenizer::testPairSegments()
{
    rw::WordPieceTokenizer tokenizer(m_vocabPath);
    const rw::TokenBatch batch =
        tokenizer.encodePairs({{QStringLiteral("hello"), QStringLiteral("world")}});
    QCOMPARE(row(batch, 0), (Ids{2, 4, 3, 5, 3}));
    QCOMPARE(batch.tokenTypeIds, (Ids{0, 0, 0, 1, 1}));
}

void TestTokenizer::testPairTruncatesLongerSegment()
{
    rw::WordPieceTokenizer tokenizer(m_vocabPath, 8);
    QStringList worlds;
    for (int i = 0; i < 10; ++i) {
        worlds.append(QStringLiteral("world"));
    }
    const rw::TokenBatch batch = tokenizer.encodePairs(
        {{QStringLiteral("hello hello"), worlds.join(QLatin1Char(' '))}});
    QCOMPARE(batch.seqLength, 8);
    QCOMPARE(row(batch, 0), (Ids{2, 4, 4, 3, 5, 5, 5, 3}));
    QCOMPARE(batch.tokenTypeIds, (Ids{0, 0, 0, 0, 1, 1, 1, 1}));
}

QTEST_MAIN(TestTokenizer)
#include "test_tokenizer.moc"
