#include <QtTest/QtTest>
#include "core/indexing/chunker.h"

#include <QStringList>

namespace {

QString words(int count)
{
    QStringList parts;
    for (int i = 0; i < count; ++i) {
        parts.append(QStringLiteral("w%1").arg(i));
    }
    return parts.join(QLatin1Char(' '));
}

} // namespace

class TestChunker : public QObject {
    Q_OBJECT

private slots:
    // ── Overlap arithmetic ──────────────────────────────────
    void testDefaultOverlapRoundsHalfToEven();
    void testOverlapRoundingTable_data();
    void testOverlapRoundingTable();
    void testFullOverlapStillAdvances();

    // ── Window layout ───────────────────────────────────────
    void testEmptyAndWhitespaceTextProducesNoWindows();
    void testShortTextSingleWindow();
    void testExactlyOneWindow();
    void testThreeHundredWordsThreeWindows();
    void testConsecutiveWindowsShareOverlap();
    void testLastWindowNeverContainedInPrevious();
    void testCharOffsetsPointIntoSource();
    void testIrregularWhitespaceSeparatesWords();

    // ── Determinism ─────────────────────────────────────────
    void testDeterministic();
    void testChunkTextConvenience();
};

// ── Overlap arithmetic ──────────────────────────────────────

void TestChunker::testDefaultOverlapRoundsHalfToEven()
{
    rw::Chunker chunker;
    QCOMPARE(chunker.sizeWords(), 150);
    // 150 * 0.15 = 22.5
    QCOMPARE(chunker.overlapWords(), 22);
    QCOMPARE(chunker.stepWords(), 128);
}

void TestChunker::testOverlapRoundingTable_data()
{
    QTest::addColumn<int>("size");
    QTest::addColumn<double>("ratio");
    QTest::addColumn<int>("expected");

    QTest::newRow("2.5 -> 2") << 10 << 0.25 << 2;
    QTest::newRow("3.5 -> 4") << 14 << 0.25 << 4;
    QTest::newRow("below half") << 10 << 0.12 << 1;
    QTest::newRow("above half") << 10 << 0.17 << 2;
    QTest::newRow("zero ratio") << 150 << 0.0 << 0;
}

void TestChunker::testOverlapRoundingTable()
{
    QFETCH(int, size);
    QFETCH(double, ratio);
    QFETCH(int, expected);
    QCOMPARE(rw::Chunker::overlapWordsFor(size, ratio), expected);
}

void TestChunker::testFullOverlapStillAdvances()
{
    rw::ChunkerConfig config;
    config.sizeWords = 4;
    config.overlapRatio = 1.0;
    rw::Chunker chunker(config);
    QCOMPARE(chunker.stepWords(), 1);

    const auto windows = chunker.chunk(words(6));
    QCOMPARE(static_cast<int>(windows.size()), 3);
    QCOMPARE(windows.back().wordOffset + windows.back().wordCount, 6);
}

// ── Window layout ───────────────────────────────────────────

void TestChunker::testEmptyAndWhitespaceTextProducesNoWindows()
{
    rw::Chunker chunker;
    QVERIFY(chunker.chunk(QString()).empty());
    QVERIFY(chunker.chunk(QStringLiteral(" \n\t  ")).empty());
}

void TestChunker::testShortTextSingleWindow()
{
    rw::Chunker chunker;
    const auto windows = chunker.chunk(QStringLiteral("alpha beta gamma"));
    QCOMPARE(static_cast<int>(windows.size()), 1);
    QCOMPARE(windows[0].ordinal, 0);
    QCOMPARE(windows[0].wordCount, 3);
    QCOMPARE(windows[0].text, QStringLiteral("alpha beta gamma"));
}

void TestChunker::testExactlyOneWindow()
{
    rw::Chunker chunker;
    const auto windows = chunker.chunk(words(150));
    QCOMPARE(static_cast<int>(windows.size()), 1);
    QCOMPARE(windows[0].wordCount, 150);
}

void TestChunker::testThreeHundredWordsThreeWindows()
{
    rw::Chunker chunker;
    const auto windows = chunker.chunk(words(300));
    QCOMPARE(static_cast<int>(windows.size()), 3);

    QCOMPARE(windows[0].wordOffset, 0);
    QCOMPARE(windows[0].wordCount, 150);
    QCOMPARE(windows[1].wordOffset, 128);
    QCOMPARE(windows[1].wordCount, 150);
    QCOMPARE(windows[2].wordOffset, 256);
    QCOMPARE(windows[2].wordCount, 44);

    for (int i = 0; i < 3; ++i) {
        QCOMPARE(windows[static_cast<size_t>(i)].ordinal, i);
    }
    QVERIFY(windows[2].text.endsWith(QStringLiteral("w299")));
}

void TestChunker::testConsecutiveWindowsShareOverlap()
{
    rw::Chunker chunker;
    const auto windows = chunker.chunk(words(400));
    QVERIFY(windows.size() >= 2);

    for (size_t i = 1; i < windows.size(); ++i) {
        const rw::TextWindow& prev = windows[i - 1];
        const rw::TextWindow& cur = windows[i];
        const int shared = prev.wordOffset + prev.wordCount - cur.wordOffset;
        QCOMPARE(shared, 22);

        const QStringList prevWords = prev.text.split(QLatin1Char(' '));
        const QStringList curWords = cur.text.split(QLatin1Char(' '));
        QCOMPARE(prevWords.mid(prevWords.size() - shared), curWords.mid(0, shared));
    }
}

void TestChunker::testLastWindowNeverContainedInPrevious()
{
    rw::Chunker chunker;
    // 150 + 1: the second window starts at 128 and covers the tail.
    const auto windows = chunker.chunk(words(151));
    QCOMPARE(static_cast<int>(windows.size()), 2);
    QCOMPARE(windows[1].wordOffset, 128);
    QCOMPARE(windows[1].wordCount, 23);

    // Text ending exactly at a window boundary stops there.
    const auto exact = chunker.chunk(words(278));
    QCOMPARE(static_cast<int>(exact.size()), 2);
    QCOMPARE(exact[1].wordOffset + exact[1].wordCount, 278);
}

void TestChunker::testCharOffsetsPointIntoSource()
{
    rw::ChunkerConfig config;
    config.sizeWords = 3;
    config.overlapRatio = 0.0;
    rw::Chunker chunker(config);

    const QString text = QStringLiteral("  one two three four five ");
    const auto windows = chunker.chunk(text);
    QCOMPARE(static_cast<int>(windows.size()), 2);
    for (const rw::TextWindow& window : windows) {
        QCOMPARE(text.mid(window.charOffset, window.charLength), window.text);
    }
    QCOMPARE(windows[0].text, QStringLiteral("one two three"));
    QCOMPARE(windows[1].text, QStringLiteral("four five"));
}

void TestChunker::testIrregularWhitespaceSeparatesWords()
{
    rw::ChunkerConfig config;
    config.sizeWords = 2;
    config.overlapRatio = 0.0;
    rw::Chunker chunker(config);

    const auto windows = chunker.chunk(QStringLiteral("a\n\nb\tc"));
    QCOMPARE(static_cast<int>(windows.size()), 2);
    QCOMPARE(windows[0].wordCount, 2);
    QCOMPARE(windows[0].text, QStringLiteral("a\n\nb"));
    QCOMPARE(windows[1].text, QStringLiteral("c"));
}

// ── Determinism ─────────────────────────────────────────────

void TestChunker::testDeterministic()
{
    rw::Chunker chunker;
    const QString text = words(500);
    const auto a = chunker.chunk(text);
    const auto b = chunker.chunk(text);
    QCOMPARE(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        QCOMPARE(a[i].text, b[i].text);
        QCOMPARE(a[i].charOffset, b[i].charOffset);
    }
}

void TestChunker::testChunkTextConvenience()
{
    const auto windows = rw::chunkText(words(20), 10, 0.2);
    // step 8: offsets 0, 8, 16
    QCOMPARE(static_cast<int>(windows.size()), 3);
    QCOMPARE(windows[2].wordOffset, 16);
    QCOMPARE(windows[2].wordCount, 4);
}

QTEST_MAIN(TestChunker)
#include "test_chunker.moc"
