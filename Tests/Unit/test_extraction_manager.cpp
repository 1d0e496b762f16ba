#include <QtTest/QtTest>
#include "core/extraction/extraction_manager.h"
#include "core/extraction/text_extractor.h"

#include "test_fs_utils.h"

#include <QTemporaryDir>

#include <QSemaphore>

#include <atomic>
#include <memory>
#include <thread>

namespace {

// Backend with a fixed outcome that counts its calls.
class ScriptedExtractor : public rw::FileExtractor {
public:
    ScriptedExtractor(QString name, rw::ExtractionResult::Status status,
                      QString content, std::shared_ptr<std::atomic<int>> calls)
        : m_name(std::move(name))
        , m_status(status)
        , m_content(std::move(content))
        , m_calls(std::move(calls))
    {
    }

    QString name() const override { return m_name; }

    rw::ExtractionResult extract(const QString&) override
    {
        m_calls->fetch_add(1);
        rw::ExtractionResult result;
        result.backend = m_name;
        result.status = m_status;
        if (m_status == rw::ExtractionResult::Status::Success) {
            result.content = m_content;
        } else {
            result.errorMessage = QStringLiteral("%1 refused").arg(m_name);
        }
        return result;
    }

private:
    QString m_name;
    rw::ExtractionResult::Status m_status;
    QString m_content;
    std::shared_ptr<std::atomic<int>> m_calls;
};

// Backend that holds its slot until the test opens the gate.
class GatedExtractor : public rw::FileExtractor {
public:
    GatedExtractor(QSemaphore* entered, QSemaphore* gate)
        : m_entered(entered)
        , m_gate(gate)
    {
    }

    QString name() const override { return QStringLiteral("gated"); }

    rw::ExtractionResult extract(const QString&) override
    {
        m_entered->release();
        m_gate->acquire();
        rw::ExtractionResult result;
        result.backend = name();
        result.status = rw::ExtractionResult::Status::Success;
        result.content = QStringLiteral("slow page");
        return result;
    }

private:
    QSemaphore* m_entered;
    QSemaphore* m_gate;
};

} // namespace

class TestExtractionManager : public QObject {
    Q_OBJECT

private slots:
    // ── Text backend ────────────────────────────────────────
    void testUtf8TextExtractedAndCleaned();
    void testLatin1FallbackDecoding();
    void testBinaryPayloadRejected();
    void testEmptyFileSucceedsWithNoContent();

    // ── Manager ─────────────────────────────────────────────
    void testMissingFileInaccessible();
    void testOversizedFileSkipped();
    void testFallsBackToNextBackend();
    void testAllBackendsFailing();
    void testDefaultBackendChains();
    void testBusyPdfSlotReportsBusy();
};

// ── Text backend ────────────────────────────────────────────

void TestExtractionManager::testUtf8TextExtractedAndCleaned()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("notes.md"));
    QVERIFY(rw::test::writeFile(path, QByteArray("# Title\n\n  caf\xc3\xa9  menu\r\n")));

    rw::ExtractionManager manager;
    const rw::ExtractionResult result = manager.extract(path, rw::ContentCategory::Text);
    QVERIFY(result.ok());
    QCOMPARE(result.backend, QStringLiteral("text"));
    QCOMPARE(result.content.value(), QString::fromUtf8("# Title caf\xc3\xa9 menu"));
}

void TestExtractionManager::testLatin1FallbackDecoding()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("legacy.txt"));
    // 0xE9 alone is invalid UTF-8, "é" in ISO-8859-1.
    QVERIFY(rw::test::writeFile(path, QByteArray("caf\xe9 au lait")));

    rw::TextExtractor extractor;
    const rw::ExtractionResult result = extractor.extract(path);
    QVERIFY(result.ok());
    QCOMPARE(result.content.value(), QString::fromUtf8("caf\xc3\xa9 au lait"));
}

void TestExtractionManager::testBinaryPayloadRejected()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("blob.txt"));
    QVERIFY(rw::test::writeFile(path, QByteArray("abc\0def", 7)));

    rw::ExtractionManager manager;
    const rw::ExtractionResult result = manager.extract(path, rw::ContentCategory::Text);
    QVERIFY(!result.ok());
    QCOMPARE(result.status, rw::ExtractionResult::Status::UnsupportedFormat);
    QVERIFY(!result.content.has_value());
    QVERIFY(result.errorMessage.has_value());
}

void TestExtractionManager::testEmptyFileSucceedsWithNoContent()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("empty.txt"));
    QVERIFY(rw::test::writeFile(path, QByteArray()));

    rw::ExtractionManager manager;
    const rw::ExtractionResult result = manager.extract(path, rw::ContentCategory::Text);
    QVERIFY(result.ok());
    QVERIFY(result.content->isEmpty());
}

// ── Manager ─────────────────────────────────────────────────

void TestExtractionManager::testMissingFileInaccessible()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    rw::ExtractionManager manager;
    const rw::ExtractionResult result =
        manager.extract(dir.filePath(QStringLiteral("nope.txt")), rw::ContentCategory::Text);
    QCOMPARE(result.status, rw::ExtractionResult::Status::Inaccessible);
}

void TestExtractionManager::testOversizedFileSkipped()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("big.txt"));
    QVERIFY(rw::test::writeFile(path, QByteArray(2048, 'a')));

    rw::ExtractionConfig config;
    config.maxFileSize = 1024;
    rw::ExtractionManager manager(config);
    const rw::ExtractionResult result = manager.extract(path, rw::ContentCategory::Text);
    QCOMPARE(result.status, rw::ExtractionResult::Status::SizeExceeded);
}

void TestExtractionManager::testFallsBackToNextBackend()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("doc.pdf"));
    QVERIFY(rw::test::writeFile(path, QByteArray("%PDF-1.4 not really")));

    auto firstCalls = std::make_shared<std::atomic<int>>(0);
    auto secondCalls = std::make_shared<std::atomic<int>>(0);
    std::vector<std::unique_ptr<rw::FileExtractor>> chain;
    chain.push_back(std::make_unique<ScriptedExtractor>(
        QStringLiteral("primary"), rw::ExtractionResult::Status::CorruptedFile,
        QString(), firstCalls));
    chain.push_back(std::make_unique<ScriptedExtractor>(
        QStringLiteral("secondary"), rw::ExtractionResult::Status::Success,
        QStringLiteral("  recovered\n\ntext "), secondCalls));

    rw::ExtractionManager manager;
    manager.setBackends(rw::ContentCategory::Pdf, std::move(chain));
    QCOMPARE(static_cast<int>(manager.backendCount(rw::ContentCategory::Pdf)), 2);

    const rw::ExtractionResult result = manager.extract(path, rw::ContentCategory::Pdf);
    QVERIFY(result.ok());
    QCOMPARE(result.backend, QStringLiteral("secondary"));
    QCOMPARE(result.content.value(), QStringLiteral("recovered text"));
    QCOMPARE(firstCalls->load(), 1);
    QCOMPARE(secondCalls->load(), 1);
}

void TestExtractionManager::testAllBackendsFailing()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("doc.pdf"));
    QVERIFY(rw::test::writeFile(path, QByteArray("%PDF-1.4")));

    auto calls = std::make_shared<std::atomic<int>>(0);
    std::vector<std::unique_ptr<rw::FileExtractor>> chain;
    chain.push_back(std::make_unique<ScriptedExtractor>(
        QStringLiteral("one"), rw::ExtractionResult::Status::CorruptedFile, QString(), calls));
    chain.push_back(std::make_unique<ScriptedExtractor>(
        QStringLiteral("two"), rw::ExtractionResult::Status::Timeout, QString(), calls));

    rw::ExtractionManager manager;
    manager.setBackends(rw::ContentCategory::Pdf, std::move(chain));
    const rw::ExtractionResult result = manager.extract(path, rw::ContentCategory::Pdf);
    QVERIFY(!result.ok());
    QCOMPARE(calls->load(), 2);
    QVERIFY(!result.content.has_value());
    QVERIFY(result.errorMessage->contains(QStringLiteral("one")));
    QVERIFY(result.errorMessage->contains(QStringLiteral("two")));
}

void TestExtractionManager::testDefaultBackendChains()
{
    rw::ExtractionManager manager;
    QCOMPARE(static_cast<int>(manager.backendCount(rw::ContentCategory::Text)), 1);
    QCOMPARE(static_cast<int>(manager.backendCount(rw::ContentCategory::Pdf)), 2);
}

void TestExtractionManager::testBusyPdfSlotReportsBusy()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString first = dir.filePath(QStringLiteral("big.pdf"));
    const QString second = dir.filePath(QStringLiteral("next.pdf"));
    QVERIFY(rw::test::writeFile(first, QByteArray("%PDF-1.4")));
    QVERIFY(rw::test::writeFile(second, QByteArray("%PDF-1.4")));

    QSemaphore entered;
    QSemaphore gate;
    rw::ExtractionConfig config;
    config.timeoutMs = 50;
    rw::ExtractionManager manager(config);
    std::vector<std::unique_ptr<rw::FileExtractor>> chain;
    chain.push_back(std::make_unique<GatedExtractor>(&entered, &gate));
    manager.setBackends(rw::ContentCategory::Pdf, std::move(chain));

    rw::ExtractionResult slow;
    std::thread holder([&] { slow = manager.extract(first, rw::ContentCategory::Pdf); });
    QVERIFY(entered.tryAcquire(1, 5000));

    // The only PDF slot is taken; text extraction is not affected.
    const rw::ExtractionResult waiting = manager.extract(second, rw::ContentCategory::Pdf);
    QCOMPARE(waiting.status, rw::ExtractionResult::Status::Busy);
    QVERIFY(!waiting.ok());
    QVERIFY(!waiting.content.has_value());
    QCOMPARE(entered.available(), 0);

    const QString text = dir.filePath(QStringLiteral("notes.txt"));
    QVERIFY(rw::test::writeTextFile(text, QStringLiteral("plain words")));
    QVERIFY(manager.extract(text, rw::ContentCategory::Text).ok());

    gate.release();
    holder.join();
    QVERIFY(slow.ok());

    gate.release();
    const rw::ExtractionResult retried = manager.extract(second, rw::ContentCategory::Pdf);
    QVERIFY(retried.ok());
    QCOMPARE(retried.content.value(), QStringLiteral("slow page"));
}

QTEST_MAIN(TestExtractionManager)
#include "test_extraction_manager.moc"
