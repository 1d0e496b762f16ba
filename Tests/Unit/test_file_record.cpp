#include <QtTest/QtTest>
#include "core/fs/fingerprint.h"
#include "core/indexing/file_record.h"

#include <QFile>
#include <QTemporaryDir>

#include <algorithm>

namespace {

rw::FileRecord record(const QString& path, const QString& fingerprint, const QStringList& ids)
{
    rw::FileRecord r;
    r.path = path;
    r.syncedFingerprint = fingerprint;
    r.fragmentIds = ids;
    return r;
}

bool writeFile(const QString& path, const QByteArray& data)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(data) == data.size();
}

} // namespace

class TestFileRecord : public QObject {
    Q_OBJECT

private slots:
    void testPutGetAndVersionBump();
    void testCommitIfUnchangedMatchesCommittedState();
    void testCommitIfUnchangedOnNewPath();
    void testPendingIdsSkipCommitted();
    void testPathsUnderDirectory();
    void testTakeAndErase();
    void testFragmentCount();

    void testFingerprintIsSha256Hex();
    void testFingerprintMissingFile();
};

void TestFileRecord::testPutGetAndVersionBump()
{
    rw::FileRecordTable table;
    QVERIFY(!table.get(QStringLiteral("/r/a.txt")).has_value());

    table.put(record(QStringLiteral("/r/a.txt"), QStringLiteral("f1"), {QStringLiteral("id1")}));
    const auto first = table.get(QStringLiteral("/r/a.txt"));
    QVERIFY(first.has_value());
    QCOMPARE(first->syncedFingerprint, QStringLiteral("f1"));

    table.put(record(QStringLiteral("/r/a.txt"), QStringLiteral("f2"), {QStringLiteral("id2")}));
    const auto second = table.get(QStringLiteral("/r/a.txt"));
    QVERIFY(second->version > first->version);
    QCOMPARE(second->fragmentIds, QStringList{QStringLiteral("id2")});
    QCOMPARE(static_cast<int>(table.size()), 1);
}

void TestFileRecord::testCommitIfUnchangedMatchesCommittedState()
{
    rw::FileRecordTable table;
    table.put(record(QStringLiteral("/r/a.txt"), QStringLiteral("f1"), {QStringLiteral("id1")}));
    const auto snapshot = table.get(QStringLiteral("/r/a.txt"));

    // A pending id added meanwhile does not change the committed state.
    table.addPendingIds(QStringLiteral("/r/a.txt"), {QStringLiteral("idx")});
    QVERIFY(table.commitIfUnchanged(
        snapshot, record(QStringLiteral("/r/a.txt"), QStringLiteral("f2"), {QStringLiteral("id2")})));

    // The snapshot now lags behind f2 and must not overwrite it.
    QVERIFY(!table.commitIfUnchanged(
        snapshot, record(QStringLiteral("/r/a.txt"), QStringLiteral("f3"), {QStringLiteral("id3")})));
    QCOMPARE(table.get(QStringLiteral("/r/a.txt"))->syncedFingerprint, QStringLiteral("f2"));
}

void TestFileRecord::testCommitIfUnchangedOnNewPath()
{
    rw::FileRecordTable table;
    QVERIFY(table.commitIfUnchanged(
        std::nullopt, record(QStringLiteral("/r/new.txt"), QStringLiteral("f1"), {QStringLiteral("id1")})));
    QVERIFY(!table.commitIfUnchanged(
        std::nullopt, record(QStringLiteral("/r/new.txt"), QStringLiteral("f2"), {QStringLiteral("id2")})));
    QCOMPARE(table.get(QStringLiteral("/r/new.txt"))->syncedFingerprint, QStringLiteral("f1"));
}

void TestFileRecord::testPendingIdsSkipCommitted()
{
    rw::FileRecordTable table;
    table.addPendingIds(QStringLiteral("/r/b.txt"), {QStringLiteral("p1")});
    auto created = table.get(QStringLiteral("/r/b.txt"));
    QVERIFY(created.has_value());
    QVERIFY(created->syncedFingerprint.isEmpty());
    QCOMPARE(created->pendingIds, QStringList{QStringLiteral("p1")});

    table.put(record(QStringLiteral("/r/b.txt"), QStringLiteral("f1"), {QStringLiteral("c1")}));
    table.addPendingIds(QStringLiteral("/r/b.txt"),
                        {QStringLiteral("c1"), QStringLiteral("p2"), QStringLiteral("p2")});
    QCOMPARE(table.get(QStringLiteral("/r/b.txt"))->pendingIds, QStringList{QStringLiteral("p2")});
}

void TestFileRecord::testPathsUnderDirectory()
{
    rw::FileRecordTable table;
    table.put(record(QStringLiteral("/r/docs/a.txt"), QStringLiteral("f"), {}));
    table.put(record(QStringLiteral("/r/docs/sub/b.txt"), QStringLiteral("f"), {}));
    table.put(record(QStringLiteral("/r/docs2/c.txt"), QStringLiteral("f"), {}));
    table.put(record(QStringLiteral("/r/d.txt"), QStringLiteral("f"), {}));

    std::vector<QString> under = table.pathsUnder(QStringLiteral("/r/docs"));
    std::sort(under.begin(), under.end());
    QCOMPARE(static_cast<int>(under.size()), 2);
    QCOMPARE(under[0], QStringLiteral("/r/docs/a.txt"));
    QCOMPARE(under[1], QStringLiteral("/r/docs/sub/b.txt"));

    QCOMPARE(static_cast<int>(table.pathsUnder(QStringLiteral("/r/d.txt")).size()), 1);
    QCOMPARE(static_cast<int>(table.pathsUnder(QStringLiteral("/r")).size()), 4);
    QCOMPARE(static_cast<int>(table.paths().size()), 4);
}

void TestFileRecord::testTakeAndErase()
{
    rw::FileRecordTable table;
    table.put(record(QStringLiteral("/r/a.txt"), QStringLiteral("f1"), {QStringLiteral("id1")}));
    table.put(record(QStringLiteral("/r/b.txt"), QStringLiteral("f2"), {}));

    const auto taken = table.take(QStringLiteral("/r/a.txt"));
    QVERIFY(taken.has_value());
    QCOMPARE(taken->fragmentIds, QStringList{QStringLiteral("id1")});
    QVERIFY(!table.take(QStringLiteral("/r/a.txt")).has_value());

    QVERIFY(table.erase(QStringLiteral("/r/b.txt")));
    QVERIFY(!table.erase(QStringLiteral("/r/b.txt")));
    QCOMPARE(static_cast<int>(table.size()), 0);
}

void TestFileRecord::testFragmentCount()
{
    rw::FileRecordTable table;
    table.put(record(QStringLiteral("/r/a.txt"), QStringLiteral("f1"),
                     {QStringLiteral("1"), QStringLiteral("2"), QStringLiteral("3")}));
    table.put(record(QStringLiteral("/r/b.txt"), QStringLiteral("f2"), {QStringLiteral("4")}));
    table.addPendingIds(QStringLiteral("/r/c.txt"), {QStringLiteral("5")});
    QCOMPARE(static_cast<int>(table.fragmentCount()), 4);

    table.clear();
    QCOMPARE(static_cast<int>(table.size()), 0);
    QCOMPARE(static_cast<int>(table.fragmentCount()), 0);
}

void TestFileRecord::testFingerprintIsSha256Hex()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("a.txt"));
    QVERIFY(writeFile(path, QByteArray("abc")));

    const auto fingerprint = rw::computeFileFingerprint(path);
    QVERIFY(fingerprint.has_value());
    QCOMPARE(*fingerprint,
             QStringLiteral("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));

    QVERIFY(writeFile(path, QByteArray("abd")));
    QVERIFY(*rw::computeFileFingerprint(path) != *fingerprint);
}

void TestFileRecord::testFingerprintMissingFile()
{
    QVERIFY(!rw::computeFileFingerprint(QStringLiteral("/no/such/file.txt")).has_value());
}

QTEST_MAIN(TestFileRecord)
#include "test_file_record.moc"
