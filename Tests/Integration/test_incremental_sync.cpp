#include <QtTest/QtTest>
#include "core/extraction/extraction_manager.h"
#include "core/fs/fingerprint.h"
#include "core/indexing/watcher_orchestrator.h"
#include "core/query/semantic_search.h"
#include "core/vector/sqlite_vector_store.h"

#include "fake_providers.h"
#include "test_fs_utils.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <memory>

namespace {

constexpr int kTimeoutMs = 15000;

// Real inotify monitor and SQLite store; only the embedding model is fake.
class Harness {
public:
    Harness()
    {
        root = QFileInfo(dir.path()).canonicalFilePath() + QStringLiteral("/notes");
        QDir().mkpath(root);
        dbPath = QFileInfo(dir.path()).canonicalFilePath() + QStringLiteral("/index.db");
        settings.debounceMs = 50;
        settings.workerCount = 2;
        settings.retryBaseDelayMs = 1;
        settings.retryMaxDelayMs = 4;
        settings.persistIntervalMs = 20;
    }

    ~Harness()
    {
        orchestrator.reset();
        store.reset();
    }

    bool open()
    {
        orchestrator.reset();
        store.reset();
        QString error;
        store = rw::SqliteVectorStore::open(dbPath, &error);
        if (!store) {
            qWarning("cannot open store: %s", qUtf8Printable(error));
            return false;
        }
        orchestrator = std::make_unique<rw::WatcherOrchestrator>(settings, *store, embedder,
                                                                 extractor);
        return true;
    }

    QString path(const QString& relative) const { return root + QLatin1Char('/') + relative; }

    std::vector<rw::FragmentListing> fragmentsOf(const QString& filePath) const
    {
        std::vector<rw::FragmentListing> all;
        std::vector<rw::FragmentListing> matching;
        if (!store->listFragments(collection, &all)) {
            return matching;
        }
        for (const rw::FragmentListing& fragment : all) {
            if (fragment.path == filePath) {
                matching.push_back(fragment);
            }
        }
        return matching;
    }

    int64_t fragmentCount() const
    {
        int64_t count = 0;
        if (!store->countFragments(collection, &count)) {
            return -1;
        }
        return count;
    }

    QTemporaryDir dir;
    QString root;
    QString dbPath;
    QString collection;
    rw::Settings settings;
    rw::test::FakeEmbeddingProvider embedder{64};
    rw::ExtractionManager extractor;
    std::unique_ptr<rw::SqliteVectorStore> store;
    std::unique_ptr<rw::WatcherOrchestrator> orchestrator;
};

QStringList idsOf(const std::vector<rw::FragmentListing>& fragments)
{
    QStringList ids;
    for (const rw::FragmentListing& fragment : fragments) {
        ids.append(fragment.id);
    }
    ids.sort();
    return ids;
}

} // namespace

class TestIncrementalSync : public QObject {
    Q_OBJECT

private slots:
    void testLiveChangesReachTheIndex();
    void testRestartResumesWithoutReembedding();
};

void TestIncrementalSync::testLiveChangesReachTheIndex()
{
    Harness h;
    QVERIFY(h.dir.isValid());
    const QString notes = h.path(QStringLiteral("notes.txt"));
    QVERIFY(rw::test::writeTextFile(notes, rw::test::numberedWords(300)));
    QVERIFY(h.open());

    const rw::WatchFolderResult watched = h.orchestrator->watchFolder(h.root);
    QVERIFY(watched.ok());
    h.collection = watched.folder->collection;
    QVERIFY(h.orchestrator->waitForIdle(kTimeoutMs));
    QCOMPARE(h.fragmentCount(), static_cast<int64_t>(3));

    // Created
    const QString fruit = h.path(QStringLiteral("drafts/fruit.md"));
    const QString fruitText = rw::test::numberedWords(30, QStringLiteral("banana"));
    QVERIFY(rw::test::writeTextFile(fruit, fruitText));
    QVERIFY(rw::test::waitUntil([&] { return h.fragmentsOf(fruit).size() == 1; }, kTimeoutMs));

    // Modified: the old fragment set is replaced.
    const QStringList before = idsOf(h.fragmentsOf(notes));
    QVERIFY(rw::test::writeTextFile(notes, rw::test::numberedWords(160, QStringLiteral("edit"))));
    const auto fingerprint = rw::computeFileFingerprint(notes);
    QVERIFY(fingerprint.has_value());
    QVERIFY(rw::test::waitUntil([&] {
        const auto fragments = h.fragmentsOf(notes);
        if (fragments.size() != 2) {
            return false;
        }
        for (const rw::FragmentListing& fragment : fragments) {
            if (fragment.fingerprint != fingerprint.value()) {
                return false;
            }
        }
        return true;
    }, kTimeoutMs));
    for (const QString& id : idsOf(h.fragmentsOf(notes))) {
        QVERIFY(!before.contains(id));
    }

    // Renamed: same fragments under the new path.
    const QStringList fruitIds = idsOf(h.fragmentsOf(fruit));
    const QString renamed = h.path(QStringLiteral("drafts/orchard.md"));
    QVERIFY(QFile::rename(fruit, renamed));
    QVERIFY(rw::test::waitUntil([&] {
        return h.fragmentsOf(fruit).empty() && h.fragmentsOf(renamed).size() == 1;
    }, kTimeoutMs));
    QCOMPARE(idsOf(h.fragmentsOf(renamed)), fruitIds);

    // Deleted
    QVERIFY(QFile::remove(notes));
    QVERIFY(rw::test::waitUntil([&] { return h.fragmentsOf(notes).empty(); }, kTimeoutMs));
    QVERIFY(h.orchestrator->waitForIdle(kTimeoutMs));
    QCOMPARE(h.fragmentCount(), static_cast<int64_t>(1));

    rw::SemanticSearch search(*h.store, h.embedder, nullptr);
    const rw::SearchOutcome outcome = search.search(fruitText, h.orchestrator->collections(), 3);
    QVERIFY(outcome.ok());
    QVERIFY(!outcome.hits.empty());
    QCOMPARE(outcome.hits.front().path, renamed);

    const rw::FolderSnapshot folder = h.orchestrator->watchedFolders().front();
    QCOMPARE(folder.status, rw::FolderStatus::Watching);
    QCOMPARE(folder.errorCount, 0);
}

void TestIncrementalSync::testRestartResumesWithoutReembedding()
{
    Harness h;
    QVERIFY(h.dir.isValid());
    QVERIFY(rw::test::writeTextFile(h.path(QStringLiteral("a.txt")),
                                    rw::test::numberedWords(300)));
    QVERIFY(rw::test::writeTextFile(h.path(QStringLiteral("b.txt")),
                                    rw::test::numberedWords(40, QStringLiteral("b"))));
    QVERIFY(h.open());

    const rw::WatchFolderResult watched = h.orchestrator->watchFolder(h.root);
    QVERIFY(watched.ok());
    h.collection = watched.folder->collection;
    QVERIFY(h.orchestrator->waitForIdle(kTimeoutMs));
    QCOMPARE(h.fragmentCount(), static_cast<int64_t>(4));
    h.orchestrator->shutdown();
    const int embedCalls = h.embedder.passageCalls();

    QVERIFY(h.open());
    QVERIFY(h.orchestrator->restore().ok());
    QVERIFY(h.orchestrator->waitForIdle(kTimeoutMs));
    QCOMPARE(h.embedder.passageCalls(), embedCalls);

    const std::vector<rw::FolderSnapshot> folders = h.orchestrator->watchedFolders();
    QCOMPARE(static_cast<int>(folders.size()), 1);
    QCOMPARE(folders.front().id, watched.folder->id);
    QCOMPARE(folders.front().countType, rw::CountType::Chunks);
    QCOMPARE(folders.front().totalFiles, static_cast<uint64_t>(4));

    // Watching again after the restart.
    const QString later = h.path(QStringLiteral("later.txt"));
    QVERIFY(rw::test::writeTextFile(later, rw::test::numberedWords(20, QStringLiteral("l"))));
    QVERIFY(rw::test::waitUntil([&] { return h.fragmentsOf(later).size() == 1; }, kTimeoutMs));
}

QTEST_MAIN(TestIncrementalSync)
#include "test_incremental_sync.moc"
