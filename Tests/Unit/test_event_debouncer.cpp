#include <QtTest/QtTest>
#include "core/fs/event_debouncer.h"

#include "test_fs_utils.h"

#include <chrono>
#include <mutex>
#include <vector>

namespace {

rw::RawFsEvent raw(rw::RawFsEvent::Kind kind, const std::string& path, uint32_t cookie = 0)
{
    rw::RawFsEvent event;
    event.kind = kind;
    event.path = path;
    event.cookie = cookie;
    return event;
}

// Collects settled events delivered on any thread.
struct Sink {
    std::mutex mutex;
    std::vector<rw::SettledEvent> events;

    rw::EventDebouncer::SettledCallback callback()
    {
        return [this](const rw::SettledEvent& event) {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(event);
        };
    }

    std::vector<rw::SettledEvent> take()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }
};

using Kind = rw::RawFsEvent::Kind;
using Settled = rw::SettledEvent::Kind;

} // namespace

class TestEventDebouncer : public QObject {
    Q_OBJECT

private slots:
    // ── Coalescing ──────────────────────────────────────────
    void testBurstCollapsesToOneChange();
    void testDeleteSettlesAsRemoved();
    void testRecreatedPathSettlesAsChanged();
    void testPairedMoveSettlesAsMoved();
    void testUnpairedMovedFromIsRemoved();
    void testUnpairedMovedToIsChanged();
    void testMoveThenDeleteRemovesBothPaths();
    void testBackupSaveKeepsRecreatedOrigin();
    void testBackupSaveBeforeRewriteKeepsOrigin();
    void testChainedMovesKeepOrigin();
    void testModifyAfterMoveStaysMoved();
    void testPathsSettleIndependently();

    // ── Timing ──────────────────────────────────────────────
    void testSettlesAfterIdleWindow();
    void testNewEventsRearmWindow();
    void testStopDropsPending();
};

// ── Coalescing ──────────────────────────────────────────────

void TestEventDebouncer::testBurstCollapsesToOneChange()
{
    Sink sink;
    rw::EventDebouncer debouncer(std::chrono::milliseconds(1000), sink.callback());

    debouncer.push(raw(Kind::Created, "/r/a.txt"));
    for (int i = 0; i < 5; ++i) {
        debouncer.push(raw(Kind::Modified, "/r/a.txt"));
    }
    QCOMPARE(static_cast<int>(debouncer.pendingCount()), 1);
    QVERIFY(!debouncer.isQuiet());

    debouncer.flush();
    const auto events = sink.take();
    QCOMPARE(static_cast<int>(events.size()), 1);
    QCOMPARE(events[0].kind, Settled::Changed);
    QCOMPARE(events[0].path, std::string("/r/a.txt"));
    QVERIFY(debouncer.isQuiet());
}

void TestEventDebouncer::testDeleteSettlesAsRemoved()
{
    Sink sink;
    rw::EventDebouncer debouncer(std::chrono::milliseconds(1000), sink.callback());
    debouncer.push(raw(Kind::Modified, "/r/a.txt"));
    debouncer.push(raw(Kind::Deleted, "/r/a.txt"));
    debouncer.flush();

    const auto events = sink.take();
    QCOMPARE(static_cast<int>(events.size()), 1);
    QCOMPARE(events[0].kind, Settled::Removed);
}

void TestEventDebouncer::testRecreatedPathSettlesAsChanged()
{
    Sink sink;
    rw::EventDebouncer debouncer(std::chrono::milliseconds(1000), sink.callback());
    debouncer.push(raw(Kind::Created, "/r/tmp.swp"));
    debouncer.push(raw(Kind::Deleted, "/r/tmp.swp"));
    debouncer.push(raw(Kind::Created, "/r/tmp.swp"));
    debouncer.flush();

    const auto events = sink.take();
    QCOMPARE(static_cast<int>(events.size()), 1);
    QCOMPARE(events[0].kind, Settled::Changed);
}

void TestEventDebouncer::testPairedMoveSettlesAsMoved()
{
    Sink sink;
    rw::EventDebouncer debouncer(std::chrono::milliseconds(1000), sink.callback());
    debouncer.push(std::vector<rw::RawFsEvent>{
        raw(Kind::MovedFrom, "/r/old.txt", 7),
        raw(Kind::MovedTo, "/r/new.txt", 7),
    });
    QCOMPARE(static_cast<int>(debouncer.pendingCount()), 1);
    debouncer.flush();

    const auto events = sink.take();
    QCOMPARE(static_cast<int>(events.size()), 1);
    QCOMPARE(events[0].kind, Settled::Moved);
    QCOMPARE(events[0].oldPath, std::string("/r/old.txt"));
    QCOMPARE(events[0].path, std::string("/r/new.txt"));
}

void TestEventDebouncer::testUnpairedMovedFromIsRemoved()
{
    Sink sink;
    rw::EventDebouncer debouncer(std::chrono::milliseconds(1000), sink.callback());
    debouncer.push(raw(Kind::MovedFrom, "/r/gone.txt", 11));
    debouncer.flush();

    const auto events = sink.take();
    QCOMPARE(static_cast<int>(events.size()), 1);
    QCOMPARE(events[0].kind, Settled::Removed);
    QCOMPARE(events[0].path, std::string("/r/gone.txt"));
}

void TestEventDebouncer::testUnpairedMovedToIsChanged()
{
    Sink sink;
    rw::EventDebouncer debouncer(std::chrono::milliseconds(1000), sink.callback());
    debouncer.push(raw(Kind::MovedTo, "/r/arrived.txt", 12));
    debouncer.flush();

    const auto events = sink.take();
    QCOMPARE(static_cast<int>(events.size()), 1);
    QCOMPARE(events[0].kind, Settled::Changed);
    QCOMPARE(events[0].path, std::string("/r/arrived.txt"));
}

void TestEventDebouncer::testMoveThenDeleteRemovesBothPaths()
{
    Sink sink;
    rw::EventDebouncer debouncer(std::chrono::milliseconds(1000), sink.callback());
    debouncer.push(raw(Kind::MovedFrom, "/r/a.txt", 3));
    debouncer.push(raw(Kind::MovedTo, "/r/b.txt", 3));
    debouncer.push(raw(Kind::Deleted, "/r/b.txt"));
    debouncer.flush();

    const auto events = sink.take();
    QCOMPARE(static_cast<int>(events.size()), 2);
    QCOMPARE(events[0].kind, Settled::Removed);
    QCOMPARE(events[0].path, std::string("/r/a.txt"));
    QCOMPARE(events[1].kind, Settled::Removed);
    QCOMPARE(events[1].path, std::string("/r/b.txt"));
}

void TestEventDebouncer::testBackupSaveKeepsRecreatedOrigin()
{
    // Editor save: rename the file to a backup, write it anew, drop the backup.
    Sink sink;
    rw::EventDebouncer debouncer(std::chrono::milliseconds(1000), sink.callback());
    debouncer.push(raw(Kind::MovedFrom, "/r/a.txt", 7));
    debouncer.push(raw(Kind::MovedTo, "/r/a.txt~", 7));
    debouncer.push(raw(Kind::Created, "/r/a.txt"));
    debouncer.push(raw(Kind::Modified, "/r/a.txt"));
    debouncer.push(raw(Kind::Deleted, "/r/a.txt~"));
    debouncer.flush();

    const auto events = sink.take();
    QCOMPARE(static_cast<int>(events.size()), 2);
    QCOMPARE(events[0].kind, Settled::Changed);
    QCOMPARE(events[0].path, std::string("/r/a.txt"));
    QCOMPARE(events[1].kind, Settled::Removed);
    QCOMPARE(events[1].path, std::string("/r/a.txt~"));
}

void TestEventDebouncer::testBackupSaveBeforeRewriteKeepsOrigin()
{
    Sink sink;
    rw::EventDebouncer debouncer(std::chrono::milliseconds(1000), sink.callback());
    debouncer.push(raw(Kind::MovedFrom, "/r/a.txt", 8));
    debouncer.push(raw(Kind::MovedTo, "/r/a.txt~", 8));
    debouncer.push(raw(Kind::Deleted, "/r/a.txt~"));
    debouncer.push(raw(Kind::Created, "/r/a.txt"));
    debouncer.flush();

    const auto events = sink.take();
    QCOMPARE(static_cast<int>(events.size()), 2);
    QCOMPARE(events[0].kind, Settled::Removed);
    QCOMPARE(events[0].path, std::string("/r/a.txt~"));
    QCOMPARE(events[1].kind, Settled::Changed);
    QCOMPARE(events[1].path, std::string("/r/a.txt"));
}

void TestEventDebouncer::testChainedMovesKeepOrigin()
{
    Sink sink;
    rw::EventDebouncer debouncer(std::chrono::milliseconds(1000), sink.callback());
    debouncer.push(raw(Kind::MovedFrom, "/r/a.txt", 1));
    debouncer.push(raw(Kind::MovedTo, "/r/b.txt", 1));
    debouncer.push(raw(Kind::MovedFrom, "/r/b.txt", 2));
    debouncer.push(raw(Kind::MovedTo, "/r/c.txt", 2));
    debouncer.flush();

    const auto events = sink.take();
    QCOMPARE(static_cast<int>(events.size()), 1);
    QCOMPARE(events[0].kind, Settled::Moved);
    QCOMPARE(events[0].oldPath, std::string("/r/a.txt"));
    QCOMPARE(events[0].path, std::string("/r/c.txt"));
}

void TestEventDebouncer::testModifyAfterMoveStaysMoved()
{
    Sink sink;
    rw::EventDebouncer debouncer(std::chrono::milliseconds(1000), sink.callback());
    debouncer.push(raw(Kind::MovedFrom, "/r/a.txt", 9));
    debouncer.push(raw(Kind::MovedTo, "/r/b.txt", 9));
    debouncer.push(raw(Kind::Modified, "/r/b.txt"));
    debouncer.flush();

    const auto events = sink.take();
    QCOMPARE(static_cast<int>(events.size()), 1);
    QCOMPARE(events[0].kind, Settled::Moved);
    QCOMPARE(events[0].oldPath, std::string("/r/a.txt"));
}

void TestEventDebouncer::testPathsSettleIndependently()
{
    Sink sink;
    rw::EventDebouncer debouncer(std::chrono::milliseconds(1000), sink.callback());
    debouncer.push(raw(Kind::Modified, "/r/one.txt"));
    debouncer.push(raw(Kind::Deleted, "/r/two.txt"));
    debouncer.push(raw(Kind::Modified, "/r/three.txt"));
    QCOMPARE(static_cast<int>(debouncer.pendingCount()), 3);
    debouncer.flush();

    const auto events = sink.take();
    QCOMPARE(static_cast<int>(events.size()), 3);
    // Settlement order follows the last event of each path.
    QCOMPARE(events[0].path, std::string("/r/one.txt"));
    QCOMPARE(events[1].path, std::string("/r/two.txt"));
    QCOMPARE(events[1].kind, Settled::Removed);
    QCOMPARE(events[2].path, std::string("/r/three.txt"));
    QCOMPARE(debouncer.settledCount(), static_cast<uint64_t>(3));
}

// ── Timing ──────────────────────────────────────────────────

void TestEventDebouncer::testSettlesAfterIdleWindow()
{
    Sink sink;
    rw::EventDebouncer debouncer(std::chrono::milliseconds(50), sink.callback());
    debouncer.start();

    debouncer.push(raw(Kind::Created, "/r/a.txt"));
    QVERIFY(rw::test::waitUntil([&] { return debouncer.settledCount() == 1; }, 2000));
    QVERIFY(rw::test::waitUntil([&] { return debouncer.isQuiet(); }, 2000));

    const auto events = sink.take();
    QCOMPARE(static_cast<int>(events.size()), 1);
    QCOMPARE(events[0].kind, Settled::Changed);
    debouncer.stop();
}

void TestEventDebouncer::testNewEventsRearmWindow()
{
    Sink sink;
    rw::EventDebouncer debouncer(std::chrono::milliseconds(300), sink.callback());
    debouncer.start();

    for (int i = 0; i < 4; ++i) {
        debouncer.push(raw(Kind::Modified, "/r/busy.txt"));
        QTest::qSleep(100);
    }
    // 400 ms of activity, never 300 ms idle.
    QCOMPARE(debouncer.settledCount(), static_cast<uint64_t>(0));

    QVERIFY(rw::test::waitUntil([&] { return debouncer.settledCount() == 1; }, 3000));
    QCOMPARE(static_cast<int>(sink.take().size()), 1);
    debouncer.stop();
}

void TestEventDebouncer::testStopDropsPending()
{
    Sink sink;
    rw::EventDebouncer debouncer(std::chrono::milliseconds(5000), sink.callback());
    debouncer.start();
    debouncer.push(raw(Kind::Modified, "/r/a.txt"));
    debouncer.stop();

    QCOMPARE(static_cast<int>(debouncer.pendingCount()), 0);
    QVERIFY(sink.take().empty());
}

QTEST_MAIN(TestEventDebouncer)
#include "test_event_debouncer.moc"
