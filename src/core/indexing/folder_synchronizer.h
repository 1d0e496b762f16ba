#pragma once

#include "core/fs/content_filter.h"
#include "core/fs/file_monitor.h"
#include "core/indexing/file_record.h"
#include "core/indexing/indexer.h"
#include "core/indexing/path_state_actor.h"
#include "core/shared/settings.h"
#include "core/shared/types.h"

#include <QString>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace rw {

class EmbeddingProvider;
class EventDebouncer;
class ExtractionManager;
class VectorStore;
class WorkerPool;

// Collaborators shared by every folder. All must outlive the folders.
struct SyncServices {
    VectorStore* store = nullptr;
    EmbeddingProvider* embedder = nullptr;
    ExtractionManager* extractor = nullptr;
    WorkerPool* pool = nullptr;
    FileMonitorFactory monitorFactory;
};

// FolderSynchronizer - keeps one watched root in sync with its collection.
//
// Lifecycle:
//   Initializing -> ScanningExisting -> Watching <-> {Paused, Error} -> Removed
//
// start() runs on a dedicated scan thread: it ensures the collection
// exists, starts the FileMonitor and walks the root, feeding one Sync task
// per accepted file into the shared WorkerPool (the walk blocks when the
// pool's scan backlog is full). Settled events from the EventDebouncer go
// through the PathStateActor, which keeps at most one task per path in
// flight. Tasks that fail with a transient error are parked and the folder
// reports Error until retryFailed() succeeds.
//
// The listener is called from worker, debouncer or scan threads whenever
// the persisted view of the folder may have changed; `urgent` marks scan
// completion and clean/dirty transitions.
class FolderSynchronizer {
public:
    using Listener = std::function<void(const QString& folderId, bool urgent)>;

    FolderSynchronizer(WatchedFolder folder, const Settings& settings,
                       const SyncServices& services, Listener listener = {});
    ~FolderSynchronizer();

    // Non-copyable, non-movable (owns threads that capture this)
    FolderSynchronizer(const FolderSynchronizer&) = delete;
    FolderSynchronizer& operator=(const FolderSynchronizer&) = delete;
    FolderSynchronizer(FolderSynchronizer&&) = delete;
    FolderSynchronizer& operator=(FolderSynchronizer&&) = delete;

    // fullScan = false resumes watching a folder restored clean.
    void start(bool fullScan);

    // Stops monitoring, cancels the scan, drops queued tasks and waits for
    // running ones. Records and the collection are left as they are.
    void stop();

    void pause();
    void resume();

    // Stops everything like stop() and marks the folder Removed. The
    // caller deletes the collection afterwards.
    void beginRemoval();

    // Re-submits parked failed tasks, or re-runs initialization if that
    // is what failed.
    void retryFailed();

    // Rebuilds FileRecords from the store's fragment listing. consistent
    // is set to false when some path has fragments of more than one
    // fingerprint.
    bool rebuildRecords(bool* consistent, QString* error = nullptr);

    // Reports the stored fragment count as totals (restored clean folders).
    void useStoredFragmentCount();

    FolderSnapshot snapshot() const;
    WatchedFolder folder() const;
    FolderStatus status() const;

    // Watching with no scan, no queued or running task and no parked
    // failure: nothing would be lost if the process stopped now.
    bool isClean() const;
    bool isIdle() const;

    // Blocks until isIdle() and no debounced event is pending.
    bool waitForIdle(int timeoutMs);

    const QString& id() const { return m_folder.id; }
    const QString& rootPath() const { return m_folder.rootPath; }
    const QString& collection() const { return m_folder.collection; }
    FileRecordTable& records() { return m_records; }
    Indexer& indexer() { return *m_indexer; }

private:
    void scanThreadMain(bool fullScan);
    bool initialize(QString* error);
    void runWalk();
    void maybeFinishScan();

    void onSettled(const SettledEvent& event);
    void ingest(const PathTask& task, bool blocking);
    void dispatch(const PathStateActor::DispatchTask& dispatch, bool blocking);
    void runTask(const PathStateActor::DispatchTask& dispatch);
    IndexResult execute(const PathStateActor::DispatchTask& dispatch);
    void walkInto(const QString& dirPath);

    void stopScanThread();
    void stopMonitoring();
    void quiesce();
    void notify(bool urgent);

    FolderStatus statusLocked() const;
    int progressLocked() const;
    bool isCleanLocked() const;
    bool isIdleLocked() const;

    WatchedFolder m_folder;
    const Settings m_settings;
    SyncServices m_services;
    Listener m_listener;

    ContentFilter m_filter;
    FileRecordTable m_records;
    PathStateActor m_actor;
    std::unique_ptr<Indexer> m_indexer;
    std::unique_ptr<FileMonitor> m_monitor;
    std::unique_ptr<EventDebouncer> m_debouncer;

    std::thread m_scanThread;
    std::atomic<bool> m_scanCancel{false};
    std::atomic<bool> m_quiescing{false};

    mutable std::mutex m_mutex;
    std::condition_variable m_idleCv;

    // Guarded by m_mutex
    bool m_scanThreadActive = false;
    bool m_lastClean = false;
    bool m_initialized = false;
    bool m_initFailed = false;
    bool m_fullScanPending = true;
    bool m_scanning = false;
    bool m_walkDone = false;
    bool m_paused = false;
    bool m_removed = false;
    size_t m_outstanding = 0;
    uint64_t m_discovered = 0;
    uint64_t m_processed = 0;
    CountType m_countType = CountType::Files;
    std::unordered_set<std::string> m_scanSeen;
    std::unordered_set<std::string> m_scanPending;
    std::unordered_map<std::string, PathTask> m_failed;
    std::unordered_set<std::string> m_extractionErrors;
    QString m_lastError;
};

} // namespace rw
