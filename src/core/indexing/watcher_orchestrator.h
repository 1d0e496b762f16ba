#pragma once

#include "core/fs/file_monitor.h"
#include "core/indexing/folder_synchronizer.h"
#include "core/indexing/worker_pool.h"
#include "core/shared/errors.h"
#include "core/shared/settings.h"
#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <thread>
#include <vector>

namespace rw {

class EmbeddingProvider;
class ExtractionManager;
class VectorStore;

struct WatchFolderResult {
    std::optional<FolderSnapshot> folder;
    std::optional<SyncError> error;

    bool ok() const { return folder.has_value() && !error.has_value(); }
};

// WatcherOrchestrator - registry of watched folders and their lifecycle.
//
// Owns the shared WorkerPool and one FolderSynchronizer per root. The
// registry is guarded by a shared mutex: watchedFolders() only takes it
// shared and reads the folders' latest counters, so it never waits for
// indexing work.
//
// A maintenance thread writes PersistedState into the store's metadata
// records (at most once per persistIntervalMs, immediately on scan
// completion and clean/dirty transitions) and sweeps folders in Error
// every errorSweepIntervalMs.
class WatcherOrchestrator {
public:
    WatcherOrchestrator(const Settings& settings, VectorStore& store,
                        EmbeddingProvider& embedder, ExtractionManager& extractor,
                        FileMonitorFactory monitorFactory = {});
    ~WatcherOrchestrator();

    // Non-copyable, non-movable
    WatcherOrchestrator(const WatcherOrchestrator&) = delete;
    WatcherOrchestrator& operator=(const WatcherOrchestrator&) = delete;
    WatcherOrchestrator(WatcherOrchestrator&&) = delete;
    WatcherOrchestrator& operator=(WatcherOrchestrator&&) = delete;

    // contentTypes: "text", "pdf". Empty means text only.
    WatchFolderResult watchFolder(const QString& path, const QStringList& contentTypes = {});

    // Stops the folder, waits for its in-flight tasks, then deletes its
    // collection. If the deletion fails the folder stays Removed in
    // PersistedState and the sweep retries it.
    SyncResult unwatchFolder(const QString& path);

    SyncResult pauseFolder(const QString& path);
    SyncResult resumeFolder(const QString& path);

    std::vector<FolderSnapshot> watchedFolders() const;

    // Collections of the folders that are not being removed.
    QStringList collections() const;

    // Rebuilds the registry from PersistedState. Call once, before any
    // watchFolder().
    SyncResult restore();

    // Stops every folder and writes PersistedState a last time.
    void shutdown();

    bool waitForIdle(int timeoutMs);

    bool persistNow(QString* error = nullptr);
    void sweepErrors();

    // prefix + "_" + sanitized path, at most kMaxCollectionName characters.
    // Empty when nothing usable remains.
    static QString collectionNameFor(const QString& prefix, const QString& canonicalPath);

    static constexpr int kMaxCollectionName = 64;

private:
    struct Removal {
        WatchedFolder folder;
        std::shared_ptr<FolderSynchronizer> sync;
    };

    std::shared_ptr<FolderSynchronizer> createSynchronizer(WatchedFolder folder);
    std::shared_ptr<FolderSynchronizer> find(const QString& path) const;
    QString uniqueCollectionNameLocked(const QString& canonicalPath) const;
    bool finishRemoval(const QString& path, QString* error);

    void schedulePersist(bool urgent);
    void maintenanceLoop();

    static QString canonicalize(const QString& path);
    static bool isSameOrInside(const QString& path, const QString& root);

    const Settings m_settings;
    VectorStore& m_store;
    EmbeddingProvider& m_embedder;
    ExtractionManager& m_extractor;
    FileMonitorFactory m_monitorFactory;

    WorkerPool m_pool;

    mutable std::shared_mutex m_registryMutex;
    std::map<QString, std::shared_ptr<FolderSynchronizer>> m_folders;  // by canonical root
    std::map<QString, Removal> m_removals;                              // by canonical root

    std::mutex m_persistMutex;  // serializes writes

    std::mutex m_maintenanceMutex;
    std::condition_variable m_maintenanceCv;
    std::thread m_maintenanceThread;
    bool m_stopMaintenance = false;
    bool m_persistDirty = false;
    bool m_persistUrgent = false;
    bool m_shutdown = false;
};

} // namespace rw
