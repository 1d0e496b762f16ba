#include "core/indexing/folder_synchronizer.h"
#include "core/embedding/embedding_provider.h"
#include "core/fs/event_debouncer.h"
#include "core/fs/file_scanner.h"
#include "core/indexing/worker_pool.h"
#include "core/shared/logging.h"
#include "core/vector/vector_store.h"

#include <QFileInfo>

#include <algorithm>
#include <chrono>
#include <exception>
#include <map>
#include <set>

namespace rw {

namespace {

QString toQString(const std::string& path)
{
    return QString::fromStdString(path);
}

WorkItem::Type workTypeFor(const PathTask& task)
{
    switch (task.kind) {
    case PathTask::Kind::Remove:
        return WorkItem::Type::Remove;
    case PathTask::Kind::Move:
        return WorkItem::Type::Move;
    case PathTask::Kind::Sync:
        return task.fromScan ? WorkItem::Type::ScanFile : WorkItem::Type::Sync;
    }
    return WorkItem::Type::Sync;
}

IndexerConfig indexerConfigFor(const WatchedFolder& folder, const Settings& settings)
{
    IndexerConfig config;
    config.collection = folder.collection;
    config.chunker.sizeWords = settings.chunkSizeWords;
    config.chunker.overlapRatio = settings.chunkOverlapRatio;
    config.minContentChars = settings.minContentChars;
    config.previewChars = settings.previewChars;
    config.retry.baseDelayMs = settings.retryBaseDelayMs;
    config.retry.maxDelayMs = settings.retryMaxDelayMs;
    config.retry.maxAttempts = settings.retryMaxAttempts;
    return config;
}

} // namespace

// ── Construction ────────────────────────────────────────────

FolderSynchronizer::FolderSynchronizer(WatchedFolder folder, const Settings& settings,
                                       const SyncServices& services, Listener listener)
    : m_folder(std::move(folder))
    , m_settings(settings)
    , m_services(services)
    , m_listener(std::move(listener))
    , m_filter(m_folder.categories, settings.maxFileSize)
{
    if (!m_services.monitorFactory) {
        m_services.monitorFactory = [] { return createPlatformFileMonitor(); };
    }
    m_indexer = std::make_unique<Indexer>(*m_services.store, *m_services.embedder,
                                          *m_services.extractor, m_filter, m_records,
                                          indexerConfigFor(m_folder, settings));
    m_debouncer = std::make_unique<EventDebouncer>(
        std::chrono::milliseconds(std::max(0, settings.debounceMs)),
        [this](const SettledEvent& event) { onSettled(event); });
}

FolderSynchronizer::~FolderSynchronizer()
{
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────

void FolderSynchronizer::start(bool fullScan)
{
    stopScanThread();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_removed) {
            return;
        }
        m_fullScanPending = fullScan;
        m_scanThreadActive = true;
    }
    m_scanCancel.store(false);
    m_scanThread = std::thread([this, fullScan] { scanThreadMain(fullScan); });
}

void FolderSynchronizer::stop()
{
    const bool hadBacklog = !m_debouncer->isQuiet() || !isIdle();
    stopMonitoring();
    quiesce();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (hadBacklog) {
            m_fullScanPending = true;
        }
    }
}

void FolderSynchronizer::pause()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_paused || m_removed) {
            return;
        }
        m_paused = true;
    }
    LOG_INFO(rwIndex, "Folder paused: %s", qUtf8Printable(m_folder.rootPath));
    quiesce();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        // Settled events are discarded while paused; the resume scan
        // catches up with the disk.
        m_failed.clear();
        m_fullScanPending = true;
    }
    notify(true);
}

void FolderSynchronizer::resume()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_paused || m_removed) {
            return;
        }
        m_paused = false;
    }
    LOG_INFO(rwIndex, "Folder resumed: %s", qUtf8Printable(m_folder.rootPath));
    start(true);
    notify(true);
}

void FolderSynchronizer::beginRemoval()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_removed = true;
    }
    LOG_INFO(rwIndex, "Folder removal started: %s", qUtf8Printable(m_folder.rootPath));
    stopMonitoring();
    quiesce();
    m_records.clear();
    notify(true);
}

void FolderSynchronizer::retryFailed()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_removed || m_paused || m_scanThreadActive) {
            return;
        }
    }

    if (!QFileInfo(m_folder.rootPath).isDir()) {
        bool changed = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_initFailed) {
                m_initFailed = true;
                m_fullScanPending = true;
                m_lastError = QStringLiteral("watched root no longer exists");
                changed = true;
            }
        }
        if (changed) {
            LOG_WARN(rwIndex, "Watched root disappeared: %s", qUtf8Printable(m_folder.rootPath));
            stopMonitoring();
            notify(true);
        }
        return;
    }

    bool reinitialize = false;
    bool fullScan = false;
    std::vector<PathTask> tasks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        reinitialize = m_initFailed;
        fullScan = m_fullScanPending;
        if (!reinitialize) {
            for (auto& [_, task] : m_failed) {
                task.fromScan = false;
                tasks.push_back(task);
            }
            m_failed.clear();
        }
    }

    if (reinitialize) {
        LOG_INFO(rwIndex, "Retrying initialization of %s", qUtf8Printable(m_folder.rootPath));
        start(fullScan);
        return;
    }

    if (!tasks.empty()) {
        LOG_INFO(rwIndex, "Retrying %d failed tasks in %s", static_cast<int>(tasks.size()),
                 qUtf8Printable(m_folder.rootPath));
    }
    for (const PathTask& task : tasks) {
        ingest(task, false);
    }
    notify(!tasks.empty());
}

// ── Initialization and scan ─────────────────────────────────

bool FolderSynchronizer::initialize(QString* error)
{
    if (!QFileInfo(m_folder.rootPath).isDir()) {
        *error = QStringLiteral("watched root does not exist: %1").arg(m_folder.rootPath);
        return false;
    }

    const int dims = m_services.embedder->dimensions();
    const bool created = m_indexer->withRetry("create collection", m_folder.rootPath,
        [&](QString* err) {
            return m_services.store->createCollection(m_folder.collection, dims,
                                                      VectorStore::Metric::Cosine, err);
        }, error);
    if (!created) {
        return false;
    }

    m_debouncer->start();
    if (!m_monitor || !m_monitor->isRunning()) {
        m_monitor = m_services.monitorFactory();
        if (!m_monitor) {
            *error = QStringLiteral("no file monitor available");
            return false;
        }
        EventDebouncer* debouncer = m_debouncer.get();
        if (!m_monitor->start(m_folder.rootPath.toStdString(),
                              [debouncer](const std::vector<RawFsEvent>& events) {
                                  debouncer->push(events);
                              })) {
            *error = QStringLiteral("failed to start file monitor on %1").arg(m_folder.rootPath);
            return false;
        }
    }
    return true;
}

void FolderSynchronizer::scanThreadMain(bool fullScan)
{
    QString error;
    const bool ok = initialize(&error);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_initFailed = !ok;
        if (ok) {
            m_initialized = true;
        } else {
            m_lastError = error;
        }
    }

    if (!ok) {
        LOG_ERROR(rwIndex, "Initialization failed for %s: %s",
                  qUtf8Printable(m_folder.rootPath), qUtf8Printable(error));
    } else if (fullScan && !m_scanCancel.load()) {
        runWalk();
    } else if (!fullScan) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_fullScanPending = false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_scanThreadActive = false;
        m_lastClean = isCleanLocked();
    }
    m_idleCv.notify_all();
    notify(true);
}

void FolderSynchronizer::runWalk()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_scanning = true;
        m_walkDone = false;
        m_scanSeen.clear();
        m_scanPending.clear();
        m_discovered = 0;
        m_processed = 0;
        m_countType = CountType::Files;
    }
    notify(true);
    LOG_INFO(rwIndex, "Scanning %s", qUtf8Printable(m_folder.rootPath));

    FileScanner scanner(m_filter);
    const FileScanner::ScanStats stats = scanner.scanDirectory(
        m_folder.rootPath.toStdString(),
        [this](const std::string& filePath) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_scanSeen.insert(filePath);
                if (m_scanPending.insert(filePath).second) {
                    ++m_discovered;
                }
            }
            PathTask task;
            task.kind = PathTask::Kind::Sync;
            task.path = filePath;
            task.fromScan = true;
            ingest(task, true);
            return !m_scanCancel.load();
        },
        &m_scanCancel);

    if (!stats.completed) {
        // Stays ScanningExisting so a restart or resume scans again.
        LOG_INFO(rwIndex, "Scan of %s interrupted after %llu files",
                 qUtf8Printable(m_folder.rootPath),
                 static_cast<unsigned long long>(stats.acceptedFiles));
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_walkDone = true;
        m_fullScanPending = false;
    }
    LOG_INFO(rwIndex, "Walk of %s done: %llu files accepted, %llu entries excluded",
             qUtf8Printable(m_folder.rootPath),
             static_cast<unsigned long long>(stats.acceptedFiles),
             static_cast<unsigned long long>(stats.excludedEntries));
    maybeFinishScan();
}

void FolderSynchronizer::maybeFinishScan()
{
    std::vector<std::string> orphans;
    uint64_t discovered = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_scanning || !m_walkDone || !m_scanPending.empty() || m_quiescing.load()) {
            return;
        }
        m_scanning = false;
        discovered = m_discovered;
        for (const QString& path : m_records.paths()) {
            const std::string key = path.toStdString();
            if (m_scanSeen.count(key) == 0) {
                orphans.push_back(key);
            }
        }
        m_scanSeen.clear();
    }

    // Records the walk did not see belong to files that vanished while
    // nobody was watching. A Sync on a missing path removes it.
    for (const std::string& path : orphans) {
        PathTask task;
        task.kind = PathTask::Kind::Sync;
        task.path = path;
        ingest(task, false);
    }

    LOG_INFO(rwIndex, "Scan of %s complete: %llu files, %d orphaned records",
             qUtf8Printable(m_folder.rootPath), static_cast<unsigned long long>(discovered),
             static_cast<int>(orphans.size()));
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lastClean = isCleanLocked();
    }
    m_idleCv.notify_all();
    notify(true);
}

// ── Events ──────────────────────────────────────────────────

void FolderSynchronizer::onSettled(const SettledEvent& event)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_paused || m_removed) {
            return;
        }
    }
    if (m_quiescing.load()) {
        return;
    }

    const std::string root = m_folder.rootPath.toStdString();
    if (event.path == root) {
        if (event.kind == SettledEvent::Kind::Changed && event.isDirectory) {
            // Queue overflow or root re-created: the event stream has gaps.
            bool scanning = false;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                scanning = m_scanning || m_scanThreadActive;
            }
            if (!scanning) {
                LOG_WARN(rwIndex, "Event stream for %s lost events, rescanning",
                         qUtf8Printable(m_folder.rootPath));
                start(true);
            }
        }
        return;
    }

    auto excluded = [this](const std::string& path, bool isDirectory) {
        const QString qpath = toQString(path);
        if (m_filter.isInsideExcludedDirectory(m_folder.rootPath, qpath)) {
            return true;
        }
        return isDirectory && m_filter.isExcludedDirectory(QFileInfo(qpath).fileName());
    };

    PathTask task;
    task.path = event.path;
    task.isDirectory = event.isDirectory;

    switch (event.kind) {
    case SettledEvent::Kind::Changed:
        if (excluded(event.path, event.isDirectory)) {
            return;
        }
        task.kind = PathTask::Kind::Sync;
        break;
    case SettledEvent::Kind::Removed:
        if (excluded(event.path, event.isDirectory)) {
            return;
        }
        task.kind = PathTask::Kind::Remove;
        break;
    case SettledEvent::Kind::Moved: {
        const bool fromExcluded = excluded(event.oldPath, event.isDirectory);
        const bool toExcluded = excluded(event.path, event.isDirectory);
        if (fromExcluded && toExcluded) {
            return;
        }
        if (fromExcluded) {
            task.kind = PathTask::Kind::Sync;
        } else if (toExcluded) {
            task.kind = PathTask::Kind::Remove;
            task.path = event.oldPath;
        } else {
            task.kind = PathTask::Kind::Move;
            task.path = event.oldPath;
            task.newPath = event.path;
        }
        break;
    }
    }

    ingest(task, false);

    // A folder with work in flight must not stay persisted as clean.
    bool becameDirty = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const bool clean = isCleanLocked();
        becameDirty = m_lastClean && !clean;
        m_lastClean = clean;
    }
    notify(becameDirty);
}

// ── Dispatch ────────────────────────────────────────────────

void FolderSynchronizer::ingest(const PathTask& task, bool blocking)
{
    std::optional<PathStateActor::DispatchTask> dispatchTask = m_actor.onIngress(task);
    if (dispatchTask.has_value()) {
        dispatch(dispatchTask.value(), blocking);
    }
}

void FolderSynchronizer::dispatch(const PathStateActor::DispatchTask& dispatchTask, bool blocking)
{
    if (m_quiescing.load()) {
        // The actor is reset once the folder has quiesced.
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_outstanding;
    }

    WorkItem item;
    item.type = workTypeFor(dispatchTask.task);
    item.filePath = dispatchTask.task.path;
    item.folderId = m_folder.id;
    item.run = [this, dispatchTask] { runTask(dispatchTask); };

    WorkQueue& queue = m_services.pool->queue();
    const bool queued = blocking ? queue.enqueueBlocking(std::move(item), &m_scanCancel)
                                 : queue.enqueue(std::move(item));
    if (!queued) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_outstanding;
        }
        m_idleCv.notify_all();
    }
}

void FolderSynchronizer::runTask(const PathStateActor::DispatchTask& dispatchTask)
{
    const std::string& key = dispatchTask.task.path;
    const bool skipped = m_quiescing.load();

    IndexResult result;
    if (!skipped) {
        try {
            result = execute(dispatchTask);
        } catch (const std::exception& e) {
            result.status = IndexResult::Status::StoreFailed;
            result.errorMessage = QString::fromUtf8(e.what());
            LOG_ERROR(rwIndex, "Task for %s threw: %s", key.c_str(), e.what());
        }
    }

    const bool interrupted = skipped || m_quiescing.load();
    if (!skipped) {
        std::lock_guard<std::mutex> lock(m_mutex);
        const bool superseded = result.status == IndexResult::Status::Superseded;
        if (!superseded && m_scanPending.erase(key) > 0) {
            ++m_processed;
        }
        if (result.isTransientFailure()) {
            if (interrupted) {
                m_fullScanPending = true;
            } else {
                m_failed[key] = dispatchTask.task;
                m_lastError = result.errorMessage;
            }
        } else if (!superseded) {
            m_failed.erase(key);
        }
        if (result.status == IndexResult::Status::ExtractionFailed) {
            m_extractionErrors.insert(key);
        } else if (!superseded && !result.isTransientFailure()) {
            m_extractionErrors.erase(key);
        }
    }

    if (!skipped) {
        if (result.status == IndexResult::Status::ExtractionFailed) {
            LOG_WARN(rwIndex, "Skipped %s: %s", key.c_str(), qUtf8Printable(result.errorMessage));
        } else if (result.isTransientFailure()) {
            LOG_ERROR(rwIndex, "%s for %s: %s", indexStatusName(result.status), key.c_str(),
                      qUtf8Printable(result.errorMessage));
        }
    }

    if (!interrupted) {
        if (result.status == IndexResult::Status::Superseded) {
            // Queued behind this task; merges with the newer event if any.
            PathTask followUp;
            followUp.kind = PathTask::Kind::Sync;
            followUp.path = key;
            ingest(followUp, false);
        } else if (result.status == IndexResult::Status::Renamed) {
            const QString newPath = toQString(dispatchTask.task.newPath);
            const QFileInfo info(newPath);
            if (info.isDir() && !info.isSymLink()) {
                walkInto(newPath);
            } else {
                PathTask resync;
                resync.kind = PathTask::Kind::Sync;
                resync.path = dispatchTask.task.newPath;
                ingest(resync, false);
            }
        }
    }

    std::optional<PathStateActor::DispatchTask> next = m_actor.onTaskCompleted(key);
    if (next.has_value() && !m_quiescing.load()) {
        dispatch(next.value(), false);
    }

    bool cleanChanged = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        --m_outstanding;
        const bool clean = isCleanLocked();
        cleanChanged = clean != m_lastClean;
        m_lastClean = clean;
    }
    m_idleCv.notify_all();

    if (!interrupted) {
        maybeFinishScan();
        notify(cleanChanged);
    }
}

IndexResult FolderSynchronizer::execute(const PathStateActor::DispatchTask& dispatchTask)
{
    const PathTask& task = dispatchTask.task;
    const QString path = toQString(task.path);

    switch (task.kind) {
    case PathTask::Kind::Remove: {
        if (QFileInfo::exists(path)) {
            // Re-created after the removal settled.
            PathStateActor::DispatchTask asSync = dispatchTask;
            asSync.task.kind = PathTask::Kind::Sync;
            return execute(asSync);
        }
        // In-flight syncs below a removed or moved directory must not commit.
        m_actor.bumpGenerationsUnder(task.path);
        return m_indexer->removePath(path);
    }

    case PathTask::Kind::Move:
        m_actor.bumpGenerationsUnder(task.path);
        return m_indexer->renamePath(path, toQString(task.newPath));

    case PathTask::Kind::Sync: {
        const QFileInfo info(path);
        if (info.isDir() && !info.isSymLink()) {
            IndexResult result;
            result.path = path;
            result.status = IndexResult::Status::Filtered;
            if (m_records.get(path).has_value()) {
                // A file replaced by a directory of the same name.
                result = m_indexer->removePath(path, false);
            }
            for (const QString& recordPath : m_records.pathsUnder(path)) {
                if (recordPath != path && !QFileInfo::exists(recordPath)) {
                    PathTask gone;
                    gone.kind = PathTask::Kind::Sync;
                    gone.path = recordPath.toStdString();
                    ingest(gone, false);
                }
            }
            walkInto(path);
            return result;
        }
        const uint64_t generation = dispatchTask.generation;
        return m_indexer->syncFile(path, [this, &task, generation] {
            return m_quiescing.load() || m_actor.isStale(task.path, generation);
        });
    }
    }

    return IndexResult{};
}

void FolderSynchronizer::walkInto(const QString& dirPath)
{
    FileScanner scanner(m_filter);
    scanner.scanDirectory(dirPath.toStdString(), [this](const std::string& filePath) {
        PathTask task;
        task.kind = PathTask::Kind::Sync;
        task.path = filePath;
        ingest(task, false);
        return !m_quiescing.load();
    });
}

// ── Quiescing ───────────────────────────────────────────────

void FolderSynchronizer::stopScanThread()
{
    m_scanCancel.store(true);
    if (m_scanThread.joinable()) {
        m_scanThread.join();
    }
}

void FolderSynchronizer::stopMonitoring()
{
    if (m_monitor) {
        m_monitor->stop();
    }
    m_debouncer->stop();
}

void FolderSynchronizer::quiesce()
{
    m_quiescing.store(true);
    m_indexer->cancel();
    stopScanThread();

    WorkQueue& queue = m_services.pool->queue();
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (true) {
            lock.unlock();
            const size_t dropped = queue.dropFolder(m_folder.id);
            lock.lock();
            m_outstanding -= std::min(dropped, m_outstanding);
            if (m_outstanding == 0) {
                break;
            }
            m_idleCv.wait_for(lock, std::chrono::milliseconds(50));
        }
        m_scanPending.clear();
        m_scanSeen.clear();
        m_scanThreadActive = false;
    }

    m_actor.reset();
    m_indexer->resetCancel();
    m_quiescing.store(false);
    m_idleCv.notify_all();
}

void FolderSynchronizer::notify(bool urgent)
{
    if (m_listener) {
        m_listener(m_folder.id, urgent);
    }
}

// ── Records ─────────────────────────────────────────────────

bool FolderSynchronizer::rebuildRecords(bool* consistent, QString* error)
{
    std::vector<FragmentListing> listing;
    if (!m_services.store->listFragments(m_folder.collection, &listing, error)) {
        return false;
    }

    std::map<QString, std::vector<FragmentListing>> byPath;
    for (FragmentListing& fragment : listing) {
        byPath[fragment.path].push_back(std::move(fragment));
    }

    bool allConsistent = true;
    m_records.clear();
    for (auto& [path, fragments] : byPath) {
        std::sort(fragments.begin(), fragments.end(),
                  [](const FragmentListing& a, const FragmentListing& b) {
                      return a.chunkIndex < b.chunkIndex;
                  });
        std::set<QString> fingerprints;
        QStringList ids;
        for (const FragmentListing& fragment : fragments) {
            fingerprints.insert(fragment.fingerprint);
            ids.append(fragment.id);
        }

        FileRecord record;
        record.path = path;
        if (fingerprints.size() == 1) {
            record.syncedFingerprint = *fingerprints.begin();
            record.fragmentIds = ids;
        } else {
            // Interrupted commit: nothing is trusted, the next sync
            // replaces every fragment of the path.
            record.pendingIds = ids;
            allConsistent = false;
        }
        m_records.put(std::move(record));
    }

    if (consistent) {
        *consistent = allConsistent;
    }
    LOG_INFO(rwIndex, "Rebuilt %d records (%d fragments) for %s",
             static_cast<int>(byPath.size()), static_cast<int>(listing.size()),
             qUtf8Printable(m_folder.rootPath));
    return true;
}

void FolderSynchronizer::useStoredFragmentCount()
{
    int64_t count = 0;
    QString error;
    if (!m_services.store->countFragments(m_folder.collection, &count, &error)) {
        LOG_WARN(rwIndex, "Cannot count fragments of %s: %s",
                 qUtf8Printable(m_folder.collection), qUtf8Printable(error));
        count = static_cast<int64_t>(m_records.fragmentCount());
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_countType = CountType::Chunks;
    m_discovered = static_cast<uint64_t>(count);
    m_processed = static_cast<uint64_t>(count);
}

// ── Status ──────────────────────────────────────────────────

FolderStatus FolderSynchronizer::statusLocked() const
{
    if (m_removed) {
        return FolderStatus::Removed;
    }
    if (m_paused) {
        return FolderStatus::Paused;
    }
    if (m_initFailed || !m_failed.empty()) {
        return FolderStatus::Error;
    }
    if (!m_initialized) {
        return FolderStatus::Initializing;
    }
    if (m_scanning) {
        return FolderStatus::ScanningExisting;
    }
    return FolderStatus::Watching;
}

int FolderSynchronizer::progressLocked() const
{
    if (!m_initialized) {
        return 0;
    }
    if (!m_scanning && m_outstanding == 0) {
        return 100;
    }
    if (m_discovered == 0) {
        return 0;
    }
    const uint64_t percent = (m_processed * 100) / m_discovered;
    return static_cast<int>(std::min<uint64_t>(99, percent));
}

bool FolderSynchronizer::isCleanLocked() const
{
    return statusLocked() == FolderStatus::Watching && m_outstanding == 0
           && !m_fullScanPending && !m_scanThreadActive;
}

bool FolderSynchronizer::isIdleLocked() const
{
    return m_outstanding == 0 && !m_scanThreadActive && (!m_scanning || m_paused);
}

FolderSnapshot FolderSynchronizer::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    FolderSnapshot s;
    s.id = m_folder.id;
    s.path = m_folder.rootPath;
    s.collection = m_folder.collection;
    s.categories = m_folder.categories;
    s.status = statusLocked();
    s.progressPercent = progressLocked();
    s.totalFiles = m_discovered;
    s.processedFiles = m_processed;
    s.countType = m_countType;
    s.errorCount = static_cast<int>(m_extractionErrors.size() + m_failed.size());
    s.createdAtMs = m_folder.createdAtMs;
    return s;
}

WatchedFolder FolderSynchronizer::folder() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    WatchedFolder f = m_folder;
    f.status = statusLocked();
    f.progressPercent = progressLocked();
    return f;
}

FolderStatus FolderSynchronizer::status() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return statusLocked();
}

bool FolderSynchronizer::isClean() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return isCleanLocked();
}

bool FolderSynchronizer::isIdle() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return isIdleLocked();
}

bool FolderSynchronizer::waitForIdle(int timeoutMs)
{
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    std::unique_lock<std::mutex> lock(m_mutex);
    while (true) {
        if (isIdleLocked()) {
            lock.unlock();
            const bool quiet = m_debouncer->isQuiet();
            lock.lock();
            // Delivery of a settled event may have dispatched work meanwhile.
            if (quiet && isIdleLocked()) {
                return true;
            }
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        m_idleCv.wait_for(lock, std::chrono::milliseconds(20));
    }
}

} // namespace rw
