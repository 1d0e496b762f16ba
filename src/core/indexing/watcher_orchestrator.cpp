#include "core/indexing/watcher_orchestrator.h"
#include "core/indexing/persisted_state.h"
#include "core/shared/logging.h"
#include "core/vector/vector_store.h"

#include <QCryptographicHash>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>
#include <QUuid>

#include <algorithm>

namespace rw {

namespace {

SyncResult notWatched(const QString& path)
{
    return SyncResult::failure(SyncError::Code::NotWatched,
                               QStringLiteral("folder is not watched: %1").arg(path));
}

WatchFolderResult watchFailure(SyncError::Code code, const QString& message)
{
    WatchFolderResult result;
    result.error = SyncError{code, message};
    return result;
}

} // namespace

// ── Construction ────────────────────────────────────────────

WatcherOrchestrator::WatcherOrchestrator(const Settings& settings, VectorStore& store,
                                         EmbeddingProvider& embedder,
                                         ExtractionManager& extractor,
                                         FileMonitorFactory monitorFactory)
    : m_settings(settings)
    , m_store(store)
    , m_embedder(embedder)
    , m_extractor(extractor)
    , m_monitorFactory(std::move(monitorFactory))
    , m_pool(static_cast<size_t>(std::max(1, settings.workerCount)),
             static_cast<size_t>(std::max(1, settings.queueDepth)))
{
    if (!m_monitorFactory) {
        m_monitorFactory = createPlatformFileMonitor;
    }
    m_pool.start();
    m_maintenanceThread = std::thread([this] { maintenanceLoop(); });
}

WatcherOrchestrator::~WatcherOrchestrator()
{
    shutdown();
}

std::shared_ptr<FolderSynchronizer> WatcherOrchestrator::createSynchronizer(WatchedFolder folder)
{
    SyncServices services;
    services.store = &m_store;
    services.embedder = &m_embedder;
    services.extractor = &m_extractor;
    services.pool = &m_pool;
    services.monitorFactory = m_monitorFactory;
    return std::make_shared<FolderSynchronizer>(
        std::move(folder), m_settings, services,
        [this](const QString&, bool urgent) { schedulePersist(urgent); });
}

// ── Paths and names ─────────────────────────────────────────

QString WatcherOrchestrator::canonicalize(const QString& path)
{
    const QFileInfo info(path);
    const QString canonical = info.canonicalFilePath();
    if (!canonical.isEmpty()) {
        return canonical;
    }
    // Root already gone (unwatch after deletion).
    return QDir::cleanPath(info.absoluteFilePath());
}

bool WatcherOrchestrator::isSameOrInside(const QString& path, const QString& root)
{
    if (path == root) {
        return true;
    }
    const QString prefix = root.endsWith(QLatin1Char('/')) ? root : root + QLatin1Char('/');
    return path.startsWith(prefix);
}

QString WatcherOrchestrator::collectionNameFor(const QString& prefix, const QString& canonicalPath)
{
    static const QRegularExpression kInvalidChars(QStringLiteral("[^A-Za-z0-9_.-]"));
    static const QRegularExpression kUnderscoreRuns(QStringLiteral("_+"));
    static const QRegularExpression kTrim(QStringLiteral("^[_.-]+|[_.-]+$"));

    QString path = canonicalPath;
    path.remove(QLatin1Char(':'));
    path.replace(QLatin1Char('/'), QLatin1Char('_'));
    path.replace(QLatin1Char('\\'), QLatin1Char('_'));

    QString name = prefix + QLatin1Char('_') + path;
    name.replace(kInvalidChars, QStringLiteral("_"));
    name.replace(kUnderscoreRuns, QStringLiteral("_"));
    name.remove(kTrim);
    name.truncate(kMaxCollectionName);
    name.remove(kTrim);
    return name;
}

QString WatcherOrchestrator::uniqueCollectionNameLocked(const QString& canonicalPath) const
{
    const QString base = collectionNameFor(m_settings.collectionPrefix, canonicalPath);
    if (base.isEmpty()) {
        return base;
    }

    auto inUse = [this](const QString& name) {
        for (const auto& [_, sync] : m_folders) {
            if (sync->collection() == name) {
                return true;
            }
        }
        for (const auto& [_, removal] : m_removals) {
            if (removal.folder.collection == name) {
                return true;
            }
        }
        return false;
    };

    if (!inUse(base)) {
        return base;
    }
    const QString hash = QString::fromLatin1(
        QCryptographicHash::hash(canonicalPath.toUtf8(), QCryptographicHash::Sha256)
            .toHex()
            .left(8));
    return base.left(kMaxCollectionName - hash.size() - 1) + QLatin1Char('_') + hash;
}

std::shared_ptr<FolderSynchronizer> WatcherOrchestrator::find(const QString& path) const
{
    const QString canonical = canonicalize(path);
    std::shared_lock<std::shared_mutex> lock(m_registryMutex);
    auto it = m_folders.find(canonical);
    return it == m_folders.end() ? nullptr : it->second;
}

// ── Public operations ───────────────────────────────────────

WatchFolderResult WatcherOrchestrator::watchFolder(const QString& path,
                                                   const QStringList& contentTypes)
{
    if (path.trimmed().isEmpty()) {
        return watchFailure(SyncError::Code::InvalidArgument, QStringLiteral("empty path"));
    }

    const QFileInfo info(path);
    if (!info.exists() || !info.isDir()) {
        return watchFailure(SyncError::Code::PathNotFound,
                            QStringLiteral("not an existing directory: %1").arg(path));
    }
    const QString canonical = info.canonicalFilePath();

    std::vector<ContentCategory> categories;
    for (const QString& type : contentTypes) {
        const auto category = contentCategoryFromString(type.trimmed().toLower());
        if (!category.has_value()) {
            return watchFailure(SyncError::Code::InvalidArgument,
                                QStringLiteral("unknown content type: %1").arg(type));
        }
        if (std::find(categories.begin(), categories.end(), category.value())
            == categories.end()) {
            categories.push_back(category.value());
        }
    }
    if (categories.empty()) {
        categories.push_back(ContentCategory::Text);
    }

    std::shared_ptr<FolderSynchronizer> sync;
    {
        std::unique_lock<std::shared_mutex> lock(m_registryMutex);
        if (m_shutdown) {
            return watchFailure(SyncError::Code::InvalidArgument,
                                QStringLiteral("orchestrator is shut down"));
        }
        if (m_folders.count(canonical) > 0) {
            return watchFailure(SyncError::Code::AlreadyWatched,
                                QStringLiteral("already watched: %1").arg(canonical));
        }

        auto conflicts = [&canonical](const QString& root) {
            return isSameOrInside(canonical, root) || isSameOrInside(root, canonical);
        };
        for (const auto& [root, _] : m_folders) {
            if (conflicts(root)) {
                return watchFailure(SyncError::Code::PathConflict,
                                    QStringLiteral("%1 overlaps watched folder %2")
                                        .arg(canonical, root));
            }
        }
        for (const auto& [root, _] : m_removals) {
            if (conflicts(root)) {
                return watchFailure(SyncError::Code::PathConflict,
                                    QStringLiteral("%1 overlaps folder being removed %2")
                                        .arg(canonical, root));
            }
        }

        WatchedFolder folder;
        folder.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
        folder.rootPath = canonical;
        folder.categories = categories;
        folder.collection = uniqueCollectionNameLocked(canonical);
        folder.createdAtMs = QDateTime::currentMSecsSinceEpoch();
        if (folder.collection.isEmpty()) {
            return watchFailure(SyncError::Code::InvalidArgument,
                                QStringLiteral("no usable collection name for %1").arg(canonical));
        }

        sync = createSynchronizer(folder);
        m_folders.emplace(canonical, sync);
        LOG_INFO(rwCore, "Watching %s as %s [%s]", qUtf8Printable(canonical),
                 qUtf8Printable(folder.collection),
                 qUtf8Printable(contentCategoriesToStrings(categories).join(QLatin1Char(','))));
    }

    sync->start(true);
    schedulePersist(true);

    WatchFolderResult result;
    result.folder = sync->snapshot();
    return result;
}

SyncResult WatcherOrchestrator::unwatchFolder(const QString& path)
{
    const QString canonical = canonicalize(path);
    std::shared_ptr<FolderSynchronizer> sync;
    {
        std::unique_lock<std::shared_mutex> lock(m_registryMutex);
        auto it = m_folders.find(canonical);
        if (it == m_folders.end()) {
            return notWatched(path);
        }
        sync = it->second;
        m_folders.erase(it);
        Removal removal;
        removal.folder = sync->folder();
        removal.folder.status = FolderStatus::Removed;
        removal.sync = sync;
        m_removals[canonical] = std::move(removal);
    }

    // No new events are accepted from here on; in-flight tasks finish
    // before the collection goes away.
    sync->beginRemoval();
    QString persistError;
    if (!persistNow(&persistError)) {
        LOG_WARN(rwCore, "Could not persist removal of %s: %s", qUtf8Printable(canonical),
                 qUtf8Printable(persistError));
    }

    QString error;
    if (!finishRemoval(canonical, &error)) {
        LOG_ERROR(rwCore, "Deleting collection of %s failed, will retry: %s",
                  qUtf8Printable(canonical), qUtf8Printable(error));
        return SyncResult::failure(SyncError::Code::IndexStore, error);
    }
    return SyncResult::success();
}

bool WatcherOrchestrator::finishRemoval(const QString& path, QString* error)
{
    Removal removal;
    {
        std::shared_lock<std::shared_mutex> lock(m_registryMutex);
        auto it = m_removals.find(path);
        if (it == m_removals.end()) {
            return true;
        }
        removal = it->second;
    }

    const QString& collection = removal.folder.collection;
    bool deleted = false;
    if (removal.sync) {
        deleted = removal.sync->indexer().withRetry(
            "delete collection", path,
            [&](QString* err) { return m_store.deleteCollection(collection, err); }, error);
    } else {
        deleted = m_store.deleteCollection(collection, error);
    }
    if (!deleted) {
        return false;
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_registryMutex);
        m_removals.erase(path);
    }
    LOG_INFO(rwCore, "Removed %s and collection %s", qUtf8Printable(path),
             qUtf8Printable(collection));
    schedulePersist(true);
    return true;
}

SyncResult WatcherOrchestrator::pauseFolder(const QString& path)
{
    std::shared_ptr<FolderSynchronizer> sync = find(path);
    if (!sync) {
        return notWatched(path);
    }
    sync->pause();
    schedulePersist(true);
    return SyncResult::success();
}

SyncResult WatcherOrchestrator::resumeFolder(const QString& path)
{
    std::shared_ptr<FolderSynchronizer> sync = find(path);
    if (!sync) {
        return notWatched(path);
    }
    sync->resume();
    schedulePersist(true);
    return SyncResult::success();
}

std::vector<FolderSnapshot> WatcherOrchestrator::watchedFolders() const
{
    std::shared_lock<std::shared_mutex> lock(m_registryMutex);
    std::vector<FolderSnapshot> snapshots;
    snapshots.reserve(m_folders.size());
    for (const auto& [_, sync] : m_folders) {
        snapshots.push_back(sync->snapshot());
    }
    return snapshots;
}

QStringList WatcherOrchestrator::collections() const
{
    std::shared_lock<std::shared_mutex> lock(m_registryMutex);
    QStringList names;
    for (const auto& [_, sync] : m_folders) {
        names.append(sync->collection());
    }
    return names;
}

bool WatcherOrchestrator::waitForIdle(int timeoutMs)
{
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    std::vector<std::shared_ptr<FolderSynchronizer>> folders;
    {
        std::shared_lock<std::shared_mutex> lock(m_registryMutex);
        for (const auto& [_, sync] : m_folders) {
            folders.push_back(sync);
        }
    }
    for (const auto& sync : folders) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (!sync->waitForIdle(static_cast<int>(std::max<int64_t>(0, remaining.count())))) {
            return false;
        }
    }
    return true;
}

// ── Restore ─────────────────────────────────────────────────

SyncResult WatcherOrchestrator::restore()
{
    std::optional<QByteArray> blob;
    QString error;
    if (!m_store.getMetadata(QString::fromLatin1(PersistedState::kRecordId), &blob, &error)) {
        LOG_ERROR(rwCore, "Cannot read persisted state: %s", qUtf8Printable(error));
        return SyncResult::failure(SyncError::Code::IndexStore, error);
    }
    if (!blob.has_value()) {
        LOG_INFO(rwCore, "No persisted state, starting empty");
        return SyncResult::success();
    }

    std::optional<PersistedState> state = PersistedState::deserialize(blob.value(), &error);
    if (!state.has_value()) {
        LOG_ERROR(rwCore, "Discarding persisted state: %s", qUtf8Printable(error));
        return SyncResult::failure(SyncError::Code::InvalidArgument, error);
    }

    std::vector<QString> pendingRemovals;
    for (PersistedFolder& entry : state->folders) {
        WatchedFolder& folder = entry.folder;
        const QString root = folder.rootPath;

        {
            std::shared_lock<std::shared_mutex> lock(m_registryMutex);
            if (m_folders.count(root) > 0 || m_removals.count(root) > 0) {
                continue;
            }
        }

        if (folder.status == FolderStatus::Removed) {
            std::unique_lock<std::shared_mutex> lock(m_registryMutex);
            Removal removal;
            removal.folder = folder;
            m_removals[root] = std::move(removal);
            pendingRemovals.push_back(root);
            continue;
        }

        const FolderStatus lastStatus = folder.status;
        std::shared_ptr<FolderSynchronizer> sync = createSynchronizer(folder);
        {
            std::unique_lock<std::shared_mutex> lock(m_registryMutex);
            m_folders.emplace(root, sync);
        }

        if (!QFileInfo(root).isDir()) {
            LOG_WARN(rwCore, "Watched root %s is missing, keeping it in Error",
                     qUtf8Printable(root));
            sync->retryFailed();
            continue;
        }

        bool consistent = false;
        QString rebuildError;
        const bool rebuilt = sync->rebuildRecords(&consistent, &rebuildError);
        if (!rebuilt) {
            LOG_WARN(rwCore, "Cannot rebuild records of %s: %s", qUtf8Printable(root),
                     qUtf8Printable(rebuildError));
        }

        if (lastStatus == FolderStatus::Paused) {
            sync->pause();
            LOG_INFO(rwCore, "Restored %s (paused)", qUtf8Printable(root));
        } else if (rebuilt && consistent && entry.clean) {
            sync->useStoredFragmentCount();
            sync->start(false);
            LOG_INFO(rwCore, "Restored %s (clean)", qUtf8Printable(root));
        } else {
            sync->start(true);
            LOG_INFO(rwCore, "Restored %s, rescanning (last status %s)", qUtf8Printable(root),
                     qUtf8Printable(folderStatusToString(lastStatus)));
        }
    }

    for (const QString& root : pendingRemovals) {
        QString removalError;
        if (!finishRemoval(root, &removalError)) {
            LOG_WARN(rwCore, "Pending removal of %s still failing: %s", qUtf8Printable(root),
                     qUtf8Printable(removalError));
        }
    }

    schedulePersist(true);
    return SyncResult::success();
}

// ── Persistence and maintenance ─────────────────────────────

bool WatcherOrchestrator::persistNow(QString* error)
{
    std::lock_guard<std::mutex> writeLock(m_persistMutex);

    PersistedState state;
    {
        std::shared_lock<std::shared_mutex> lock(m_registryMutex);
        for (const auto& [_, sync] : m_folders) {
            PersistedFolder entry;
            entry.folder = sync->folder();
            entry.clean = sync->isClean();
            state.folders.push_back(std::move(entry));
        }
        for (const auto& [_, removal] : m_removals) {
            PersistedFolder entry;
            entry.folder = removal.folder;
            entry.folder.status = FolderStatus::Removed;
            state.folders.push_back(std::move(entry));
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_maintenanceMutex);
        m_persistDirty = false;
        m_persistUrgent = false;
    }

    if (!m_store.putMetadata(QString::fromLatin1(PersistedState::kRecordId), state.serialize(),
                             error)) {
        std::lock_guard<std::mutex> lock(m_maintenanceMutex);
        m_persistDirty = true;
        return false;
    }
    LOG_DEBUG(rwCore, "Persisted state of %d folders", static_cast<int>(state.folders.size()));
    return true;
}

void WatcherOrchestrator::schedulePersist(bool urgent)
{
    {
        std::lock_guard<std::mutex> lock(m_maintenanceMutex);
        m_persistDirty = true;
        m_persistUrgent = m_persistUrgent || urgent;
    }
    if (urgent) {
        m_maintenanceCv.notify_all();
    }
}

void WatcherOrchestrator::sweepErrors()
{
    std::vector<std::shared_ptr<FolderSynchronizer>> folders;
    std::vector<QString> removals;
    {
        std::shared_lock<std::shared_mutex> lock(m_registryMutex);
        for (const auto& [_, sync] : m_folders) {
            folders.push_back(sync);
        }
        for (const auto& [root, _] : m_removals) {
            removals.push_back(root);
        }
    }

    for (const auto& sync : folders) {
        sync->retryFailed();
    }
    for (const QString& root : removals) {
        QString error;
        if (!finishRemoval(root, &error)) {
            LOG_WARN(rwCore, "Removal of %s still failing: %s", qUtf8Printable(root),
                     qUtf8Printable(error));
        }
    }
}

void WatcherOrchestrator::maintenanceLoop()
{
    using Clock = std::chrono::steady_clock;
    const auto persistInterval = std::chrono::milliseconds(std::max(1, m_settings.persistIntervalMs));
    const auto sweepInterval = std::chrono::milliseconds(std::max(1, m_settings.errorSweepIntervalMs));

    auto lastPersist = Clock::now();
    auto nextSweep = Clock::now() + sweepInterval;

    std::unique_lock<std::mutex> lock(m_maintenanceMutex);
    while (!m_stopMaintenance) {
        auto wakeAt = nextSweep;
        if (m_persistDirty) {
            wakeAt = std::min(wakeAt, lastPersist + persistInterval);
        }
        m_maintenanceCv.wait_until(lock, wakeAt, [this] {
            return m_stopMaintenance || m_persistUrgent;
        });
        if (m_stopMaintenance) {
            break;
        }

        const auto now = Clock::now();
        const bool persistDue = m_persistDirty
                                && (m_persistUrgent || now >= lastPersist + persistInterval);
        const bool sweepDue = now >= nextSweep;
        lock.unlock();

        if (persistDue) {
            QString error;
            if (!persistNow(&error)) {
                LOG_WARN(rwCore, "Persisting state failed: %s", qUtf8Printable(error));
            }
            lastPersist = Clock::now();
        }
        if (sweepDue) {
            sweepErrors();
            nextSweep = Clock::now() + sweepInterval;
        }

        lock.lock();
    }
}

// ── Shutdown ────────────────────────────────────────────────

void WatcherOrchestrator::shutdown()
{
    std::vector<std::shared_ptr<FolderSynchronizer>> folders;
    {
        std::unique_lock<std::shared_mutex> lock(m_registryMutex);
        if (m_shutdown) {
            return;
        }
        m_shutdown = true;
        for (const auto& [_, sync] : m_folders) {
            folders.push_back(sync);
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_maintenanceMutex);
        m_stopMaintenance = true;
    }
    m_maintenanceCv.notify_all();
    if (m_maintenanceThread.joinable()) {
        m_maintenanceThread.join();
    }

    LOG_INFO(rwCore, "Shutting down %d folders", static_cast<int>(folders.size()));
    for (const auto& sync : folders) {
        sync->stop();
    }

    QString error;
    if (!persistNow(&error)) {
        LOG_ERROR(rwCore, "Final state write failed: %s", qUtf8Printable(error));
    }
    m_pool.stop();
}

} // namespace rw
