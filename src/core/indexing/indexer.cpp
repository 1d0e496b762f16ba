#include "core/indexing/indexer.h"
#include "core/embedding/embedding_provider.h"
#include "core/extraction/extraction_manager.h"
#include "core/fs/content_filter.h"
#include "core/fs/fingerprint.h"
#include "core/shared/fragment.h"
#include "core/shared/logging.h"
#include "core/vector/vector_store.h"

#include <QDateTime>
#include <QElapsedTimer>
#include <QFileInfo>

#include <algorithm>
#include <chrono>

namespace rw {

namespace {

QStringList minus(const QStringList& lhs, const QStringList& rhs)
{
    QStringList out;
    for (const QString& id : lhs) {
        if (!rhs.contains(id) && !out.contains(id)) {
            out.append(id);
        }
    }
    return out;
}

bool sameCommittedState(const std::optional<FileRecord>& a, const std::optional<FileRecord>& b)
{
    const QString fa = a ? a->syncedFingerprint : QString();
    const QString fb = b ? b->syncedFingerprint : QString();
    const QStringList ia = a ? a->fragmentIds : QStringList();
    const QStringList ib = b ? b->fragmentIds : QStringList();
    return fa == fb && ia == ib;
}

QStringList allIds(const FileRecord& record)
{
    QStringList ids = record.fragmentIds;
    for (const QString& id : record.pendingIds) {
        if (!ids.contains(id)) {
            ids.append(id);
        }
    }
    return ids;
}

} // namespace

int RetryPolicy::delayForAttempt(int attempt) const
{
    int64_t delay = baseDelayMs;
    for (int i = 0; i < attempt && delay < maxDelayMs; ++i) {
        delay *= 4;
    }
    return static_cast<int>(std::min<int64_t>(delay, maxDelayMs));
}

const char* indexStatusName(IndexResult::Status status)
{
    switch (status) {
    case IndexResult::Status::Indexed:          return "indexed";
    case IndexResult::Status::Unchanged:        return "unchanged";
    case IndexResult::Status::Removed:          return "removed";
    case IndexResult::Status::Renamed:          return "renamed";
    case IndexResult::Status::Filtered:         return "filtered";
    case IndexResult::Status::ExtractionFailed: return "extraction_failed";
    case IndexResult::Status::ExtractionBusy:   return "extraction_busy";
    case IndexResult::Status::StoreFailed:      return "store_failed";
    case IndexResult::Status::EmbeddingFailed:  return "embedding_failed";
    case IndexResult::Status::Superseded:       return "superseded";
    }
    return "unknown";
}

// ── Construction ────────────────────────────────────────────

Indexer::Indexer(VectorStore& store, EmbeddingProvider& embedder, ExtractionManager& extractor,
                 const ContentFilter& filter, FileRecordTable& records, IndexerConfig config)
    : m_store(store)
    , m_embedder(embedder)
    , m_extractor(extractor)
    , m_filter(filter)
    , m_records(records)
    , m_config(std::move(config))
    , m_chunker(m_config.chunker)
{
    if (m_config.embedBatchSize < 1) {
        m_config.embedBatchSize = 1;
    }
}

void Indexer::cancel()
{
    {
        std::lock_guard<std::mutex> lock(m_waitMutex);
        m_cancelled.store(true);
    }
    m_waitCv.notify_all();
}

void Indexer::resetCancel()
{
    std::lock_guard<std::mutex> lock(m_waitMutex);
    m_cancelled.store(false);
}

// ── Retry ───────────────────────────────────────────────────

bool Indexer::waitBackoff(int delayMs)
{
    std::unique_lock<std::mutex> lock(m_waitMutex);
    m_waitCv.wait_for(lock, std::chrono::milliseconds(delayMs),
                      [this] { return m_cancelled.load(); });
    return !m_cancelled.load();
}

bool Indexer::withRetry(const char* operation, const QString& path,
                        const std::function<bool(QString*)>& attempt, QString* lastError)
{
    const int maxAttempts = std::max(1, m_config.retry.maxAttempts);
    for (int i = 0; i < maxAttempts; ++i) {
        QString error;
        if (attempt(&error)) {
            return true;
        }
        if (lastError) {
            *lastError = error;
        }
        if (i + 1 >= maxAttempts) {
            break;
        }
        const int delayMs = m_config.retry.delayForAttempt(i);
        LOG_WARN(rwIndex, "%s failed for %s (attempt %d/%d): %s; retrying in %d ms",
                 operation, qUtf8Printable(path), i + 1, maxAttempts,
                 qUtf8Printable(error), delayMs);
        if (!waitBackoff(delayMs)) {
            if (lastError) {
                *lastError = QStringLiteral("cancelled while retrying: %1").arg(error);
            }
            return false;
        }
    }
    LOG_ERROR(rwIndex, "%s failed for %s after %d attempts", operation,
              qUtf8Printable(path), maxAttempts);
    return false;
}

bool Indexer::deleteIds(const QStringList& ids, const QString& path, QString* error)
{
    if (ids.isEmpty()) {
        return true;
    }
    return withRetry("delete", path, [&](QString* err) {
        return m_store.remove(m_config.collection, ids, err);
    }, error);
}

bool Indexer::embedTexts(const std::vector<QString>& texts, const QString& path,
                         std::vector<std::vector<float>>* vectors, QString* error)
{
    const size_t batchSize = static_cast<size_t>(m_config.embedBatchSize);
    const int dims = m_embedder.dimensions();
    vectors->clear();
    vectors->reserve(texts.size());

    for (size_t begin = 0; begin < texts.size(); begin += batchSize) {
        const size_t end = std::min(texts.size(), begin + batchSize);
        const std::vector<QString> batch(texts.begin() + static_cast<std::ptrdiff_t>(begin),
                                         texts.begin() + static_cast<std::ptrdiff_t>(end));
        std::vector<std::vector<float>> embedded;
        const bool ok = withRetry("embed", path, [&](QString* err) {
            embedded = m_embedder.embedPassages(batch);
            if (embedded.size() != batch.size()) {
                *err = QStringLiteral("embedding provider returned %1 vectors for %2 passages")
                           .arg(embedded.size()).arg(batch.size());
                return false;
            }
            for (const std::vector<float>& v : embedded) {
                if (static_cast<int>(v.size()) != dims) {
                    *err = QStringLiteral("embedding has %1 dimensions, expected %2")
                               .arg(v.size()).arg(dims);
                    return false;
                }
            }
            return true;
        }, error);
        if (!ok) {
            return false;
        }
        for (std::vector<float>& v : embedded) {
            vectors->push_back(std::move(v));
        }
    }
    return true;
}

// ── Sync ────────────────────────────────────────────────────

bool Indexer::reclaimIds(const QString& filePath, const QStringList& ids, QString* error)
{
    for (const FileRecord& holder : m_records.holdersOf(ids, filePath)) {
        std::vector<FragmentPoint> stored;
        if (!withRetry("fetch", holder.path, [&](QString* err) {
                return m_store.fetchFragments(m_config.collection, holder.fragmentIds, &stored,
                                              err);
            }, error)) {
            return false;
        }

        std::vector<FragmentPoint> moved;
        QStringList keptIds;
        QStringList movedIds;
        QStringList replacedIds;
        for (FragmentPoint& point : stored) {
            if (point.payload.path != holder.path) {
                continue;
            }
            const QString ownId = computeFragmentId(holder.path, point.payload.fingerprint,
                                                    point.payload.chunkIndex);
            keptIds.append(ownId);
            if (ownId != point.id) {
                replacedIds.append(point.id);
                movedIds.append(ownId);
                point.id = ownId;
                moved.push_back(std::move(point));
            }
        }

        if (!moved.empty()) {
            m_records.addPendingIds(holder.path, movedIds);
            if (!withRetry("upsert", holder.path, [&](QString* err) {
                    return m_store.upsert(m_config.collection, moved, err);
                }, error)) {
                return false;
            }
            if (!deleteIds(replacedIds, holder.path, error)) {
                return false;
            }
        }

        if (!m_records.rekey(holder.path, holder.fragmentIds, keptIds, ids)) {
            LOG_DEBUG(rwIndex, "%s changed while its fragment ids were reclaimed",
                      qUtf8Printable(holder.path));
        } else {
            LOG_DEBUG(rwIndex, "Moved %d fragments of %s onto ids of its own path",
                      static_cast<int>(moved.size()), qUtf8Printable(holder.path));
        }
    }
    return true;
}

IndexResult Indexer::dropPendingOnly(const FileRecord& record)
{
    IndexResult result;
    result.path = record.path;
    result.status = IndexResult::Status::Unchanged;

    const QStringList orphans = minus(record.pendingIds, record.fragmentIds);
    QString error;
    if (!deleteIds(orphans, record.path, &error)) {
        result.status = IndexResult::Status::StoreFailed;
        result.errorMessage = error;
        return result;
    }

    FileRecord cleaned = record;
    cleaned.pendingIds.clear();
    if (!m_records.commitIfUnchanged(record, cleaned)) {
        result.status = IndexResult::Status::Superseded;
    }
    result.fragmentsDeleted = static_cast<int>(orphans.size());
    return result;
}

IndexResult Indexer::syncFile(const QString& filePath, const StaleCheck& isStale)
{
    QElapsedTimer timer;
    timer.start();

    IndexResult result;
    result.path = filePath;

    auto finish = [&](IndexResult r) {
        r.durationMs = static_cast<int>(timer.elapsed());
        return r;
    };

    const QFileInfo info(filePath);
    if (!info.exists()) {
        return finish(removePath(filePath));
    }
    if (!info.isFile()) {
        result.status = IndexResult::Status::Filtered;
        return finish(result);
    }

    const std::optional<ContentCategory> category = m_filter.classify(filePath, info.size());
    if (!category.has_value()) {
        if (m_records.get(filePath).has_value()) {
            IndexResult removed = removePath(filePath);
            if (removed.status == IndexResult::Status::Removed) {
                removed.status = IndexResult::Status::Filtered;
            }
            return finish(removed);
        }
        result.status = IndexResult::Status::Filtered;
        return finish(result);
    }

    // Step 1: fingerprint.
    const std::optional<FileRecord> start = m_records.get(filePath);
    const std::optional<QString> fingerprint = computeFileFingerprint(filePath);
    if (!fingerprint.has_value()) {
        if (!QFileInfo::exists(filePath)) {
            return finish(removePath(filePath));
        }
        result.status = IndexResult::Status::ExtractionFailed;
        result.errorMessage = QStringLiteral("file could not be read");
        return finish(result);
    }

    if (start.has_value() && start->syncedFingerprint == fingerprint.value()) {
        if (start->pendingIds.isEmpty()) {
            result.status = IndexResult::Status::Unchanged;
            return finish(result);
        }
        return finish(dropPendingOnly(start.value()));
    }

    // Step 2: extract. Failure leaves the index and the record untouched.
    const ExtractionResult extraction = m_extractor.extract(filePath, category.value());
    if (!extraction.ok()) {
        result.status = extraction.status == ExtractionResult::Status::Busy
                            ? IndexResult::Status::ExtractionBusy
                            : IndexResult::Status::ExtractionFailed;
        result.errorMessage = extraction.errorMessage.value_or(
            extractionStatusToString(extraction.status));
        return finish(result);
    }

    if (isStale && isStale()) {
        // A newer event is queued for this path and will redo the work.
        result.status = IndexResult::Status::Superseded;
        return finish(result);
    }

    // Step 3: chunk and derive ids.
    const QString text = extraction.content.value_or(QString());
    std::vector<TextWindow> windows;
    if (text.size() >= m_config.minContentChars) {
        windows = m_chunker.chunk(text);
    }
    const int totalChunks = static_cast<int>(windows.size());
    const double mtime = static_cast<double>(info.lastModified().toMSecsSinceEpoch()) / 1000.0;

    std::vector<FragmentPoint> points;
    std::vector<QString> passages;
    QStringList newIds;
    for (const TextWindow& window : windows) {
        if (window.text.size() < m_config.minContentChars) {
            continue;
        }
        FragmentPoint point;
        point.id = computeFragmentId(filePath, fingerprint.value(), window.ordinal);
        point.payload.path = filePath;
        point.payload.chunkIndex = window.ordinal;
        point.payload.totalChunks = totalChunks;
        point.payload.contentPreview = window.text.left(m_config.previewChars);
        point.payload.fingerprint = fingerprint.value();
        point.payload.mtime = mtime;
        newIds.append(point.id);
        passages.push_back(window.text);
        points.push_back(std::move(point));
    }

    // Step 4: embed and upsert.
    if (!points.empty()) {
        std::vector<std::vector<float>> vectors;
        QString error;
        if (!embedTexts(passages, filePath, &vectors, &error)) {
            result.status = IndexResult::Status::EmbeddingFailed;
            result.errorMessage = error;
            return finish(result);
        }
        for (size_t i = 0; i < points.size(); ++i) {
            points[i].vector = std::move(vectors[i]);
        }

        if (!reclaimIds(filePath, newIds, &error)) {
            result.status = IndexResult::Status::StoreFailed;
            result.errorMessage = error;
            return finish(result);
        }

        m_records.addPendingIds(filePath, newIds);
        if (!withRetry("upsert", filePath, [&](QString* err) {
                return m_store.upsert(m_config.collection, points, err);
            }, &error)) {
            result.status = IndexResult::Status::StoreFailed;
            result.errorMessage = error;
            return finish(result);
        }
        result.fragmentsWritten = static_cast<int>(points.size());
    }

    // Step 5: delete what the committed state no longer needs, then commit.
    const std::optional<FileRecord> current = m_records.get(filePath);
    if ((isStale && isStale()) || !sameCommittedState(start, current)) {
        result.status = IndexResult::Status::Superseded;
        LOG_DEBUG(rwIndex, "Superseded before commit: %s", qUtf8Printable(filePath));
        return finish(result);
    }

    const QStringList obsolete = current.has_value() ? minus(allIds(current.value()), newIds)
                                                     : QStringList();
    QString error;
    if (!deleteIds(obsolete, filePath, &error)) {
        result.status = IndexResult::Status::StoreFailed;
        result.errorMessage = error;
        return finish(result);
    }
    result.fragmentsDeleted = static_cast<int>(obsolete.size());

    FileRecord committed;
    committed.path = filePath;
    committed.syncedFingerprint = fingerprint.value();
    committed.fragmentIds = newIds;
    committed.mtime = mtime;
    if (!m_records.commitIfUnchanged(current, std::move(committed))) {
        result.status = IndexResult::Status::Superseded;
        return finish(result);
    }

    result.status = IndexResult::Status::Indexed;
    LOG_DEBUG(rwIndex, "Indexed %s: %d fragments written, %d deleted",
              qUtf8Printable(filePath), result.fragmentsWritten, result.fragmentsDeleted);
    return finish(result);
}

// ── Remove ──────────────────────────────────────────────────

IndexResult Indexer::removePath(const QString& path, bool recursive)
{
    IndexResult result;
    result.path = path;
    result.status = IndexResult::Status::Removed;

    const std::vector<QString> targets = recursive ? m_records.pathsUnder(path)
                                                   : std::vector<QString>{path};
    for (const QString& recordPath : targets) {
        std::optional<FileRecord> record = m_records.take(recordPath);
        if (!record.has_value()) {
            continue;
        }
        const QStringList ids = allIds(record.value());
        QString error;
        if (!deleteIds(ids, recordPath, &error)) {
            // Keep the record so the removal can be retried.
            m_records.put(std::move(record.value()));
            result.status = IndexResult::Status::StoreFailed;
            result.errorMessage = error;
            return result;
        }
        result.fragmentsDeleted += static_cast<int>(ids.size());
    }

    if (result.fragmentsDeleted > 0) {
        LOG_DEBUG(rwIndex, "Removed %d fragments under %s", result.fragmentsDeleted,
                  qUtf8Printable(path));
    }
    return result;
}

// ── Rename ──────────────────────────────────────────────────

IndexResult Indexer::renamePath(const QString& oldPath, const QString& newPath,
                                std::vector<QString>* movedPaths)
{
    IndexResult result;
    result.path = newPath;
    result.status = IndexResult::Status::Renamed;

    for (const QString& fromPath : m_records.pathsUnder(oldPath)) {
        const QString toPath = newPath + fromPath.mid(oldPath.size());

        std::optional<FileRecord> record = m_records.take(fromPath);
        if (!record.has_value()) {
            continue;
        }

        // A file replaced by the rename loses its fragments.
        std::optional<FileRecord> replaced = m_records.take(toPath);
        QString error;
        if (replaced.has_value()) {
            const QStringList replacedIds = minus(allIds(replaced.value()), allIds(record.value()));
            if (!deleteIds(replacedIds, toPath, &error)) {
                m_records.put(std::move(replaced.value()));
                m_records.put(std::move(record.value()));
                result.status = IndexResult::Status::StoreFailed;
                result.errorMessage = error;
                return result;
            }
            result.fragmentsDeleted += static_cast<int>(replacedIds.size());
        }

        const QStringList kept = record->fragmentIds;
        if (!kept.isEmpty()
            && !withRetry("set path", toPath, [&](QString* err) {
                   return m_store.setFragmentPath(m_config.collection, kept, toPath, err);
               }, &error)) {
            m_records.put(std::move(record.value()));
            result.status = IndexResult::Status::StoreFailed;
            result.errorMessage = error;
            return result;
        }

        record->path = toPath;
        m_records.put(std::move(record.value()));
        if (movedPaths) {
            movedPaths->push_back(toPath);
        }
    }

    LOG_DEBUG(rwIndex, "Renamed %s -> %s", qUtf8Printable(oldPath), qUtf8Printable(newPath));
    return result;
}

} // namespace rw
