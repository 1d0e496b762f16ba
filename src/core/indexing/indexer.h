#pragma once

#include "core/indexing/chunker.h"
#include "core/indexing/file_record.h"

#include <QString>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <vector>

namespace rw {

class ContentFilter;
class EmbeddingProvider;
class ExtractionManager;
class VectorStore;

// Backoff for transient store and embedding failures:
// delay(attempt) = min(baseDelayMs * 4^attempt, maxDelayMs).
struct RetryPolicy {
    int baseDelayMs = 500;
    int maxDelayMs = 8000;
    int maxAttempts = 3;

    int delayForAttempt(int attempt) const;
};

struct IndexerConfig {
    QString collection;
    ChunkerConfig chunker;
    int minContentChars = 10;
    int previewChars = 100;
    int embedBatchSize = 32;
    RetryPolicy retry;
};

// Result of one per-path synchronization step.
struct IndexResult {
    enum class Status {
        Indexed,           // new fragment set written and committed
        Unchanged,         // fingerprint matches the committed one
        Removed,           // path gone, its fragments deleted
        Renamed,           // records re-keyed, fragments kept
        Filtered,          // not an indexable file for this folder
        ExtractionFailed,  // every extractor failed, previous state kept
        ExtractionBusy,    // no extraction slot in time, previous state kept
        StoreFailed,       // vector store kept failing after retries
        EmbeddingFailed,   // embedding provider kept failing after retries
        Superseded,        // a newer event settled first; record left alone
    };

    Status status = Status::Filtered;
    QString path;
    int fragmentsWritten = 0;
    int fragmentsDeleted = 0;
    QString errorMessage;
    int durationMs = 0;

    bool isTransientFailure() const {
        return status == Status::StoreFailed || status == Status::EmbeddingFailed
               || status == Status::ExtractionBusy;
    }
};

const char* indexStatusName(IndexResult::Status status);

// Indexer - per-file synchronization against the vector store for one
// folder.
//
// syncFile():
//   1. Fingerprint the file; equal to the committed fingerprint -> no-op.
//   2. Extract text. On failure nothing in the index or the record changes.
//   3. Chunk and derive fingerprint-scoped fragment ids.
//   4. Embed, then upsert the new fragments.
//   5. Delete the previously committed fragments that are not in the new
//      set, then commit the FileRecord.
// New ids are recorded as pending before the upsert so that a failed or
// superseded run never leaves fragments the record does not know about.
// Ids still held by a record renamed away from filePath are first moved
// onto ids derived from that record's own path.
// Store and embedding calls are retried with RetryPolicy backoff.
class Indexer {
public:
    // Returns true when a newer event for the path has settled.
    using StaleCheck = std::function<bool()>;

    Indexer(VectorStore& store, EmbeddingProvider& embedder, ExtractionManager& extractor,
            const ContentFilter& filter, FileRecordTable& records, IndexerConfig config);

    // Non-copyable, non-movable
    Indexer(const Indexer&) = delete;
    Indexer& operator=(const Indexer&) = delete;
    Indexer(Indexer&&) = delete;
    Indexer& operator=(Indexer&&) = delete;

    IndexResult syncFile(const QString& filePath, const StaleCheck& isStale = {});

    // Deletes the fragments of path and, when recursive, of every record
    // below it.
    IndexResult removePath(const QString& path, bool recursive = true);

    // Re-keys the record of oldPath (and every record below it) to newPath
    // and rewrites the stored fragment paths. Fragment ids are kept.
    // movedPaths receives the new paths of the records that moved.
    IndexResult renamePath(const QString& oldPath, const QString& newPath,
                           std::vector<QString>* movedPaths = nullptr);

    // Runs attempt until it succeeds or the retry policy is exhausted,
    // sleeping the policy's backoff between attempts.
    bool withRetry(const char* operation, const QString& path,
                   const std::function<bool(QString*)>& attempt, QString* lastError);

    // Interrupts retry waits; pending retries give up.
    void cancel();
    void resetCancel();
    bool isCancelled() const { return m_cancelled.load(); }

    const IndexerConfig& config() const { return m_config; }

private:
    bool waitBackoff(int delayMs);

    bool embedTexts(const std::vector<QString>& texts, const QString& path,
                    std::vector<std::vector<float>>* vectors, QString* error);
    bool deleteIds(const QStringList& ids, const QString& path, QString* error);
    IndexResult dropPendingOnly(const FileRecord& record);
    bool reclaimIds(const QString& filePath, const QStringList& ids, QString* error);

    VectorStore& m_store;
    EmbeddingProvider& m_embedder;
    ExtractionManager& m_extractor;
    const ContentFilter& m_filter;
    FileRecordTable& m_records;
    IndexerConfig m_config;
    Chunker m_chunker;

    std::atomic<bool> m_cancelled{false};
    std::mutex m_waitMutex;
    std::condition_variable m_waitCv;
};

} // namespace rw
