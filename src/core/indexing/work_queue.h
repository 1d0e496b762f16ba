#pragma once

#include <QString>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <vector>

namespace rw {

// A unit of index mutation scheduled on the shared worker pool.
struct WorkItem {
    // Lower value is dequeued first.
    enum class Type {
        Remove = 0,
        Move = 1,
        Sync = 2,       // settled change event
        ScanFile = 3,   // bulk initial scan
    };

    Type type = Type::Sync;
    std::string filePath;
    QString folderId;
    std::function<void()> run;
    uint64_t sequence = 0;     // assigned by the queue, FIFO within a type
};

struct QueueStats {
    size_t depth = 0;
    size_t scanDepth = 0;
    size_t activeItems = 0;
    size_t droppedItems = 0;
    size_t blockedProducers = 0;
};

// WorkQueue - thread-safe priority queue shared by every watched folder.
//
// Priority ordering (highest to lowest):
//   Remove (0) > Move (1) > Sync (2) > ScanFile (3)
// Items of the same type leave in arrival order.
//
// Backpressure: bulk-scan items go through enqueueBlocking(), which
// suspends the producer while `scanCapacity` ScanFile items are queued.
// Event-driven items use enqueue() and are never refused or dropped, so
// a large scan cannot delay deletes or edits of another folder.
class WorkQueue {
public:
    explicit WorkQueue(size_t scanCapacity = 256);
    ~WorkQueue();

    // Non-copyable, non-movable
    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;
    WorkQueue(WorkQueue&&) = delete;
    WorkQueue& operator=(WorkQueue&&) = delete;

    // Never blocks. Returns false only after shutdown().
    bool enqueue(WorkItem item);

    // Blocks while the ScanFile backlog is at capacity. Returns false if
    // `cancelled` became true or the queue shut down while waiting.
    bool enqueueBlocking(WorkItem item, const std::atomic<bool>* cancelled = nullptr);

    // Blocking dequeue. Returns nullopt once shutdown() has been called.
    std::optional<WorkItem> dequeue();

    // Marks one dequeued item as fully processed.
    void markItemComplete();

    // Removes every queued item of the folder. Returns the number dropped.
    size_t dropFolder(const QString& folderId);

    // Unblock all waiting threads and signal permanent shutdown.
    void shutdown();

    size_t size() const;
    size_t scanBacklog() const;
    size_t capacity() const { return m_scanCapacity; }

    QueueStats stats() const;

private:
    // std::priority_queue is a max-heap: invert so that Remove (0) with
    // the smallest sequence sits on top.
    struct LowerPriorityFirst {
        bool operator()(const WorkItem& a, const WorkItem& b) const {
            if (a.type != b.type) {
                return static_cast<int>(a.type) > static_cast<int>(b.type);
            }
            return a.sequence > b.sequence;
        }
    };

    void pushLocked(WorkItem item);

    const size_t m_scanCapacity;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;        // consumers
    std::condition_variable m_spaceCv;   // blocked scan producers

    std::priority_queue<WorkItem, std::vector<WorkItem>, LowerPriorityFirst> m_queue;
    uint64_t m_nextSequence = 0;
    size_t m_scanItems = 0;
    size_t m_droppedItems = 0;
    size_t m_activeItems = 0;
    size_t m_blockedProducers = 0;
    bool m_shutdown = false;
};

} // namespace rw
