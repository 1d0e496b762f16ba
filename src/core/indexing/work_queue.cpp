#include "core/indexing/work_queue.h"
#include "core/shared/logging.h"

#include <chrono>

namespace rw {

namespace {

// Producers re-check their cancellation flag at this interval.
constexpr auto kProducerPollInterval = std::chrono::milliseconds(50);

} // namespace

// ── Construction ────────────────────────────────────────────

WorkQueue::WorkQueue(size_t scanCapacity)
    : m_scanCapacity(scanCapacity > 0 ? scanCapacity : 1)
{
}

WorkQueue::~WorkQueue()
{
    shutdown();
}

// ── Enqueue ─────────────────────────────────────────────────

void WorkQueue::pushLocked(WorkItem item)
{
    item.sequence = m_nextSequence++;
    if (item.type == WorkItem::Type::ScanFile) {
        ++m_scanItems;
    }
    m_queue.push(std::move(item));
    m_cv.notify_one();
}

bool WorkQueue::enqueue(WorkItem item)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_shutdown) {
        LOG_WARN(rwIndex, "WorkQueue::enqueue() called after shutdown: %s",
                 item.filePath.c_str());
        return false;
    }

    // Per-item enqueue logging is too noisy for large scans.
    pushLocked(std::move(item));
    return true;
}

bool WorkQueue::enqueueBlocking(WorkItem item, const std::atomic<bool>* cancelled)
{
    std::unique_lock<std::mutex> lock(m_mutex);

    bool reportedFull = false;
    while (!m_shutdown && m_scanItems >= m_scanCapacity) {
        if (cancelled && cancelled->load()) {
            return false;
        }
        if (!reportedFull) {
            LOG_DEBUG(rwIndex, "WorkQueue scan backlog full (%d), producer waiting",
                      static_cast<int>(m_scanItems));
            reportedFull = true;
        }
        ++m_blockedProducers;
        m_spaceCv.wait_for(lock, kProducerPollInterval);
        --m_blockedProducers;
    }

    if (m_shutdown || (cancelled && cancelled->load())) {
        return false;
    }

    pushLocked(std::move(item));
    return true;
}

// ── Dequeue ─────────────────────────────────────────────────

std::optional<WorkItem> WorkQueue::dequeue()
{
    std::unique_lock<std::mutex> lock(m_mutex);

    m_cv.wait(lock, [this] {
        return m_shutdown || !m_queue.empty();
    });

    if (m_shutdown) {
        return std::nullopt;
    }

    WorkItem item = m_queue.top();
    m_queue.pop();
    ++m_activeItems;
    if (item.type == WorkItem::Type::ScanFile) {
        --m_scanItems;
        m_spaceCv.notify_one();
    }

    LOG_DEBUG(rwIndex, "Dequeue %s (type=%d, queue depth=%d)",
              item.filePath.c_str(),
              static_cast<int>(item.type),
              static_cast<int>(m_queue.size()));

    return item;
}

void WorkQueue::markItemComplete()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_activeItems > 0) {
        --m_activeItems;
    }
}

// ── Folder removal ──────────────────────────────────────────

size_t WorkQueue::dropFolder(const QString& folderId)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    // Drain and rebuild without the folder's items. O(n), only runs when
    // a folder is unwatched.
    std::vector<WorkItem> items;
    items.reserve(m_queue.size());
    while (!m_queue.empty()) {
        items.push_back(m_queue.top());
        m_queue.pop();
    }

    size_t dropped = 0;
    for (WorkItem& item : items) {
        if (item.folderId == folderId) {
            ++dropped;
            if (item.type == WorkItem::Type::ScanFile) {
                --m_scanItems;
            }
            continue;
        }
        m_queue.push(std::move(item));
    }

    if (dropped > 0) {
        m_droppedItems += dropped;
        m_spaceCv.notify_all();
        LOG_INFO(rwIndex, "WorkQueue dropped %d items of folder %s",
                 static_cast<int>(dropped), qUtf8Printable(folderId));
    }
    return dropped;
}

// ── Shutdown ────────────────────────────────────────────────

void WorkQueue::shutdown()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_shutdown) {
        m_shutdown = true;
        LOG_INFO(rwIndex, "WorkQueue shutting down (depth=%d, dropped=%d)",
                 static_cast<int>(m_queue.size()),
                 static_cast<int>(m_droppedItems));
        m_cv.notify_all();
        m_spaceCv.notify_all();
    }
}

// ── Size / stats ────────────────────────────────────────────

size_t WorkQueue::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

size_t WorkQueue::scanBacklog() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_scanItems;
}

QueueStats WorkQueue::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    QueueStats s;
    s.depth = m_queue.size();
    s.scanDepth = m_scanItems;
    s.activeItems = m_activeItems;
    s.droppedItems = m_droppedItems;
    s.blockedProducers = m_blockedProducers;
    return s;
}

} // namespace rw
