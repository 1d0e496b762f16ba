#include "core/indexing/worker_pool.h"
#include "core/shared/logging.h"

#include <exception>

namespace rw {

WorkerPool::WorkerPool(size_t workerCount, size_t scanCapacity)
    : m_workerCount(workerCount > 0 ? workerCount : 1)
    , m_queue(scanCapacity)
{
}

WorkerPool::~WorkerPool()
{
    stop();
}

void WorkerPool::start()
{
    if (!m_threads.empty()) {
        return;
    }
    m_threads.reserve(m_workerCount);
    for (size_t i = 0; i < m_workerCount; ++i) {
        m_threads.emplace_back([this, i] { workerLoop(i); });
    }
    LOG_INFO(rwIndex, "WorkerPool started with %d workers (scan capacity %d)",
             static_cast<int>(m_workerCount), static_cast<int>(m_queue.capacity()));
}

void WorkerPool::stop()
{
    m_queue.shutdown();
    for (std::thread& thread : m_threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    if (!m_threads.empty()) {
        LOG_INFO(rwIndex, "WorkerPool stopped");
    }
    m_threads.clear();
}

void WorkerPool::workerLoop(size_t workerIndex)
{
    LOG_DEBUG(rwIndex, "Worker %d started", static_cast<int>(workerIndex));

    while (true) {
        std::optional<WorkItem> item = m_queue.dequeue();
        if (!item.has_value()) {
            break;
        }

        m_running.fetch_add(1);
        if (item->run) {
            try {
                item->run();
            } catch (const std::exception& e) {
                LOG_ERROR(rwIndex, "Worker %d: task for %s threw: %s",
                          static_cast<int>(workerIndex), item->filePath.c_str(), e.what());
            }
        }
        m_running.fetch_sub(1);
        m_queue.markItemComplete();
    }

    LOG_DEBUG(rwIndex, "Worker %d exiting", static_cast<int>(workerIndex));
}

} // namespace rw
