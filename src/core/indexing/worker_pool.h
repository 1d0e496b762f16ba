#pragma once

#include "core/indexing/work_queue.h"

#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

namespace rw {

// WorkerPool - fixed set of threads draining one WorkQueue.
//
// Shared by every watched folder so that a large bulk scan in one folder
// cannot starve another: all folders compete for the same bounded slots
// and events outrank scan items in the queue.
class WorkerPool {
public:
    WorkerPool(size_t workerCount, size_t scanCapacity);
    ~WorkerPool();

    // Non-copyable, non-movable (thread ownership)
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    void start();

    // Shuts the queue down and joins every worker. Items still queued
    // are discarded; running items finish first.
    void stop();

    WorkQueue& queue() { return m_queue; }
    const WorkQueue& queue() const { return m_queue; }

    size_t workerCount() const { return m_workerCount; }
    size_t runningCount() const { return m_running.load(); }
    bool isStarted() const { return !m_threads.empty(); }

private:
    void workerLoop(size_t workerIndex);

    const size_t m_workerCount;
    WorkQueue m_queue;
    std::vector<std::thread> m_threads;
    std::atomic<size_t> m_running{0};
};

} // namespace rw
