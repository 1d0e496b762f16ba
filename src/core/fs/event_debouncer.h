#pragma once

#include "core/shared/types.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace rw {

// EventDebouncer - collapses bursts of raw notifications per path into one
// settled logical event.
//
// Per path: Quiet -> Pending on the first raw event; every further event
// for the path re-arms the idle window; once the window elapses with no new
// event the path settles and goes back to Quiet.
//
// Coalescing:
//   created / modified            -> changed(path)
//   deleted                       -> removed(path)
//   moved-from X then moved-to Y
//   (same cookie, before settling) -> moved(X, Y)
//   moved-from X without partner  -> removed(X)
//   moved-to Y without partner    -> changed(Y)
// A moved entry that is then deleted settles as removed for both paths.
//
// Settled events are delivered on the debouncer's own thread in settlement
// order. The callback must not block for long.
class EventDebouncer {
public:
    using Clock = std::chrono::steady_clock;
    using SettledCallback = std::function<void(const SettledEvent&)>;

    EventDebouncer(std::chrono::milliseconds idleWindow, SettledCallback callback);
    ~EventDebouncer();

    EventDebouncer(const EventDebouncer&) = delete;
    EventDebouncer& operator=(const EventDebouncer&) = delete;
    EventDebouncer(EventDebouncer&&) = delete;
    EventDebouncer& operator=(EventDebouncer&&) = delete;

    void start();

    // Stops the timer thread. Pending paths are dropped unless flush()
    // was called first.
    void stop();

    void push(const RawFsEvent& event);
    void push(const std::vector<RawFsEvent>& events);

    // Settle every pending path now, on the calling thread.
    void flush();

    size_t pendingCount() const;
    uint64_t settledCount() const;

    // No path pending and no settled event being delivered.
    bool isQuiet() const;

private:
    struct PendingPath {
        SettledEvent::Kind kind = SettledEvent::Kind::Changed;
        std::string movedFrom;        // origin path when kind == Moved
        bool removedAfterMove = false;
        bool isDirectory = false;
        uint32_t moveCookie = 0;      // set while waiting for a moved-to partner
        Clock::time_point deadline;
        uint64_t sequence = 0;
    };

    void pushLocked(const RawFsEvent& event, Clock::time_point now);
    PendingPath& arm(const std::string& path, Clock::time_point now);
    void timerLoop();

    // Removes due entries (all when `all` is set), in settlement order.
    std::vector<SettledEvent> takeDueLocked(Clock::time_point now, bool all);

    const std::chrono::milliseconds m_idleWindow;
    SettledCallback m_callback;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::unordered_map<std::string, PendingPath> m_pending;
    std::unordered_map<uint32_t, std::string> m_movedFromByCookie;
    uint64_t m_nextSequence = 0;
    uint64_t m_settledCount = 0;
    int m_delivering = 0;
    bool m_running = false;
    bool m_stopRequested = false;
    std::thread m_thread;

    // Serializes callback delivery between the timer thread and flush().
    std::mutex m_deliveryMutex;
};

} // namespace rw
