#include "core/fs/event_debouncer.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <unordered_set>

namespace rw {

// ── Construction ────────────────────────────────────────────

EventDebouncer::EventDebouncer(std::chrono::milliseconds idleWindow, SettledCallback callback)
    : m_idleWindow(idleWindow)
    , m_callback(std::move(callback))
{
}

EventDebouncer::~EventDebouncer()
{
    stop();
}

void EventDebouncer::start()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running) {
        return;
    }
    m_running = true;
    m_stopRequested = false;
    m_thread = std::thread([this] { timerLoop(); });
}

void EventDebouncer::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return;
        }
        m_stopRequested = true;
        m_cv.notify_all();
    }
    if (m_thread.joinable()) {
        m_thread.join();
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_running = false;
    if (!m_pending.empty()) {
        LOG_DEBUG(rwFs, "EventDebouncer stopped with %d pending paths",
                  static_cast<int>(m_pending.size()));
    }
    m_pending.clear();
    m_movedFromByCookie.clear();
}

// ── Ingress ─────────────────────────────────────────────────

void EventDebouncer::push(const RawFsEvent& event)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    pushLocked(event, Clock::now());
    m_cv.notify_all();
}

void EventDebouncer::push(const std::vector<RawFsEvent>& events)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const Clock::time_point now = Clock::now();
    for (const RawFsEvent& event : events) {
        pushLocked(event, now);
    }
    m_cv.notify_all();
}

EventDebouncer::PendingPath& EventDebouncer::arm(const std::string& path, Clock::time_point now)
{
    PendingPath& entry = m_pending[path];
    entry.deadline = now + m_idleWindow;
    entry.sequence = m_nextSequence++;
    return entry;
}

void EventDebouncer::pushLocked(const RawFsEvent& event, Clock::time_point now)
{
    const bool known = m_pending.count(event.path) > 0;

    switch (event.kind) {
    case RawFsEvent::Kind::Created:
    case RawFsEvent::Kind::Modified: {
        PendingPath& entry = arm(event.path, now);
        entry.isDirectory = entry.isDirectory || event.isDirectory;
        if (entry.kind == SettledEvent::Kind::Moved && !entry.removedAfterMove) {
            // Content touched after a rename: still a move, the consumer
            // compares fingerprints.
            break;
        }
        if (entry.removedAfterMove) {
            // Recreated at the destination: drop the old path, index the new.
            entry.removedAfterMove = false;
        }
        if (entry.kind != SettledEvent::Kind::Moved) {
            entry.kind = SettledEvent::Kind::Changed;
        }
        entry.moveCookie = 0;
        break;
    }
    case RawFsEvent::Kind::Deleted: {
        PendingPath& entry = arm(event.path, now);
        entry.isDirectory = entry.isDirectory || event.isDirectory;
        if (entry.kind == SettledEvent::Kind::Moved) {
            entry.removedAfterMove = true;
        } else {
            entry.kind = SettledEvent::Kind::Removed;
        }
        entry.moveCookie = 0;
        break;
    }
    case RawFsEvent::Kind::MovedFrom: {
        std::string origin = event.path;
        if (known) {
            const PendingPath& previous = m_pending[event.path];
            if (previous.kind == SettledEvent::Kind::Moved && !previous.movedFrom.empty()) {
                origin = previous.movedFrom;   // A -> B -> C settles as A -> C
            }
        }
        PendingPath& entry = arm(event.path, now);
        entry.isDirectory = entry.isDirectory || event.isDirectory;
        entry.kind = SettledEvent::Kind::Removed;
        entry.movedFrom = origin;
        entry.removedAfterMove = false;
        entry.moveCookie = event.cookie;
        if (event.cookie != 0) {
            m_movedFromByCookie[event.cookie] = event.path;
        }
        break;
    }
    case RawFsEvent::Kind::MovedTo: {
        std::string origin;
        auto cookieIt = event.cookie != 0 ? m_movedFromByCookie.find(event.cookie)
                                          : m_movedFromByCookie.end();
        if (cookieIt != m_movedFromByCookie.end()) {
            const std::string sourcePath = cookieIt->second;
            m_movedFromByCookie.erase(cookieIt);
            auto sourceIt = m_pending.find(sourcePath);
            if (sourceIt != m_pending.end() && sourceIt->second.moveCookie == event.cookie) {
                origin = sourceIt->second.movedFrom.empty() ? sourcePath
                                                            : sourceIt->second.movedFrom;
                m_pending.erase(sourceIt);
            }
        }

        PendingPath& entry = arm(event.path, now);
        entry.isDirectory = entry.isDirectory || event.isDirectory;
        entry.moveCookie = 0;
        entry.removedAfterMove = false;
        if (!origin.empty() && origin != event.path) {
            entry.kind = SettledEvent::Kind::Moved;
            entry.movedFrom = origin;
        } else {
            entry.kind = SettledEvent::Kind::Changed;
            entry.movedFrom.clear();
        }
        break;
    }
    }
}

// ── Settlement ──────────────────────────────────────────────

std::vector<SettledEvent> EventDebouncer::takeDueLocked(Clock::time_point now, bool all)
{
    struct Due {
        uint64_t sequence;
        Clock::time_point deadline;
        std::string path;
    };
    std::vector<Due> due;
    for (const auto& [path, entry] : m_pending) {
        if (all || entry.deadline <= now) {
            due.push_back(Due{entry.sequence, entry.deadline, path});
        }
    }
    std::sort(due.begin(), due.end(), [](const Due& a, const Due& b) {
        return a.sequence < b.sequence;
    });

    std::vector<SettledEvent> settled;
    settled.reserve(due.size());
    std::unordered_set<std::string> settledNow;

    // The origin of a move is reported gone only while nothing else
    // happened at that path; a re-created origin settles on its own.
    auto originGone = [&](const std::string& origin) {
        return m_pending.count(origin) == 0 && settledNow.count(origin) == 0;
    };

    for (const Due& d : due) {
        auto it = m_pending.find(d.path);
        const PendingPath entry = it->second;
        m_pending.erase(it);
        settledNow.insert(d.path);
        if (entry.moveCookie != 0) {
            m_movedFromByCookie.erase(entry.moveCookie);
        }

        SettledEvent event;
        event.path = d.path;
        event.isDirectory = entry.isDirectory;
        const bool movedThenRemoved =
            (entry.kind == SettledEvent::Kind::Moved && entry.removedAfterMove)
            // A -> B then B moved out of the tree: A is gone too.
            || (entry.kind == SettledEvent::Kind::Removed && !entry.movedFrom.empty()
                && entry.movedFrom != d.path);
        if (movedThenRemoved) {
            if (originGone(entry.movedFrom)) {
                SettledEvent oldRemoved;
                oldRemoved.kind = SettledEvent::Kind::Removed;
                oldRemoved.path = entry.movedFrom;
                oldRemoved.isDirectory = entry.isDirectory;
                settled.push_back(std::move(oldRemoved));
                settledNow.insert(entry.movedFrom);
            }
            event.kind = SettledEvent::Kind::Removed;
        } else {
            event.kind = entry.kind;
            if (entry.kind == SettledEvent::Kind::Moved) {
                event.oldPath = entry.movedFrom;
            }
        }
        settled.push_back(std::move(event));
    }
    m_settledCount += settled.size();
    return settled;
}

void EventDebouncer::timerLoop()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stopRequested) {
        if (m_pending.empty()) {
            m_cv.wait(lock, [this] { return m_stopRequested || !m_pending.empty(); });
            continue;
        }

        Clock::time_point earliest = Clock::time_point::max();
        for (const auto& [_, entry] : m_pending) {
            earliest = std::min(earliest, entry.deadline);
        }
        if (Clock::now() < earliest) {
            m_cv.wait_until(lock, earliest);
            continue;
        }

        std::vector<SettledEvent> settled = takeDueLocked(Clock::now(), false);
        ++m_delivering;
        lock.unlock();
        {
            std::lock_guard<std::mutex> deliveryLock(m_deliveryMutex);
            for (const SettledEvent& event : settled) {
                LOG_DEBUG(rwFs, "Settled %s: %s",
                          qUtf8Printable(settledEventKindToString(event.kind)),
                          event.path.c_str());
                m_callback(event);
            }
        }
        lock.lock();
        --m_delivering;
    }
}

void EventDebouncer::flush()
{
    std::vector<SettledEvent> settled;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        settled = takeDueLocked(Clock::now(), true);
        ++m_delivering;
    }
    {
        std::lock_guard<std::mutex> deliveryLock(m_deliveryMutex);
        for (const SettledEvent& event : settled) {
            m_callback(event);
        }
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    --m_delivering;
}

size_t EventDebouncer::pendingCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.size();
}

bool EventDebouncer::isQuiet() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.empty() && m_delivering == 0;
}

uint64_t EventDebouncer::settledCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_settledCount;
}

} // namespace rw
