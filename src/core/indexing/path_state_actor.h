#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace rw {

// One logical mutation for a path, produced from a settled event or the
// initial scan.
struct PathTask {
    enum class Kind {
        Sync,      // bring the index in line with what is on disk now
        Remove,    // path is gone
        Move,      // path renamed to newPath
    };

    Kind kind = Kind::Sync;
    std::string path;          // key; the old path for Move
    std::string newPath;       // Move only
    bool isDirectory = false;
    bool fromScan = false;
};

const char* pathTaskKindName(PathTask::Kind kind);

// PathStateActor - per-path ordering and supersession for one folder.
//
// At most one task per path is in flight. Tasks arriving while one is in
// flight queue behind it; adjacent Sync/Remove tasks merge into a single
// Sync (which re-checks the disk), moves keep their order. Every ingress
// bumps the path's generation so an in-flight task can tell, before it
// commits, that a newer event has settled and a follow-up task is queued.
class PathStateActor {
public:
    struct DispatchTask {
        PathTask task;
        uint64_t generation = 0;
    };

    PathStateActor() = default;

    // Non-copyable, non-movable
    PathStateActor(const PathStateActor&) = delete;
    PathStateActor& operator=(const PathStateActor&) = delete;
    PathStateActor(PathStateActor&&) = delete;
    PathStateActor& operator=(PathStateActor&&) = delete;

    // Returns the task to dispatch now, or nullopt if it was queued behind
    // the in-flight task for the same path.
    std::optional<DispatchTask> onIngress(const PathTask& task);

    // Called when the in-flight task for `key` has finished. Returns the
    // next queued task for that path, which is now in flight.
    std::optional<DispatchTask> onTaskCompleted(const std::string& key);

    bool isStale(const std::string& key, uint64_t generation) const;

    // Bumps the generation of every tracked path under `prefix` (directory
    // moves and removals supersede work on the files below).
    void bumpGenerationsUnder(const std::string& prefix);

    size_t inFlightCount() const;
    size_t pendingCount() const;
    bool isIdle() const;

    void reset();

private:
    struct PathState {
        uint64_t latestGeneration = 0;
        bool inFlight = false;
        std::deque<PathTask> pending;
    };

    static bool mergeInto(PathTask& queued, const PathTask& incoming);
    void forgetIfIdleLocked(const std::string& key);

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, PathState> m_paths;
    size_t m_inFlight = 0;
};

} // namespace rw
