#include "core/indexing/path_state_actor.h"

namespace rw {

const char* pathTaskKindName(PathTask::Kind kind)
{
    switch (kind) {
    case PathTask::Kind::Sync:   return "sync";
    case PathTask::Kind::Remove: return "remove";
    case PathTask::Kind::Move:   return "move";
    }
    return "sync";
}

std::optional<PathStateActor::DispatchTask> PathStateActor::onIngress(const PathTask& task)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    PathState& state = m_paths[task.path];
    state.latestGeneration += 1;

    if (state.inFlight) {
        if (state.pending.empty() || !mergeInto(state.pending.back(), task)) {
            state.pending.push_back(task);
        }
        return std::nullopt;
    }

    state.inFlight = true;
    ++m_inFlight;
    DispatchTask dispatch;
    dispatch.task = task;
    dispatch.generation = state.latestGeneration;
    return dispatch;
}

std::optional<PathStateActor::DispatchTask> PathStateActor::onTaskCompleted(const std::string& key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_paths.find(key);
    if (it == m_paths.end() || !it->second.inFlight) {
        return std::nullopt;
    }

    PathState& state = it->second;
    if (!state.pending.empty()) {
        DispatchTask dispatch;
        dispatch.task = std::move(state.pending.front());
        state.pending.pop_front();
        dispatch.generation = state.latestGeneration;
        return dispatch;
    }

    state.inFlight = false;
    --m_inFlight;
    forgetIfIdleLocked(key);
    return std::nullopt;
}

bool PathStateActor::isStale(const std::string& key, uint64_t generation) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_paths.find(key);
    if (it == m_paths.end()) {
        return false;
    }
    return generation < it->second.latestGeneration;
}

void PathStateActor::bumpGenerationsUnder(const std::string& prefix)
{
    std::string dirPrefix = prefix;
    if (dirPrefix.empty() || dirPrefix.back() != '/') {
        dirPrefix.push_back('/');
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& [path, state] : m_paths) {
        if (path.compare(0, dirPrefix.size(), dirPrefix) == 0) {
            state.latestGeneration += 1;
        }
    }
}

size_t PathStateActor::inFlightCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_inFlight;
}

size_t PathStateActor::pendingCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t count = 0;
    for (const auto& [_, state] : m_paths) {
        count += state.pending.size();
    }
    return count;
}

bool PathStateActor::isIdle() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_inFlight == 0;
}

void PathStateActor::reset()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_paths.clear();
    m_inFlight = 0;
}

bool PathStateActor::mergeInto(PathTask& queued, const PathTask& incoming)
{
    if (queued.kind == PathTask::Kind::Move || incoming.kind == PathTask::Kind::Move) {
        return false;
    }

    // Remove + Remove stays a Remove; any mix becomes a Sync, which looks
    // at the disk and removes the path if it is gone.
    if (queued.kind != incoming.kind) {
        queued.kind = PathTask::Kind::Sync;
    }
    queued.isDirectory = queued.isDirectory || incoming.isDirectory;
    queued.fromScan = queued.fromScan && incoming.fromScan;
    return true;
}

void PathStateActor::forgetIfIdleLocked(const std::string& key)
{
    // Generations only matter while a task for the path can still commit.
    auto it = m_paths.find(key);
    if (it != m_paths.end() && !it->second.inFlight && it->second.pending.empty()) {
        m_paths.erase(it);
    }
}

} // namespace rw
