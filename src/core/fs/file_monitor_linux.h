#pragma once

#include "core/fs/file_monitor.h"

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace rw {

// FileMonitorLinux - inotify-based recursive monitor.
//
// One watch descriptor per directory below the root. New directories
// (created or moved in) get watches as their events arrive, and the files
// already inside them are reported as Created to close the race between
// mkdir and the watch being added. A self-pipe wakes the reader thread
// on stop(). Queue overflow is reported as a Modified event on the root
// directory so the consumer rescans.
class FileMonitorLinux final : public FileMonitor {
public:
    FileMonitorLinux();
    ~FileMonitorLinux() override;

    bool start(const std::string& root, EventCallback callback) override;
    void stop() override;
    bool isRunning() const override;

    size_t watchCount() const;

private:
    void readLoop();
    void handleBuffer(const char* buffer, ssize_t length, std::vector<RawFsEvent>& out);

    // Add watches for dirPath and every directory below it. When
    // reportFiles is set, existing files are appended to out as Created.
    void addWatchesRecursive(const std::string& dirPath,
                             bool reportFiles,
                             std::vector<RawFsEvent>* out,
                             int depth = 0);
    bool addWatch(const std::string& dirPath);
    void removeWatchesUnder(const std::string& dirPath);

    static constexpr int kMaxDepth = 64;

    int m_inotifyFd = -1;
    int m_wakeFds[2] = {-1, -1};
    std::atomic<bool> m_running{false};
    std::thread m_thread;

    std::string m_root;
    EventCallback m_callback;

    // Protects the descriptor maps
    mutable std::mutex m_mutex;
    std::unordered_map<int, std::string> m_wdToPath;
    std::unordered_map<std::string, int> m_pathToWd;
};

} // namespace rw
