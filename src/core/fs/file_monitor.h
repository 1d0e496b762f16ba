#pragma once

#include "core/shared/types.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace rw {

// FileMonitor - platform-agnostic interface for filesystem change detection.
//
// An implementation watches one root directory recursively and delivers
// raw notifications through the registered callback, on its own thread.
// Delivery is at-least-once and may contain duplicates; callers debounce.
// The callback must not block.
class FileMonitor {
public:
    virtual ~FileMonitor() = default;

    // Non-copyable, non-movable (implementations own OS resources)
    FileMonitor(const FileMonitor&) = delete;
    FileMonitor& operator=(const FileMonitor&) = delete;
    FileMonitor(FileMonitor&&) = delete;
    FileMonitor& operator=(FileMonitor&&) = delete;

    using EventCallback = std::function<void(const std::vector<RawFsEvent>&)>;

    // Start monitoring root. Calling start() while already running is an
    // error (returns false).
    virtual bool start(const std::string& root, EventCallback callback) = 0;

    // Stop monitoring. Blocks until any in-flight callback has completed.
    // Safe to call when not running (no-op).
    virtual void stop() = 0;

    virtual bool isRunning() const = 0;

protected:
    FileMonitor() = default;
};

using FileMonitorFactory = std::function<std::unique_ptr<FileMonitor>()>;

// Monitor for the current platform.
std::unique_ptr<FileMonitor> createPlatformFileMonitor();

} // namespace rw
