#include "core/fs/file_monitor_linux.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFileInfo>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace rw {

namespace {

constexpr uint32_t kWatchMask = IN_CREATE | IN_CLOSE_WRITE | IN_MODIFY | IN_ATTRIB
    | IN_MOVED_FROM | IN_MOVED_TO | IN_DELETE | IN_DELETE_SELF | IN_ONLYDIR;

constexpr size_t kReadBufferSize = 64 * 1024;

std::string joinPath(const std::string& dir, const char* name)
{
    if (dir.empty() || dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

} // namespace

std::unique_ptr<FileMonitor> createPlatformFileMonitor()
{
    return std::make_unique<FileMonitorLinux>();
}

// ── Construction / destruction ──────────────────────────────

FileMonitorLinux::FileMonitorLinux() = default;

FileMonitorLinux::~FileMonitorLinux()
{
    stop();
}

// ── Start / stop ────────────────────────────────────────────

bool FileMonitorLinux::start(const std::string& root, EventCallback callback)
{
    if (m_running.load()) {
        LOG_WARN(rwFs, "FileMonitorLinux::start() called while already running");
        return false;
    }
    if (!callback) {
        LOG_ERROR(rwFs, "FileMonitorLinux::start() called without a callback");
        return false;
    }

    m_inotifyFd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (m_inotifyFd < 0) {
        LOG_ERROR(rwFs, "inotify_init1 failed: %s", std::strerror(errno));
        return false;
    }
    if (pipe2(m_wakeFds, O_NONBLOCK | O_CLOEXEC) != 0) {
        LOG_ERROR(rwFs, "pipe2 failed: %s", std::strerror(errno));
        close(m_inotifyFd);
        m_inotifyFd = -1;
        return false;
    }

    m_root = root;
    m_callback = std::move(callback);

    addWatchesRecursive(m_root, false, nullptr);
    if (watchCount() == 0) {
        LOG_ERROR(rwFs, "FileMonitorLinux: could not watch root %s", m_root.c_str());
        stop();
        return false;
    }

    m_running.store(true);
    m_thread = std::thread([this] { readLoop(); });

    LOG_INFO(rwFs, "FileMonitorLinux started for %s (%d watches)",
             m_root.c_str(), static_cast<int>(watchCount()));
    return true;
}

void FileMonitorLinux::stop()
{
    const bool wasRunning = m_running.exchange(false);
    if (wasRunning && m_wakeFds[1] >= 0) {
        const char byte = 'x';
        if (write(m_wakeFds[1], &byte, 1) < 0 && errno != EAGAIN) {
            LOG_WARN(rwFs, "FileMonitorLinux wake write failed: %s", std::strerror(errno));
        }
    }
    if (m_thread.joinable()) {
        m_thread.join();
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_wdToPath.clear();
        m_pathToWd.clear();
    }
    if (m_inotifyFd >= 0) {
        close(m_inotifyFd);
        m_inotifyFd = -1;
    }
    for (int& fd : m_wakeFds) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
    if (wasRunning) {
        LOG_INFO(rwFs, "FileMonitorLinux stopped for %s", m_root.c_str());
    }
}

bool FileMonitorLinux::isRunning() const
{
    return m_running.load();
}

size_t FileMonitorLinux::watchCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_wdToPath.size();
}

// ── Reader thread ───────────────────────────────────────────

void FileMonitorLinux::readLoop()
{
    std::vector<char> buffer(kReadBufferSize);

    while (m_running.load()) {
        pollfd fds[2];
        fds[0].fd = m_inotifyFd;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = m_wakeFds[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        const int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR(rwFs, "FileMonitorLinux poll failed: %s", std::strerror(errno));
            break;
        }
        if (fds[1].revents & POLLIN) {
            break;
        }
        if (!(fds[0].revents & POLLIN)) {
            continue;
        }

        std::vector<RawFsEvent> events;
        for (;;) {
            const ssize_t length = read(m_inotifyFd, buffer.data(), buffer.size());
            if (length <= 0) {
                if (length < 0 && errno != EAGAIN && errno != EINTR) {
                    LOG_WARN(rwFs, "FileMonitorLinux read failed: %s", std::strerror(errno));
                }
                break;
            }
            handleBuffer(buffer.data(), length, events);
        }

        if (!events.empty() && m_running.load()) {
            m_callback(events);
        }
    }
}

void FileMonitorLinux::handleBuffer(const char* buffer, ssize_t length,
                                    std::vector<RawFsEvent>& out)
{
    ssize_t offset = 0;
    while (offset < length) {
        const auto* event = reinterpret_cast<const inotify_event*>(buffer + offset);
        offset += static_cast<ssize_t>(sizeof(inotify_event) + event->len);

        if (event->mask & IN_Q_OVERFLOW) {
            LOG_WARN(rwFs, "inotify queue overflow under %s, requesting rescan", m_root.c_str());
            RawFsEvent rescan;
            rescan.kind = RawFsEvent::Kind::Modified;
            rescan.path = m_root;
            rescan.isDirectory = true;
            out.push_back(std::move(rescan));
            continue;
        }

        std::string dirPath;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_wdToPath.find(event->wd);
            if (it == m_wdToPath.end()) {
                continue;
            }
            dirPath = it->second;
        }

        if (event->mask & (IN_IGNORED | IN_DELETE_SELF)) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_wdToPath.erase(event->wd);
            m_pathToWd.erase(dirPath);
            continue;
        }
        if (event->len == 0) {
            continue;
        }

        RawFsEvent raw;
        raw.path = joinPath(dirPath, event->name);
        raw.cookie = event->cookie;
        raw.isDirectory = (event->mask & IN_ISDIR) != 0;

        if (event->mask & IN_CREATE) {
            raw.kind = RawFsEvent::Kind::Created;
        } else if (event->mask & IN_MOVED_FROM) {
            raw.kind = RawFsEvent::Kind::MovedFrom;
        } else if (event->mask & IN_MOVED_TO) {
            raw.kind = RawFsEvent::Kind::MovedTo;
        } else if (event->mask & IN_DELETE) {
            raw.kind = RawFsEvent::Kind::Deleted;
        } else {
            raw.kind = RawFsEvent::Kind::Modified;
        }

        if (raw.isDirectory) {
            if (raw.kind == RawFsEvent::Kind::Created || raw.kind == RawFsEvent::Kind::MovedTo) {
                out.push_back(raw);
                addWatchesRecursive(raw.path, true, &out);
                continue;
            }
            if (raw.kind == RawFsEvent::Kind::MovedFrom) {
                removeWatchesUnder(raw.path);
            }
        }
        out.push_back(std::move(raw));
    }
}

// ── Watch bookkeeping ───────────────────────────────────────

void FileMonitorLinux::addWatchesRecursive(const std::string& dirPath,
                                           bool reportFiles,
                                           std::vector<RawFsEvent>* out,
                                           int depth)
{
    if (depth >= kMaxDepth) {
        LOG_WARN(rwFs, "Max watch depth (%d) reached at: %s", kMaxDepth, dirPath.c_str());
        return;
    }
    if (!addWatch(dirPath)) {
        return;
    }

    const QDir dir(QString::fromStdString(dirPath));
    const QFileInfoList entries = dir.entryInfoList(
        QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden, QDir::Name);
    for (const QFileInfo& fi : entries) {
        const std::string childPath = fi.absoluteFilePath().toStdString();
        if (fi.isDir()) {
            if (!fi.isSymLink()) {
                addWatchesRecursive(childPath, reportFiles, out, depth + 1);
            }
            continue;
        }
        if (reportFiles && out) {
            RawFsEvent created;
            created.kind = RawFsEvent::Kind::Created;
            created.path = childPath;
            out->push_back(std::move(created));
        }
    }
}

bool FileMonitorLinux::addWatch(const std::string& dirPath)
{
    const int wd = inotify_add_watch(m_inotifyFd, dirPath.c_str(), kWatchMask);
    if (wd < 0) {
        LOG_WARN(rwFs, "inotify_add_watch failed for %s: %s", dirPath.c_str(), std::strerror(errno));
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_wdToPath[wd] = dirPath;
    m_pathToWd[dirPath] = wd;
    return true;
}

void FileMonitorLinux::removeWatchesUnder(const std::string& dirPath)
{
    const std::string prefix = dirPath + "/";
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto it = m_pathToWd.begin(); it != m_pathToWd.end();) {
        if (it->first == dirPath || it->first.compare(0, prefix.size(), prefix) == 0) {
            inotify_rm_watch(m_inotifyFd, it->second);
            m_wdToPath.erase(it->second);
            it = m_pathToWd.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace rw
