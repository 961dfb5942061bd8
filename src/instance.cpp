#include "instance.hpp"

#include <cerrno>
#include <climits>
#include <cstring>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/file.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "common.hpp"

const char *const kSingleInstanceLockfile = "single_instance.lock";

// ─────────────────────────────────────
InstanceLock::~InstanceLock() {
    Release();
}

// ─────────────────────────────────────
bool InstanceLock::TryAcquire(const std::filesystem::path &runtime_dir) {
    if (m_Fd >= 0) {
        return true;
    }

    const auto path = runtime_dir / (std::string(AW_TRAY_NAME) + ".pid");
    const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        spdlog::error("Unable to open {}: {}", path.string(), std::strerror(errno));
        return false;
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) < 0) {
        const int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            spdlog::debug("{} is locked by another instance", path.string());
        } else {
            spdlog::error("flock({}) failed: {}", path.string(), std::strerror(err));
        }
        return false;
    }

    const std::string pid = std::to_string(::getpid()) + "\n";
    if (::ftruncate(fd, 0) < 0 || ::write(fd, pid.data(), pid.size()) < 0) {
        spdlog::warn("Unable to write pid to {}: {}", path.string(), std::strerror(errno));
    }

    m_Fd = fd;
    return true;
}

// ─────────────────────────────────────
void InstanceLock::Release() {
    if (m_Fd >= 0) {
        ::close(m_Fd);
        m_Fd = -1;
    }
}

// ─────────────────────────────────────
bool SignalRunningInstance(const std::filesystem::path &config_dir) {
    std::error_code ec;
    std::filesystem::create_directories(config_dir, ec);
    if (ec) {
        spdlog::error("Unable to create {}: {}", config_dir.string(), ec.message());
        return false;
    }

    const auto path = config_dir / kSingleInstanceLockfile;
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        spdlog::error("Unable to write {}", path.string());
        return false;
    }
    out << ::getpid() << "\n";
    return static_cast<bool>(out);
}

// ─────────────────────────────────────
LockfileWatcher::LockfileWatcher(std::filesystem::path dir, Callback callback)
    : m_Dir(std::move(dir)), m_Callback(std::move(callback)) {}

// ─────────────────────────────────────
LockfileWatcher::~LockfileWatcher() {
    Stop();
}

// ─────────────────────────────────────
bool LockfileWatcher::Start() {
    if (m_Thread.joinable()) {
        return true;
    }

    m_Fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (m_Fd < 0) {
        spdlog::error("inotify_init1 failed: {}", std::strerror(errno));
        return false;
    }

    m_Wd = inotify_add_watch(m_Fd, m_Dir.c_str(), IN_CLOSE_WRITE | IN_MOVED_TO | IN_CREATE);
    if (m_Wd < 0) {
        spdlog::error("Unable to watch {}: {}", m_Dir.string(), std::strerror(errno));
        ::close(m_Fd);
        m_Fd = -1;
        return false;
    }

    // A lockfile left over from before we started counts as a request too.
    Consume();

    m_Stop = false;
    m_Thread = std::thread(&LockfileWatcher::ThreadProc, this);
    spdlog::debug("Watching {} for {}", m_Dir.string(), kSingleInstanceLockfile);
    return true;
}

// ─────────────────────────────────────
void LockfileWatcher::Stop() {
    m_Stop = true;
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
    if (m_Wd >= 0) {
        inotify_rm_watch(m_Fd, m_Wd);
        m_Wd = -1;
    }
    if (m_Fd >= 0) {
        ::close(m_Fd);
        m_Fd = -1;
    }
}

// ─────────────────────────────────────
bool LockfileWatcher::Consume() {
    std::error_code ec;
    const auto path = m_Dir / kSingleInstanceLockfile;
    if (!std::filesystem::remove(path, ec)) {
        if (ec) {
            spdlog::warn("Failed to remove {}: {}", path.string(), ec.message());
        }
        return false;
    }

    spdlog::info("Another instance was started, showing this one");
    if (m_Callback) {
        m_Callback();
    }
    return true;
}

// ─────────────────────────────────────
void LockfileWatcher::ThreadProc() {
    std::vector<char> buffer(sizeof(struct inotify_event) + NAME_MAX + 1);
    while (!m_Stop) {
        pollfd pfd{m_Fd, POLLIN, 0};
        const int rc = ::poll(&pfd, 1, 200);
        if (rc <= 0) {
            continue;
        }

        const ssize_t len = ::read(m_Fd, buffer.data(), buffer.size());
        if (len <= 0) {
            continue;
        }

        bool matched = false;
        for (char *ptr = buffer.data(); ptr < buffer.data() + len;) {
            auto *ev = reinterpret_cast<struct inotify_event *>(ptr);
            if (ev->len > 0 && std::strcmp(ev->name, kSingleInstanceLockfile) == 0) {
                matched = true;
            }
            ptr += sizeof(struct inotify_event) + ev->len;
        }
        if (matched) {
            Consume();
        }
    }
}
