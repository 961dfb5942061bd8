#include "process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <thread>

#include <spdlog/spdlog.h>

namespace {
// ─────────────────────────────────────
void CloseFd(int &fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// ─────────────────────────────────────
// The child leads its own process group; signal all of it so helpers a wrapper
// script started go down with it.
int SignalGroup(pid_t pid, int sig) {
    if (::kill(-pid, sig) == 0) {
        return 0;
    }
    if (errno != ESRCH) {
        return -1;
    }
    // Group not set up yet
    return ::kill(pid, sig);
}

// ─────────────────────────────────────
void AppendTail(std::string &out, const char *data, std::size_t size) {
    out.append(data, size);
    if (out.size() > ChildProcess::kMaxOutput) {
        out.erase(0, out.size() - ChildProcess::kMaxOutput);
    }
}
} // namespace

// ─────────────────────────────────────
std::string ExitInfo::Describe() const {
    if (exited_normally) {
        return "exit code " + std::to_string(exit_code);
    }
    if (signal != 0) {
        return "signal " + std::to_string(signal) + " (" + strsignal(signal) + ")";
    }
    return "unknown status";
}

// ─────────────────────────────────────
ChildProcess::ChildProcess(const std::string &executable, const std::vector<std::string> &args) {
    int outPipe[2] = {-1, -1};
    int statusPipe[2] = {-1, -1};

    if (::pipe2(outPipe, O_CLOEXEC) < 0) {
        throw ProcessError("pipe failed: " + std::string(std::strerror(errno)));
    }
    if (::pipe2(statusPipe, O_CLOEXEC) < 0) {
        const int err = errno;
        CloseFd(outPipe[0]);
        CloseFd(outPipe[1]);
        throw ProcessError("pipe failed: " + std::string(std::strerror(err)));
    }

    // argv must be built before fork; only async-signal-safe calls in the child
    std::vector<char *> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char *>(executable.c_str()));
    for (const auto &arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        CloseFd(outPipe[0]);
        CloseFd(outPipe[1]);
        CloseFd(statusPipe[0]);
        CloseFd(statusPipe[1]);
        throw ProcessError("fork failed: " + std::string(std::strerror(err)));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        const int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(outPipe[1], STDERR_FILENO);
        ::execvp(argv[0], argv.data());

        const int err = errno;
        ssize_t ignored = ::write(statusPipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Also set from the parent so the group exists before any signal is sent.
    // EACCES means the child has already exec'd with its own setpgid done.
    if (::setpgid(pid, pid) < 0 && errno != EACCES) {
        spdlog::debug("setpgid({}) failed: {}", pid, std::strerror(errno));
    }

    CloseFd(outPipe[1]);
    CloseFd(statusPipe[1]);

    // The status pipe closes on a successful exec, otherwise it carries errno.
    int execErr = 0;
    ssize_t n;
    do {
        n = ::read(statusPipe[0], &execErr, sizeof(execErr));
    } while (n < 0 && errno == EINTR);
    CloseFd(statusPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(execErr))) {
        ::waitpid(pid, nullptr, 0);
        CloseFd(outPipe[0]);
        throw ProcessError("Failed to start " + executable + ": " + std::strerror(execErr));
    }

    m_Pid = pid;
    m_OutFd = outPipe[0];
}

// ─────────────────────────────────────
ChildProcess::~ChildProcess() {
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        if (!m_Reaped && m_Pid > 0) {
            SignalGroup(m_Pid, SIGKILL);
            ::waitpid(m_Pid, nullptr, 0);
            m_Reaped = true;
        }
    }
    CloseFd(m_OutFd);
}

// ─────────────────────────────────────
bool ChildProcess::Terminate() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (m_Reaped || m_Pid <= 0) {
        return false;
    }
    if (SignalGroup(m_Pid, SIGTERM) < 0) {
        spdlog::warn("Failed to send SIGTERM to pid {}: {}", m_Pid, std::strerror(errno));
        return false;
    }
    return true;
}

// ─────────────────────────────────────
bool ChildProcess::Kill() {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (m_Reaped || m_Pid <= 0) {
        return false;
    }
    return SignalGroup(m_Pid, SIGKILL) == 0;
}

// ─────────────────────────────────────
bool ChildProcess::TryReap(int &status) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    if (m_Reaped) {
        return true;
    }

    const pid_t r = ::waitpid(m_Pid, &status, WNOHANG);
    if (r == m_Pid) {
        m_Reaped = true;
        return true;
    }
    if (r < 0 && errno != EINTR) {
        spdlog::warn("waitpid({}) failed: {}", m_Pid, std::strerror(errno));
        status = 0;
        m_Reaped = true;
        return true;
    }
    return false;
}

// ─────────────────────────────────────
bool ChildProcess::DrainOutput(std::string &out, int timeout_ms) {
    if (m_OutFd < 0) {
        return false;
    }

    pollfd pfd;
    pfd.fd = m_OutFd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    const int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc <= 0) {
        return true;
    }

    char buf[4096];
    const ssize_t n = ::read(m_OutFd, buf, sizeof(buf));
    if (n > 0) {
        AppendTail(out, buf, static_cast<std::size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }

    // EOF or error: every writer is gone
    CloseFd(m_OutFd);
    return false;
}

// ─────────────────────────────────────
ExitInfo ChildProcess::Wait() {
    ExitInfo info;
    int status = 0;

    // Poll instead of blocking in waitpid so output from a chatty child never fills the pipe.
    while (!TryReap(status)) {
        if (!DrainOutput(info.output, 200)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    // Pick up whatever the child wrote right before exiting.
    while (m_OutFd >= 0) {
        pollfd pfd{m_OutFd, POLLIN, 0};
        if (::poll(&pfd, 1, 0) <= 0) {
            break;
        }
        if (!DrainOutput(info.output, 0)) {
            break;
        }
    }
    CloseFd(m_OutFd);

    if (WIFEXITED(status)) {
        info.exited_normally = true;
        info.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        info.signal = WTERMSIG(status);
    }
    return info;
}
