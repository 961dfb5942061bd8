#pragma once

#include <sys/types.h>

#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

class ProcessError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

struct ExitInfo {
    bool exited_normally = false;
    int exit_code = -1;
    int signal = 0;
    std::string output; // combined stdout/stderr, tail only

    bool Success() const {
        return exited_normally && exit_code == 0;
    }
    std::string Describe() const;
};

// A spawned child with its stdout/stderr captured through a pipe.
class ChildProcess {
  public:
    static constexpr std::size_t kMaxOutput = 64 * 1024;

    // Throws ProcessError when fork fails or the executable can't be exec'd.
    ChildProcess(const std::string &executable, const std::vector<std::string> &args);
    ~ChildProcess();

    ChildProcess(const ChildProcess &) = delete;
    ChildProcess &operator=(const ChildProcess &) = delete;

    pid_t Pid() const {
        return m_Pid;
    }

    // SIGTERM to the child's process group. Returns false when the signal could not be
    // delivered or the child is gone.
    bool Terminate();
    // SIGKILL to the process group, for children that ignore SIGTERM at shutdown.
    bool Kill();

    // Blocks until the child exits, draining its output. Call once.
    ExitInfo Wait();

  private:
    bool TryReap(int &status);
    bool DrainOutput(std::string &out, int timeout_ms);

    pid_t m_Pid = -1;
    int m_OutFd = -1;
    std::mutex m_Mutex;
    bool m_Reaped = false;
};
