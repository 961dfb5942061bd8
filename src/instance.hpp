#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>

// Exclusive flock on <runtime dir>/aw-tray.pid, held for the life of the object.
class InstanceLock {
  public:
    InstanceLock() = default;
    ~InstanceLock();

    InstanceLock(const InstanceLock &) = delete;
    InstanceLock &operator=(const InstanceLock &) = delete;

    // False when another process holds the lock or the file can't be opened.
    bool TryAcquire(const std::filesystem::path &runtime_dir);
    void Release();

    bool Held() const {
        return m_Fd >= 0;
    }

  private:
    int m_Fd = -1;
};

// Name of the file a second instance drops into the config dir.
extern const char *const kSingleInstanceLockfile;

// Called by a second instance: asks the running one to show itself.
bool SignalRunningInstance(const std::filesystem::path &config_dir);

// Watches the config dir for the lockfile; removes it and calls the callback.
class LockfileWatcher {
  public:
    using Callback = std::function<void()>;

    LockfileWatcher(std::filesystem::path dir, Callback callback);
    ~LockfileWatcher();

    LockfileWatcher(const LockfileWatcher &) = delete;
    LockfileWatcher &operator=(const LockfileWatcher &) = delete;

    bool Start();
    void Stop();

  private:
    void ThreadProc();
    bool Consume();

    std::filesystem::path m_Dir;
    Callback m_Callback;
    int m_Fd = -1;
    int m_Wd = -1;
    std::atomic<bool> m_Stop{false};
    std::thread m_Thread;
};
