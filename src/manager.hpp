#pragma once

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "common.hpp"
#include "config.hpp"
#include "process.hpp"
#include "registry.hpp"

struct ManagerOptions {
    uint16_t port = 5699;
    std::vector<ModuleConfig> autostart_modules;
    std::chrono::milliseconds restart_delay{1000};
};

// Starts, stops and tracks watcher processes.
//
// Every module runs on its own worker thread which spawns the child, posts Started, waits
// for it and posts Stopped. A single handler thread consumes those messages in order,
// updates the state and calls the listener. A module that exits with an error without
// having been asked to stop is restarted after restart_delay.
class ModuleManager {
  public:
    using Listener = std::function<void(const ModuleSnapshot &snapshot)>;
    using Notifier = std::function<void(const std::string &summary, const std::string &body)>;

    ModuleManager(ManagerOptions options, ModuleRegistry registry);
    ~ModuleManager();

    ModuleManager(const ModuleManager &) = delete;
    ModuleManager &operator=(const ModuleManager &) = delete;

    // Both must be set before Start(); they are called from the handler thread.
    void SetListener(Listener listener);
    void SetNotifier(Notifier notifier);

    // Launches the autostart modules and publishes the initial state.
    void Start();

    void StartModule(const std::string &name);
    void StopModule(const std::string &name);
    void StopModules();
    void HandleMenuClick(const std::string &name);

    // Replaces the set of discovered modules (e.g. after installing new watchers).
    void Rescan(ModuleRegistry registry);

    bool IsRunning(const std::string &name) const;
    ModuleSnapshot Snapshot() const;

    // Stops every module, waits up to timeout for them to exit (then SIGKILLs the rest)
    // and joins all threads. Idempotent.
    void Shutdown(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

  private:
    struct Message {
        enum Kind { STARTED, STOPPED, FAILED, INIT };
        Kind kind = INIT;
        std::string name;
        pid_t pid = -1;
        ExitInfo exit;
        std::string error;
    };

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void Post(Message message);
    void HandleMessages();
    void OnStarted(const Message &message);
    void OnStopped(const Message &message);
    void OnFailed(const Message &message);
    void Publish();
    void Notify(const std::string &summary, const std::string &body);

    void LaunchModule(const std::string &name, bool restart);
    void RunModule(const std::string &name, const std::string &executable,
                   const std::vector<std::string> &args);
    void ScheduleRestart(const std::string &name);
    bool AddWorker(std::function<void()> fn);
    void ReapFinishedWorkers();
    std::vector<std::string> ArgsFor(const std::string &name) const;
    bool IsActiveLocked(const std::string &name) const;

  private:
    const ManagerOptions m_Options;

    // Module state
    mutable std::mutex m_Mutex;
    ModuleRegistry m_Registry;
    std::map<std::string, bool> m_Running;
    std::map<std::string, pid_t> m_Pids;
    std::map<std::string, std::shared_ptr<ChildProcess>> m_Children;
    std::set<std::string> m_Starting;
    std::set<std::string> m_StopRequested;
    std::set<std::string> m_RestartPending;

    Listener m_Listener;
    Notifier m_Notifier;

    // Message queue
    std::mutex m_QueueMutex;
    std::condition_variable m_QueueCv;
    std::deque<Message> m_Queue;
    bool m_StopHandler = false;
    std::thread m_Handler;

    // Workers and restart timers
    std::mutex m_WorkersMutex;
    std::vector<Worker> m_Workers;
    std::mutex m_ShutdownMutex;
    std::condition_variable m_ShutdownCv;
    std::atomic<bool> m_ShuttingDown{false};
};
