#include "manager.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
ModuleManager::ModuleManager(ManagerOptions options, ModuleRegistry registry)
    : m_Options(std::move(options)), m_Registry(std::move(registry)) {
    m_Handler = std::thread([this]() { HandleMessages(); });
}

// ─────────────────────────────────────
ModuleManager::~ModuleManager() {
    Shutdown();
}

// ─────────────────────────────────────
void ModuleManager::SetListener(Listener listener) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_Listener = std::move(listener);
}

// ─────────────────────────────────────
void ModuleManager::SetNotifier(Notifier notifier) {
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_Notifier = std::move(notifier);
}

// ─────────────────────────────────────
void ModuleManager::Start() {
    for (const auto &module : m_Options.autostart_modules) {
        StartModule(module.name);
    }

    // Populate the menu even when nothing was started
    Message init;
    init.kind = Message::INIT;
    Post(std::move(init));
}

// ─────────────────────────────────────
bool ModuleManager::IsActiveLocked(const std::string &name) const {
    auto it = m_Running.find(name);
    const bool running = it != m_Running.end() && it->second;
    return running || m_Starting.count(name) != 0 || m_Children.count(name) != 0 ||
           m_RestartPending.count(name) != 0;
}

// ─────────────────────────────────────
std::vector<std::string> ModuleManager::ArgsFor(const std::string &name) const {
    std::vector<std::string> args = {"--port", std::to_string(m_Options.port)};
    for (const auto &module : m_Options.autostart_modules) {
        if (module.name == name) {
            for (auto &arg : SplitArgs(module.args)) {
                args.push_back(std::move(arg));
            }
            break;
        }
    }
    return args;
}

// ─────────────────────────────────────
void ModuleManager::StartModule(const std::string &name) {
    LaunchModule(name, false);
}

// ─────────────────────────────────────
void ModuleManager::LaunchModule(const std::string &name, bool restart) {
    if (m_ShuttingDown.load()) {
        spdlog::debug("Not starting {}: shutting down", name);
        return;
    }

    std::string executable;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        // A stop while the restart was pending removes the entry
        if (restart && m_RestartPending.erase(name) == 0) {
            spdlog::debug("Restart of {} was cancelled", name);
            return;
        }
        if (IsActiveLocked(name)) {
            spdlog::debug("{} is already running", name);
            return;
        }
        m_Starting.insert(name);
        m_StopRequested.erase(name);
        executable = m_Registry.Resolve(name);
    }

    std::vector<std::string> args = ArgsFor(name);
    spdlog::info("Starting {} ({})", name, executable);

    const bool launched = AddWorker([this, name, executable, args]() {
        RunModule(name, executable, args);
    });
    if (!launched) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Starting.erase(name);
    }
}

// ─────────────────────────────────────
void ModuleManager::RunModule(const std::string &name, const std::string &executable,
                              const std::vector<std::string> &args) {
    std::shared_ptr<ChildProcess> child;
    try {
        child = std::make_shared<ChildProcess>(executable, args);
    } catch (const ProcessError &e) {
        Message failed;
        failed.kind = Message::FAILED;
        failed.name = name;
        failed.error = e.what();
        Post(std::move(failed));
        return;
    }

    bool stopNow = false;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Children[name] = child;
        stopNow = m_StopRequested.count(name) != 0 || m_ShuttingDown.load();
    }

    Message started;
    started.kind = Message::STARTED;
    started.name = name;
    started.pid = child->Pid();
    Post(std::move(started));

    if (stopNow) {
        spdlog::info("{} was stopped while starting", name);
        child->Terminate();
    }

    ExitInfo info = child->Wait();

    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Children.erase(name);
    }

    Message stopped;
    stopped.kind = Message::STOPPED;
    stopped.name = name;
    stopped.pid = child->Pid();
    stopped.exit = std::move(info);
    Post(std::move(stopped));
}

// ─────────────────────────────────────
void ModuleManager::StopModule(const std::string &name) {
    std::shared_ptr<ChildProcess> child;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        auto it = m_Children.find(name);
        if (it == m_Children.end()) {
            if (m_RestartPending.erase(name) > 0) {
                spdlog::info("Cancelled pending restart of {}", name);
            } else if (m_Starting.count(name) != 0) {
                // RunModule terminates the child as soon as it is recorded
                m_StopRequested.insert(name);
                spdlog::info("{} will be stopped once it has started", name);
            } else {
                spdlog::debug("StopModule: {} has no process", name);
            }
            return;
        }
        child = it->second;
        m_StopRequested.insert(name);
    }

    if (child->Terminate()) {
        spdlog::info("Sent SIGTERM to {} (pid {})", name, child->Pid());
    } else {
        spdlog::warn("Failed to send SIGTERM to {}", name);
    }
}

// ─────────────────────────────────────
void ModuleManager::StopModules() {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        for (const auto &[name, child] : m_Children) {
            names.push_back(name);
        }
    }
    for (const auto &name : names) {
        StopModule(name);
    }
}

// ─────────────────────────────────────
void ModuleManager::HandleMenuClick(const std::string &name) {
    bool active = false;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        active = IsActiveLocked(name);
    }

    if (active) {
        StopModule(name);
    } else {
        StartModule(name);
    }
}

// ─────────────────────────────────────
void ModuleManager::Rescan(ModuleRegistry registry) {
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Registry = std::move(registry);
    }
    Message init;
    init.kind = Message::INIT;
    Post(std::move(init));
}

// ─────────────────────────────────────
bool ModuleManager::IsRunning(const std::string &name) const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    auto it = m_Running.find(name);
    return it != m_Running.end() && it->second;
}

// ─────────────────────────────────────
ModuleSnapshot ModuleManager::Snapshot() const {
    std::lock_guard<std::mutex> lock(m_Mutex);
    ModuleSnapshot snapshot;
    snapshot.running = m_Running;
    snapshot.pids = m_Pids;
    snapshot.discovered = m_Registry.Names();
    return snapshot;
}

// ─────────────────────────────────────
void ModuleManager::Post(Message message) {
    {
        std::lock_guard<std::mutex> lock(m_QueueMutex);
        m_Queue.push_back(std::move(message));
    }
    m_QueueCv.notify_one();
}

// ─────────────────────────────────────
void ModuleManager::HandleMessages() {
    while (true) {
        Message message;
        {
            std::unique_lock<std::mutex> lk(m_QueueMutex);
            m_QueueCv.wait(lk, [this] { return m_StopHandler || !m_Queue.empty(); });
            if (m_Queue.empty()) {
                // m_StopHandler and nothing left to process
                return;
            }
            message = std::move(m_Queue.front());
            m_Queue.pop_front();
        }

        switch (message.kind) {
        case Message::STARTED:
            OnStarted(message);
            break;
        case Message::STOPPED:
            OnStopped(message);
            break;
        case Message::FAILED:
            OnFailed(message);
            break;
        case Message::INIT:
            break;
        }
        Publish();
    }
}

// ─────────────────────────────────────
void ModuleManager::OnStarted(const Message &message) {
    spdlog::info("Started {} (pid {})", message.name, message.pid);
    std::lock_guard<std::mutex> lock(m_Mutex);
    m_Starting.erase(message.name);
    m_Running[message.name] = true;
    m_Pids[message.name] = message.pid;
}

// ─────────────────────────────────────
void ModuleManager::OnStopped(const Message &message) {
    bool requested = false;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Running[message.name] = false;
        m_Pids.erase(message.name);
        requested = m_StopRequested.erase(message.name) > 0;
    }

    const ExitInfo &exit = message.exit;
    if (exit.Success()) {
        spdlog::info("{} exited successfully", message.name);
        return;
    }

    if (requested || m_ShuttingDown.load()) {
        spdlog::info("{} stopped ({})", message.name, exit.Describe());
        return;
    }

    spdlog::error("{} exited with error ({})", message.name, exit.Describe());
    if (!exit.output.empty()) {
        spdlog::error("{} output:\n{}", message.name, exit.output);
    }
    ScheduleRestart(message.name);
    Notify(message.name, message.name + " crashed. Restarting...");
}

// ─────────────────────────────────────
void ModuleManager::OnFailed(const Message &message) {
    spdlog::error("Failed to start {}: {}", message.name, message.error);
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Starting.erase(message.name);
        m_StopRequested.erase(message.name);
    }
    Notify(message.name, "Failed to start " + message.name);
}

// ─────────────────────────────────────
void ModuleManager::Publish() {
    Listener listener;
    ModuleSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        listener = m_Listener;
        snapshot.running = m_Running;
        snapshot.pids = m_Pids;
        snapshot.discovered = m_Registry.Names();
    }
    if (!listener) {
        return;
    }
    try {
        listener(snapshot);
    } catch (const std::exception &e) {
        spdlog::error("Module state listener failed: {}", e.what());
    }
}

// ─────────────────────────────────────
void ModuleManager::Notify(const std::string &summary, const std::string &body) {
    Notifier notifier;
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        notifier = m_Notifier;
    }
    if (!notifier) {
        return;
    }
    try {
        notifier(summary, body);
    } catch (const std::exception &e) {
        spdlog::error("Notifier failed: {}", e.what());
    }
}

// ─────────────────────────────────────
void ModuleManager::ScheduleRestart(const std::string &name) {
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_RestartPending.insert(name);
    }

    const bool scheduled = AddWorker([this, name]() {
        {
            std::unique_lock<std::mutex> lk(m_ShutdownMutex);
            if (m_ShutdownCv.wait_for(lk, m_Options.restart_delay,
                                      [this] { return m_ShuttingDown.load(); })) {
                return;
            }
        }
        spdlog::info("Restarting {}", name);
        LaunchModule(name, true);
    });
    if (!scheduled) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_RestartPending.erase(name);
    }
}

// ─────────────────────────────────────
bool ModuleManager::AddWorker(std::function<void()> fn) {
    std::lock_guard<std::mutex> lock(m_WorkersMutex);
    if (m_ShuttingDown.load()) {
        return false;
    }
    ReapFinishedWorkers();

    auto done = std::make_shared<std::atomic<bool>>(false);
    Worker worker;
    worker.done = done;
    worker.thread = std::thread([fn = std::move(fn), done]() {
        try {
            fn();
        } catch (const std::exception &e) {
            spdlog::error("Module worker failed: {}", e.what());
        }
        done->store(true);
    });
    m_Workers.push_back(std::move(worker));
    return true;
}

// ─────────────────────────────────────
void ModuleManager::ReapFinishedWorkers() {
    for (auto it = m_Workers.begin(); it != m_Workers.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = m_Workers.erase(it);
        } else {
            ++it;
        }
    }
}

// ─────────────────────────────────────
void ModuleManager::Shutdown(std::chrono::milliseconds timeout) {
    {
        std::lock_guard<std::mutex> lock(m_WorkersMutex);
        if (m_ShuttingDown.load()) {
            return;
        }
        {
            std::lock_guard<std::mutex> shutdownLock(m_ShutdownMutex);
            m_ShuttingDown.store(true);
        }
    }
    m_ShutdownCv.notify_all();

    spdlog::info("Stopping all modules");
    {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_RestartPending.clear();
    }

    // Children that were still being spawned show up in later rounds
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::set<pid_t> terminated;
    std::set<pid_t> killed;
    while (true) {
        std::vector<std::pair<std::string, std::shared_ptr<ChildProcess>>> remaining;
        bool starting = false;
        {
            std::lock_guard<std::mutex> lock(m_Mutex);
            remaining.assign(m_Children.begin(), m_Children.end());
            for (const auto &[name, child] : remaining) {
                m_StopRequested.insert(name);
            }
            starting = !m_Starting.empty();
        }
        const bool expired = std::chrono::steady_clock::now() >= deadline;
        if (remaining.empty() && (!starting || expired)) {
            break;
        }

        for (const auto &[name, child] : remaining) {
            if (terminated.insert(child->Pid()).second) {
                if (child->Terminate()) {
                    spdlog::info("Sent SIGTERM to {} (pid {})", name, child->Pid());
                }
            } else if (expired && killed.insert(child->Pid()).second) {
                spdlog::warn("{} did not exit after SIGTERM, killing it", name);
                child->Kill();
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(m_WorkersMutex);
        workers.swap(m_Workers);
    }
    for (auto &worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_QueueMutex);
        m_StopHandler = true;
    }
    m_QueueCv.notify_all();
    if (m_Handler.joinable()) {
        m_Handler.join();
    }
}
