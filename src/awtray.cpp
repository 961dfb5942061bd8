#include "awtray.hpp"

#include <cstdlib>
#include <system_error>
#include <tuple>

#include <httplib.h>
#include <spdlog/spdlog.h>

#include "autostart.hpp"
#include "dirs.hpp"
#include "modules_dl.hpp"
#include "registry.hpp"
#include "tray_menu.hpp"

namespace {
std::atomic<bool> g_ShutdownSignal{false};

// ─────────────────────────────────────
std::string ShellQuote(const std::string &arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

// ─────────────────────────────────────
void XdgOpen(const std::string &target) {
    int result = std::system(("xdg-open " + ShellQuote(target) + " >/dev/null 2>&1 &").c_str());
    if (result != 0) {
        spdlog::error("Failed to open {}", target);
    }
}
} // namespace

// ─────────────────────────────────────
AwTray::AwTray(AppOptions options) : m_Options(std::move(options)) {}

// ─────────────────────────────────────
AwTray::~AwTray() {
    Teardown();
}

// ─────────────────────────────────────
void AwTray::RequestShutdown() {
    g_ShutdownSignal.store(true);
}

// ─────────────────────────────────────
int AwTray::Run() {
    if (!Init()) {
        return 0;
    }
    RunMainLoop();
    Teardown();
    return 0;
}

// ─────────────────────────────────────
bool AwTray::Init() {
    // Single instance
    if (!m_Lock.TryAcquire(GetRuntimeDir())) {
        spdlog::info("Another instance is running, quitting!");
        SignalRunningInstance(GetConfigDir());
        return false;
    }

    // Config
    std::tie(m_Config, m_FirstRun) = Config::LoadOrCreate(m_Options.config_path);
    m_Port = m_Options.port.value_or(m_Config.defaults.port);
    spdlog::info("Config: {}", m_Options.config_path.string());
    spdlog::info("Server port: {}", m_Port);

    // Autostart
    Autostart autostart;
    autostart.Apply(m_Config.defaults.autostart, m_Options.exec_path);

    CheckServerPort();

    // Watchers
    ModuleRegistry registry = DiscoverModules(DefaultSearchDirs(m_Config.defaults.discovery_path));
    if (!HasEssentialModules(registry.Names(), IsWayland())) {
        spdlog::warn("Essential watchers are missing; run `{} --download-modules` to install them",
                     AW_TRAY_NAME);
    }

    ManagerOptions managerOptions;
    managerOptions.port = m_Port;
    managerOptions.autostart_modules = m_Config.autostart_modules;
    m_Manager = std::make_unique<ModuleManager>(std::move(managerOptions), std::move(registry));
    m_Manager->SetListener([this](const ModuleSnapshot &) {
        m_MenuDirty.store(true);
        WakeScheduler();
    });
    m_Manager->SetNotifier([this](const std::string &summary, const std::string &body) {
        QueueNotification(summary, body);
    });
    m_Manager->Start();

    StartTray();

    // Control API
    m_Api = std::make_unique<ControlApi>(*m_Manager);
    if (!m_Api->Start(m_Config.defaults.control_port)) {
        QueueNotification("aw-tray", "Control port " +
                                         std::to_string(m_Config.defaults.control_port) +
                                         " is already in use");
        m_Api.reset();
    }

    // Second instances leave a file behind instead of starting
    m_LockfileWatcher = std::make_unique<LockfileWatcher>(GetConfigDir(), [this]() {
        m_OpenUiRequested.store(true);
        WakeScheduler();
    });
    if (!m_LockfileWatcher->Start()) {
        m_LockfileWatcher.reset();
    }

    if (m_FirstRun) {
        QueueNotification("aw-tray", "aw-tray is running in the background");
    }

    const bool hidden = m_Options.minimized || (m_Config.defaults.autostart &&
                                                m_Config.defaults.autostart_minimized &&
                                                !m_FirstRun);
    if (!hidden) {
        m_OpenUiRequested.store(true);
    }
    return true;
}

// ─────────────────────────────────────
void AwTray::CheckServerPort() {
    bool available = false;
    try {
        available = IsPortAvailable(m_Port);
    } catch (const std::system_error &e) {
        spdlog::error("Failed to check port {}: {}", m_Port, e.what());
        return;
    }

    if (available) {
        spdlog::warn("Nothing is listening on port {}; is the server running?", m_Port);
        return;
    }

    // Something holds the port, make sure it is the tracking server
    httplib::Client client("127.0.0.1", m_Port);
    client.set_connection_timeout(1, 0);
    client.set_read_timeout(2, 0);
    auto res = client.Get("/api/0/info");
    if (res && res->status == 200) {
        spdlog::info("Server is up on port {}", m_Port);
        return;
    }

    spdlog::error("Port {} is already in use", m_Port);
    QueueNotification("aw-tray", "Port " + std::to_string(m_Port) + " is already in use");
}

// ─────────────────────────────────────
void AwTray::StartTray() {
    m_Notification = std::make_unique<Notification>();

    m_Tray = std::make_unique<TrayIcon>();
    if (!m_Tray->Start("ActivityWatch")) {
        spdlog::warn("Tray unavailable, running without it");
        m_Tray.reset();
        return;
    }
    RefreshMenu();
}

// ─────────────────────────────────────
void AwTray::RunMainLoop() {
    spdlog::info("aw-tray {} started", AW_TRAY_VERSION);

    while (!m_QuitRequested && !g_ShutdownSignal.load()) {
        const auto seq = m_WakeupSeq.load(std::memory_order_relaxed);

        if (m_Tray) {
            m_Tray->Poll();
            if (m_Tray->TakeOpenUiRequested()) {
                m_OpenUiRequested.store(true);
            }
            std::string key;
            while (m_Tray->TakeClicked(key)) {
                HandleClick(key);
            }
        }
        if (m_Notification) {
            m_Notification->Poll();
        }

        if (m_OpenUiRequested.exchange(false)) {
            OpenDashboard();
        }
        if (m_MenuDirty.exchange(false)) {
            RefreshMenu();
        }
        FlushNotifications();

        std::unique_lock<std::mutex> lk(m_SchedulerMutex);
        m_SchedulerCv.wait_for(lk, kTick, [&] {
            return m_WakeupSeq.load(std::memory_order_relaxed) != seq;
        });
    }

    if (g_ShutdownSignal.load()) {
        spdlog::info("Received termination signal");
    }
}

// ─────────────────────────────────────
void AwTray::Teardown() {
    if (m_LockfileWatcher) {
        m_LockfileWatcher->Stop();
        m_LockfileWatcher.reset();
    }
    if (m_Api) {
        m_Api->Stop();
        m_Api.reset();
    }
    if (m_Manager) {
        m_Manager->Shutdown();
        m_Manager.reset();
    }
    m_Tray.reset();
    m_Notification.reset();
    m_Lock.Release();
}

// ─────────────────────────────────────
void AwTray::HandleClick(const std::string &key) {
    spdlog::debug("Menu click: {}", key);
    if (key == kMenuOpen) {
        OpenDashboard();
    } else if (key == kMenuQuit) {
        spdlog::info("Quit requested from tray");
        m_QuitRequested = true;
    } else if (key == kMenuConfigFolder) {
        OpenFolder(m_Options.config_path.parent_path());
    } else if (key == kMenuLogFolder) {
        OpenFolder(GetLogDir());
    } else if (m_Manager) {
        m_Manager->HandleMenuClick(key);
    }
}

// ─────────────────────────────────────
void AwTray::RefreshMenu() {
    if (!m_Tray || !m_Manager) {
        return;
    }
    m_Tray->SetMenu(BuildTrayMenu(m_Manager->Snapshot()));
}

// ─────────────────────────────────────
void AwTray::QueueNotification(const std::string &summary, const std::string &body) {
    {
        std::lock_guard<std::mutex> lock(m_NotifyMutex);
        m_PendingNotifications.emplace_back(summary, body);
    }
    WakeScheduler();
}

// ─────────────────────────────────────
void AwTray::FlushNotifications() {
    std::deque<std::pair<std::string, std::string>> pending;
    {
        std::lock_guard<std::mutex> lock(m_NotifyMutex);
        pending.swap(m_PendingNotifications);
    }
    for (const auto &[summary, body] : pending) {
        if (m_Notification) {
            m_Notification->SendNotification("activitywatch", summary, body);
        } else {
            spdlog::info("{}: {}", summary, body);
        }
    }
}

// ─────────────────────────────────────
void AwTray::WakeScheduler() {
    {
        std::lock_guard<std::mutex> lk(m_SchedulerMutex);
        m_WakeupSeq.fetch_add(1, std::memory_order_relaxed);
    }
    m_SchedulerCv.notify_all();
}

// ─────────────────────────────────────
void AwTray::OpenDashboard() {
    const std::string url = "http://127.0.0.1:" + std::to_string(m_Port) + "/";
    spdlog::info("Opening {}", url);
    XdgOpen(url);
}

// ─────────────────────────────────────
void AwTray::OpenFolder(const std::filesystem::path &dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        spdlog::warn("Unable to create {}: {}", dir.string(), ec.message());
    }
    XdgOpen(dir.string());
}
