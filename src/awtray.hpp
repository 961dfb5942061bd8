#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "common.hpp"
#include "config.hpp"
#include "control_api.hpp"
#include "instance.hpp"
#include "manager.hpp"
#include "notification.hpp"
#include "tray.hpp"

struct AppOptions {
    std::optional<uint16_t> port;
    std::filesystem::path config_path;
    std::string exec_path;
    bool minimized = false;
    bool verbose = false;
};

class AwTray {
  public:
    explicit AwTray(AppOptions options);
    ~AwTray();

    AwTray(const AwTray &) = delete;
    AwTray &operator=(const AwTray &) = delete;

    // Runs until quit is requested. Returns the process exit code.
    int Run();

    // Async-signal-safe; the main loop notices within one tick.
    static void RequestShutdown();

  private:
    bool Init();
    void CheckServerPort();
    void StartTray();
    void RunMainLoop();
    void Teardown();

    void HandleClick(const std::string &key);
    void RefreshMenu();
    void FlushNotifications();
    void QueueNotification(const std::string &summary, const std::string &body);
    void WakeScheduler();

    void OpenDashboard();
    void OpenFolder(const std::filesystem::path &dir);

  private:
    const AppOptions m_Options;
    UserConfig m_Config;
    bool m_FirstRun = false;
    uint16_t m_Port = 5699;

    InstanceLock m_Lock;

    // Parts
    std::unique_ptr<ModuleManager> m_Manager;
    std::unique_ptr<TrayIcon> m_Tray;
    std::unique_ptr<Notification> m_Notification;
    std::unique_ptr<ControlApi> m_Api;
    std::unique_ptr<LockfileWatcher> m_LockfileWatcher;

    // Scheduler
    std::mutex m_SchedulerMutex;
    std::condition_variable m_SchedulerCv;
    std::atomic<std::uint64_t> m_WakeupSeq{0};
    std::atomic<bool> m_MenuDirty{true};
    std::atomic<bool> m_OpenUiRequested{false};
    bool m_QuitRequested = false;

    // Notifications posted from other threads, sent from the main loop
    std::mutex m_NotifyMutex;
    std::deque<std::pair<std::string, std::string>> m_PendingNotifications;

    static constexpr std::chrono::milliseconds kTick{100};
};
