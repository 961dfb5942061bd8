#include <catch2/catch.hpp>

#include <mutex>
#include <utility>
#include <vector>

#include "helpers.hpp"
#include "manager.hpp"

namespace {
using namespace std::chrono_literals;

ModuleRegistry MakeRegistry(const std::map<std::string, std::filesystem::path> &modules) {
    return ModuleRegistry(modules);
}

ManagerOptions MakeOptions(std::vector<ModuleConfig> autostart = {}) {
    ManagerOptions options;
    options.port = 5699;
    options.autostart_modules = std::move(autostart);
    options.restart_delay = 100ms;
    return options;
}

std::size_t CountLines(const std::filesystem::path &path) {
    const std::string content = ReadFile(path);
    std::size_t lines = 0;
    for (char c : content) {
        if (c == '\n') {
            ++lines;
        }
    }
    return lines;
}

struct Notifications {
    std::mutex mutex;
    std::vector<std::pair<std::string, std::string>> sent;

    void Add(const std::string &summary, const std::string &body) {
        std::lock_guard<std::mutex> lock(mutex);
        sent.emplace_back(summary, body);
    }
    bool Contains(const std::string &body) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto &entry : sent) {
            if (entry.second == body) {
                return true;
            }
        }
        return false;
    }
};
} // namespace

TEST_CASE("Start launches autostart modules with the server port", "[manager]") {
    TempDir tmp;
    const auto argsFile = tmp / "args.txt";
    const auto script =
        WriteScript(tmp / "aw-test", "echo \"$@\" > " + argsFile.string() + "\nexec sleep 30");

    ModuleManager manager(MakeOptions({{"aw-test", "--foo  bar"}}),
                          MakeRegistry({{"aw-test", script}}));
    manager.Start();

    REQUIRE(WaitFor([&] { return manager.IsRunning("aw-test"); }));
    REQUIRE(WaitFor([&] { return !ReadFile(argsFile).empty(); }));
    CHECK(ReadFile(argsFile) == "--port 5699 --foo bar\n");

    const ModuleSnapshot snapshot = manager.Snapshot();
    REQUIRE(snapshot.pids.count("aw-test") == 1);
    CHECK(snapshot.pids.at("aw-test") > 0);
    CHECK(snapshot.discovered.count("aw-test") == 1);

    manager.Shutdown();
    CHECK_FALSE(manager.IsRunning("aw-test"));
    CHECK(manager.Snapshot().pids.empty());
}

TEST_CASE("A module that is already running is not started twice", "[manager]") {
    TempDir tmp;
    const auto launches = tmp / "launches";
    const auto script =
        WriteScript(tmp / "aw-test", "echo x >> " + launches.string() + "\nexec sleep 30");

    ModuleManager manager(MakeOptions(), MakeRegistry({{"aw-test", script}}));
    manager.StartModule("aw-test");
    manager.StartModule("aw-test");
    REQUIRE(WaitFor([&] { return manager.IsRunning("aw-test"); }));
    manager.StartModule("aw-test");

    std::this_thread::sleep_for(300ms);
    CHECK(CountLines(launches) == 1);
}

TEST_CASE("A stopped module is not restarted", "[manager]") {
    TempDir tmp;
    const auto launches = tmp / "launches";
    const auto script =
        WriteScript(tmp / "aw-test", "echo x >> " + launches.string() + "\nexec sleep 30");

    Notifications notifications;
    ModuleManager manager(MakeOptions(), MakeRegistry({{"aw-test", script}}));
    manager.SetNotifier([&](const std::string &summary, const std::string &body) {
        notifications.Add(summary, body);
    });

    manager.StartModule("aw-test");
    REQUIRE(WaitFor([&] { return manager.IsRunning("aw-test"); }));

    manager.StopModule("aw-test");
    REQUIRE(WaitFor([&] { return !manager.IsRunning("aw-test"); }));

    // Several restart delays
    std::this_thread::sleep_for(500ms);
    CHECK_FALSE(manager.IsRunning("aw-test"));
    CHECK(CountLines(launches) == 1);
    CHECK(notifications.sent.empty());

    // Still listed, now as stopped
    const ModuleSnapshot snapshot = manager.Snapshot();
    REQUIRE(snapshot.running.count("aw-test") == 1);
    CHECK_FALSE(snapshot.running.at("aw-test"));
}

TEST_CASE("A crashed module is restarted", "[manager]") {
    TempDir tmp;
    const auto launches = tmp / "launches";
    const auto script = WriteScript(tmp / "aw-crash",
                                    "echo x >> " + launches.string() + "\nsleep 0.1\nexit 1");

    Notifications notifications;
    ModuleManager manager(MakeOptions(), MakeRegistry({{"aw-crash", script}}));
    manager.SetNotifier([&](const std::string &summary, const std::string &body) {
        notifications.Add(summary, body);
    });

    manager.StartModule("aw-crash");
    REQUIRE(WaitFor([&] { return CountLines(launches) >= 2; }));
    CHECK(notifications.Contains("aw-crash crashed. Restarting..."));

    manager.Shutdown();
    const std::size_t afterShutdown = CountLines(launches);
    std::this_thread::sleep_for(300ms);
    CHECK(CountLines(launches) == afterShutdown);
}

TEST_CASE("A module exiting cleanly is not restarted", "[manager]") {
    TempDir tmp;
    const auto launches = tmp / "launches";
    const auto script =
        WriteScript(tmp / "aw-oneshot", "echo x >> " + launches.string() + "\nexit 0");

    ModuleManager manager(MakeOptions(), MakeRegistry({{"aw-oneshot", script}}));
    manager.StartModule("aw-oneshot");
    REQUIRE(WaitFor([&] {
        const ModuleSnapshot snapshot = manager.Snapshot();
        return snapshot.running.count("aw-oneshot") == 1 && !snapshot.running.at("aw-oneshot");
    }));

    std::this_thread::sleep_for(400ms);
    CHECK(CountLines(launches) == 1);
}

TEST_CASE("A module that fails to launch is reported", "[manager]") {
    Notifications notifications;
    ModuleManager manager(MakeOptions(), MakeRegistry({}));
    manager.SetNotifier([&](const std::string &summary, const std::string &body) {
        notifications.Add(summary, body);
    });

    manager.StartModule("aw-watcher-that-does-not-exist");
    REQUIRE(WaitFor([&] {
        return notifications.Contains("Failed to start aw-watcher-that-does-not-exist");
    }));
    CHECK_FALSE(manager.IsRunning("aw-watcher-that-does-not-exist"));

    // The failed attempt doesn't block a later one
    manager.StartModule("aw-watcher-that-does-not-exist");
    REQUIRE(WaitFor([&] {
        std::lock_guard<std::mutex> lock(notifications.mutex);
        return notifications.sent.size() == 2;
    }));
}

TEST_CASE("Menu clicks toggle a module", "[manager]") {
    TempDir tmp;
    const auto script = WriteScript(tmp / "aw-test", "exec sleep 30");

    ModuleManager manager(MakeOptions(), MakeRegistry({{"aw-test", script}}));

    manager.HandleMenuClick("aw-test");
    REQUIRE(WaitFor([&] { return manager.IsRunning("aw-test"); }));

    manager.HandleMenuClick("aw-test");
    REQUIRE(WaitFor([&] { return !manager.IsRunning("aw-test"); }));

    manager.HandleMenuClick("aw-test");
    REQUIRE(WaitFor([&] { return manager.IsRunning("aw-test"); }));
}

TEST_CASE("The listener receives every state change", "[manager]") {
    TempDir tmp;
    const auto script = WriteScript(tmp / "aw-test", "exec sleep 30");
    const auto other = WriteScript(tmp / "aw-other", "exec sleep 30");

    std::mutex mutex;
    std::vector<ModuleSnapshot> snapshots;

    ModuleManager manager(MakeOptions({{"aw-test", ""}}),
                          MakeRegistry({{"aw-test", script}, {"aw-other", other}}));
    manager.SetListener([&](const ModuleSnapshot &snapshot) {
        std::lock_guard<std::mutex> lock(mutex);
        snapshots.push_back(snapshot);
    });
    manager.Start();

    auto latest = [&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return snapshots.empty() ? ModuleSnapshot{} : snapshots.back();
    };

    REQUIRE(WaitFor([&] {
        const ModuleSnapshot snapshot = latest();
        return snapshot.running.count("aw-test") == 1 && snapshot.running.at("aw-test");
    }));
    const ModuleSnapshot running = latest();
    CHECK(running.discovered == std::set<std::string>{"aw-other", "aw-test"});
    CHECK(running.running.count("aw-other") == 0);

    manager.StopModule("aw-test");
    REQUIRE(WaitFor([&] {
        const ModuleSnapshot snapshot = latest();
        return snapshot.running.count("aw-test") == 1 && !snapshot.running.at("aw-test");
    }));
}

TEST_CASE("Shutdown kills modules that ignore SIGTERM", "[manager]") {
    TempDir tmp;
    const auto ready = tmp / "ready";
    const auto script = WriteScript(
        tmp / "aw-stubborn",
        "trap '' TERM\ntouch " + ready.string() + "\nwhile true; do sleep 0.05; done");

    ModuleManager manager(MakeOptions({{"aw-stubborn", ""}}),
                          MakeRegistry({{"aw-stubborn", script}}));
    manager.Start();
    REQUIRE(WaitFor([&] { return std::filesystem::exists(ready); }));
    REQUIRE(WaitFor([&] { return manager.IsRunning("aw-stubborn"); }));

    const auto before = std::chrono::steady_clock::now();
    manager.Shutdown(300ms);
    CHECK(std::chrono::steady_clock::now() - before < 5s);
    CHECK_FALSE(manager.IsRunning("aw-stubborn"));

    // Nothing starts after shutdown
    manager.StartModule("aw-stubborn");
    std::this_thread::sleep_for(200ms);
    CHECK_FALSE(manager.IsRunning("aw-stubborn"));
}

TEST_CASE("Stopping a module during its restart delay cancels the restart", "[manager]") {
    TempDir tmp;
    const auto launches = tmp / "launches";
    const auto script =
        WriteScript(tmp / "aw-crash", "echo x >> " + launches.string() + "\nexit 1");

    ManagerOptions options = MakeOptions();
    options.restart_delay = 500ms;
    Notifications notifications;
    ModuleManager manager(options, MakeRegistry({{"aw-crash", script}}));
    manager.SetNotifier([&](const std::string &summary, const std::string &body) {
        notifications.Add(summary, body);
    });

    manager.StartModule("aw-crash");
    REQUIRE(WaitFor([&] { return notifications.Contains("aw-crash crashed. Restarting..."); }));

    manager.StopModule("aw-crash");
    std::this_thread::sleep_for(900ms);
    CHECK_FALSE(manager.IsRunning("aw-crash"));
    CHECK(CountLines(launches) == 1);
}

TEST_CASE("A menu click during the restart delay stops the module", "[manager]") {
    TempDir tmp;
    const auto launches = tmp / "launches";
    const auto script =
        WriteScript(tmp / "aw-crash", "echo x >> " + launches.string() + "\nexit 1");

    ManagerOptions options = MakeOptions();
    options.restart_delay = 500ms;
    Notifications notifications;
    ModuleManager manager(options, MakeRegistry({{"aw-crash", script}}));
    manager.SetNotifier([&](const std::string &summary, const std::string &body) {
        notifications.Add(summary, body);
    });

    manager.HandleMenuClick("aw-crash");
    REQUIRE(WaitFor([&] { return notifications.Contains("aw-crash crashed. Restarting..."); }));

    manager.HandleMenuClick("aw-crash");
    std::this_thread::sleep_for(900ms);
    CHECK_FALSE(manager.IsRunning("aw-crash"));
    CHECK(CountLines(launches) == 1);
}

TEST_CASE("A stop issued right after a start is honored", "[manager]") {
    TempDir tmp;
    const auto script = WriteScript(tmp / "aw-test", "exec sleep 30");

    Notifications notifications;
    ModuleManager manager(MakeOptions(), MakeRegistry({{"aw-test", script}}));
    manager.SetNotifier([&](const std::string &summary, const std::string &body) {
        notifications.Add(summary, body);
    });

    manager.StartModule("aw-test");
    manager.StopModule("aw-test");

    REQUIRE(WaitFor([&] { return !manager.IsRunning("aw-test"); }));
    std::this_thread::sleep_for(500ms);
    CHECK_FALSE(manager.IsRunning("aw-test"));
    CHECK_FALSE(notifications.Contains("aw-test crashed. Restarting..."));
}

TEST_CASE("Stopping a module also stops the processes it started", "[manager]") {
    TempDir tmp;
    const auto pidFile = tmp / "helper.pid";
    const auto script = WriteScript(
        tmp / "aw-wrapper", "sleep 30 &\necho $! > " + pidFile.string() + "\nwait");

    ModuleManager manager(MakeOptions(), MakeRegistry({{"aw-wrapper", script}}));
    manager.StartModule("aw-wrapper");
    const pid_t helper = ReadPidFile(pidFile);
    REQUIRE(helper > 0);
    REQUIRE(IsProcessAlive(helper));

    manager.StopModule("aw-wrapper");
    REQUIRE(WaitFor([&] { return !manager.IsRunning("aw-wrapper"); }));
    CHECK(WaitFor([&] { return !IsProcessAlive(helper); }));
}

TEST_CASE("Shutdown right after a start leaves nothing running", "[manager]") {
    TempDir tmp;
    const auto pidFile = tmp / "module.pid";
    const auto script =
        WriteScript(tmp / "aw-test", "echo $$ > " + pidFile.string() + "\nexec sleep 30");

    ModuleManager manager(MakeOptions({{"aw-test", ""}}), MakeRegistry({{"aw-test", script}}));
    manager.Start();

    const auto before = std::chrono::steady_clock::now();
    manager.Shutdown(3s);
    CHECK(std::chrono::steady_clock::now() - before < 2s);
    CHECK_FALSE(manager.IsRunning("aw-test"));

    if (std::filesystem::exists(pidFile)) {
        const pid_t pid = ReadPidFile(pidFile);
        CHECK(WaitFor([&] { return !IsProcessAlive(pid); }));
    }
}
