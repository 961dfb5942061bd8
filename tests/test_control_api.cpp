#include <catch2/catch.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "control_api.hpp"
#include "helpers.hpp"
#include "manager.hpp"

namespace {
ManagerOptions TestOptions() {
    ManagerOptions options;
    options.restart_delay = std::chrono::milliseconds(100);
    return options;
}
} // namespace

TEST_CASE("Snapshot JSON lists every module once", "[control_api]") {
    ModuleSnapshot snapshot;
    snapshot.running = {{"aw-watcher-afk", true}, {"aw-watcher-gone", false}};
    snapshot.pids = {{"aw-watcher-afk", 1234}};
    snapshot.discovered = {"aw-watcher-afk", "aw-watcher-window"};

    const nlohmann::json json = SnapshotToJson(snapshot);
    const auto &modules = json.at("modules");
    REQUIRE(modules.size() == 3);

    CHECK(modules[0]["name"] == "aw-watcher-afk");
    CHECK(modules[0]["running"] == true);
    CHECK(modules[0]["pid"] == 1234);
    CHECK(modules[0]["discovered"] == true);

    CHECK(modules[1]["name"] == "aw-watcher-gone");
    CHECK(modules[1]["running"] == false);
    CHECK(modules[1]["pid"].is_null());
    CHECK(modules[1]["discovered"] == false);

    CHECK(modules[2]["name"] == "aw-watcher-window");
    CHECK(modules[2]["running"] == false);
}

TEST_CASE("IsPortAvailable sees a bound port", "[control_api]") {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(fd >= 0);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    REQUIRE(::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0);
    REQUIRE(::listen(fd, 1) == 0);

    socklen_t len = sizeof(addr);
    REQUIRE(::getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len) == 0);
    const uint16_t port = ntohs(addr.sin_port);

    CHECK_FALSE(IsPortAvailable(port));
    ::close(fd);
}

TEST_CASE("Control API serves version and module state", "[control_api]") {
    TempDir tmp;
    const auto script = WriteScript(tmp / "aw-test", "exec sleep 30");

    std::map<std::string, std::filesystem::path> modules = {{"aw-test", script}};
    ModuleManager manager(TestOptions(), ModuleRegistry(modules));
    manager.Start();

    ControlApi api(manager);
    REQUIRE(api.Start(0));
    REQUIRE(api.Port() > 0);

    httplib::Client client("127.0.0.1", api.Port());

    auto version = client.Get("/api/v1/version");
    REQUIRE(version);
    CHECK(version->status == 200);
    CHECK(nlohmann::json::parse(version->body)["version"] == AW_TRAY_VERSION);

    REQUIRE(WaitFor([&] { return !manager.Snapshot().discovered.empty(); }));
    auto list = client.Get("/api/v1/modules");
    REQUIRE(list);
    CHECK(list->status == 200);
    const auto listed = nlohmann::json::parse(list->body)["modules"];
    REQUIRE(listed.size() == 1);
    CHECK(listed[0]["name"] == "aw-test");
    CHECK(listed[0]["running"] == false);

    auto start = client.Post("/api/v1/modules/aw-test/start", "", "application/json");
    REQUIRE(start);
    CHECK(start->status == 200);
    CHECK(WaitFor([&] { return manager.IsRunning("aw-test"); }));

    auto stop = client.Post("/api/v1/modules/aw-test/stop", "", "application/json");
    REQUIRE(stop);
    CHECK(stop->status == 200);
    CHECK(WaitFor([&] { return !manager.IsRunning("aw-test"); }));

    auto toggle = client.Post("/api/v1/modules/aw-test/toggle", "", "application/json");
    REQUIRE(toggle);
    CHECK(toggle->status == 200);
    CHECK(WaitFor([&] { return manager.IsRunning("aw-test"); }));

    auto badAction = client.Post("/api/v1/modules/aw-test/restart", "", "application/json");
    REQUIRE(badAction);
    CHECK(badAction->status == 404);

    auto badModule = client.Post("/api/v1/modules/aw-missing/start", "", "application/json");
    REQUIRE(badModule);
    CHECK(badModule->status == 404);
    CHECK_FALSE(manager.IsRunning("aw-missing"));

    api.Stop();
    manager.Shutdown();
}
