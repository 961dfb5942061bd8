#include <catch2/catch.hpp>

#include "dirs.hpp"
#include "helpers.hpp"

TEST_CASE("XDG variables decide the directory layout", "[dirs]") {
    TempDir tmp;
    ScopedEnv config("XDG_CONFIG_HOME", (tmp / "config").string());
    ScopedEnv data("XDG_DATA_HOME", (tmp / "data").string());
    ScopedEnv cache("XDG_CACHE_HOME", (tmp / "cache").string());

    const auto config_dir = tmp / "config" / "activitywatch" / "aw-tray";
    const auto data_dir = tmp / "data" / "activitywatch" / "aw-tray";
    const auto log_dir = tmp / "cache" / "activitywatch" / "aw-tray" / "log";
    REQUIRE(GetConfigDir().string() == config_dir.string());
    REQUIRE(GetDataDir().string() == data_dir.string());
    REQUIRE(GetLogDir().string() == log_dir.string());
    REQUIRE(GetConfigPath().string() == (GetConfigDir() / "config.json").string());
    REQUIRE(GetLogPath().string() == (GetLogDir() / "aw-tray.log").string());

    REQUIRE(std::filesystem::is_directory(GetConfigDir()));
    REQUIRE(std::filesystem::is_directory(GetLogDir()));
}

TEST_CASE("HOME is the fallback when XDG variables are unset", "[dirs]") {
    TempDir tmp;
    ScopedEnv home("HOME", tmp.Path().string());
    ScopedEnv config("XDG_CONFIG_HOME", "");

    const auto expected = tmp / ".config" / "activitywatch" / "aw-tray";
    REQUIRE(GetConfigDir().string() == expected.string());
}

TEST_CASE("Missing HOME raises DirsError", "[dirs]") {
    ScopedEnv home("HOME", "");
    ScopedEnv config("XDG_CONFIG_HOME", "");

    REQUIRE_THROWS_AS(GetConfigDir(), DirsError);
    REQUIRE(GetDiscoveryPaths().empty());
}

TEST_CASE("Runtime dir prefers XDG_RUNTIME_DIR", "[dirs]") {
    TempDir tmp;
    ScopedEnv runtime("XDG_RUNTIME_DIR", tmp.Path().string());

    REQUIRE(GetRuntimeDir().string() == (tmp / "activitywatch" / "aw-tray").string());
}

TEST_CASE("Discovery paths are listed in priority order", "[dirs]") {
    TempDir tmp;
    ScopedEnv home("HOME", tmp.Path().string());
    ScopedEnv data("XDG_DATA_HOME", "");

    const auto paths = GetDiscoveryPaths();
    REQUIRE(paths.size() == 4);
    CHECK(paths[0].string() == (tmp / "bin").string());
    CHECK(paths[1].string() == (tmp / ".local" / "bin").string());
    const auto modules = tmp / ".local" / "share" / "activitywatch" / "aw-tray" / "modules";
    CHECK(paths[2].string() == modules.string());
    CHECK(paths[3].string() == (tmp / "aw-modules").string());
}

TEST_CASE("PATH is split on colons and empty entries are dropped", "[dirs]") {
    ScopedEnv path("PATH", "/usr/bin::/bin:");

    const auto dirs = GetPathDirs();
    REQUIRE(dirs.size() == 2);
    CHECK(dirs[0].string() == "/usr/bin");
    CHECK(dirs[1].string() == "/bin");
}
