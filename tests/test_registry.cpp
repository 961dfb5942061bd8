#include <catch2/catch.hpp>

#include "helpers.hpp"
#include "registry.hpp"

TEST_CASE("ScanDirectory keeps executable aw* files without extension", "[registry]") {
    TempDir tmp;
    WriteScript(tmp / "aw-watcher-afk", "exit 0");
    WriteScript(tmp / "aw-watcher-window", "exit 0");
    WriteScript(tmp / "aw-server.py", "exit 0");
    WriteScript(tmp / "awk", "exit 0");
    WriteScript(tmp / "aw-tray", "exit 0");
    WriteScript(tmp / "aw-client", "exit 0");
    WriteScript(tmp / "other-tool", "exit 0");
    WriteFile(tmp / "aw-not-executable", "data");
    std::filesystem::create_directories(tmp / "aw-directory");

    const auto found = ScanDirectory(tmp.Path());
    REQUIRE(found.size() == 2);
    CHECK(found.count("aw-watcher-afk") == 1);
    CHECK(found.count("aw-watcher-window") == 1);
    CHECK(found.at("aw-watcher-afk").string() == (tmp / "aw-watcher-afk").string());
}

TEST_CASE("Symlinks to executables are discovered", "[registry]") {
    TempDir tmp;
    const auto target = WriteScript(tmp / "real" / "watcher", "exit 0");
    std::filesystem::create_directories(tmp / "bin");
    std::filesystem::create_symlink(target, tmp / "bin" / "aw-watcher-link");

    const auto found = ScanDirectory(tmp / "bin");
    CHECK(found.count("aw-watcher-link") == 1);
}

TEST_CASE("Missing directories yield nothing", "[registry]") {
    TempDir tmp;
    CHECK(ScanDirectory(tmp / "does-not-exist").empty());
}

TEST_CASE("Unreadable search entries are skipped without throwing", "[registry]") {
    TempDir tmp;
    WriteFile(tmp / "not-a-dir", "data");
    WriteScript(tmp / "good" / "aw-watcher-afk", "exit 0");

    CHECK(ScanDirectory(tmp / "not-a-dir").empty());

    ModuleRegistry registry;
    REQUIRE_NOTHROW(registry = DiscoverModules(
                        {tmp / "not-a-dir", tmp / "does-not-exist", tmp / "good"}));
    CHECK(registry.Names() == std::set<std::string>{"aw-watcher-afk"});
}

TEST_CASE("The first directory providing a name wins", "[registry]") {
    TempDir tmp;
    WriteScript(tmp / "first" / "aw-watcher-afk", "exit 0");
    WriteScript(tmp / "second" / "aw-watcher-afk", "exit 0");
    WriteScript(tmp / "second" / "aw-watcher-window", "exit 0");

    const ModuleRegistry registry = DiscoverModules({tmp / "first", tmp / "second"});
    REQUIRE(registry.Size() == 2);
    CHECK(registry.Resolve("aw-watcher-afk") == (tmp / "first" / "aw-watcher-afk").string());
    CHECK(registry.Names() == std::set<std::string>{"aw-watcher-afk", "aw-watcher-window"});
}

TEST_CASE("Unknown names resolve to themselves", "[registry]") {
    const ModuleRegistry registry;
    CHECK_FALSE(registry.Contains("aw-watcher-afk"));
    CHECK(registry.Resolve("aw-watcher-afk") == "aw-watcher-afk");
}

TEST_CASE("Search dirs put the configured path first and drop duplicates", "[registry]") {
    TempDir tmp;
    ScopedEnv home("HOME", tmp.Path().string());
    ScopedEnv path("PATH", (tmp / "bin").string() + ":/usr/bin");

    const auto dirs = DefaultSearchDirs(tmp / "custom");
    REQUIRE(dirs.size() == 6);
    CHECK(dirs.front().string() == (tmp / "custom").string());
    CHECK(dirs[1].string() == (tmp / "bin").string());
    CHECK(dirs.back().string() == "/usr/bin");
}
