#include <catch2/catch.hpp>

#include "config.hpp"
#include "helpers.hpp"

TEST_CASE("Default config lists the standard watchers", "[config]") {
    TempDir tmp;
    ScopedEnv home("HOME", tmp.Path().string());

    const UserConfig config = Config::Default();
    CHECK(config.defaults.autostart);
    CHECK(config.defaults.autostart_minimized);
    CHECK(config.defaults.port == 5699);
    CHECK(config.defaults.control_port == 5698);
    CHECK(config.defaults.discovery_path.string() == (tmp / "aw-modules").string());

    REQUIRE(config.autostart_modules.size() == 3);
    CHECK(config.autostart_modules[0].name == "aw-watcher-afk");
    CHECK(config.autostart_modules[1].name == "aw-watcher-window");
    CHECK(config.autostart_modules[2].name == "aw-awatcher");
}

TEST_CASE("LoadOrCreate writes the default config on first run", "[config]") {
    TempDir tmp;
    const auto path = tmp / "nested" / "config.json";

    auto [config, firstRun] = Config::LoadOrCreate(path);
    REQUIRE(firstRun);
    REQUIRE(std::filesystem::exists(path));
    CHECK(config.autostart_modules.size() == 3);

    auto [reloaded, secondRun] = Config::LoadOrCreate(path);
    REQUIRE_FALSE(secondRun);
    CHECK(reloaded.defaults.port == config.defaults.port);
    CHECK(reloaded.autostart_modules.size() == 3);
}

TEST_CASE("Module entries may be strings or objects", "[config]") {
    const UserConfig config = Config::Parse(R"({
        "defaults": {"port": 5600, "autostart": false},
        "autostart_modules": [
            "aw-watcher-afk",
            {"name": "aw-watcher-input", "args": "--poll-time 5"},
            {"args": "--nameless"}
        ]
    })");

    CHECK(config.defaults.port == 5600);
    CHECK_FALSE(config.defaults.autostart);
    CHECK(config.defaults.autostart_minimized);

    REQUIRE(config.autostart_modules.size() == 2);
    CHECK(config.autostart_modules[0].name == "aw-watcher-afk");
    CHECK(config.autostart_modules[0].args.empty());
    CHECK(config.autostart_modules[1].name == "aw-watcher-input");
    CHECK(config.autostart_modules[1].args == "--poll-time 5");
}

TEST_CASE("Missing sections keep their defaults", "[config]") {
    const UserConfig config = Config::Parse("{}");
    CHECK(config.defaults.port == 5699);
    CHECK(config.autostart_modules.size() == 3);
}

TEST_CASE("Mistyped keys fall back to defaults", "[config]") {
    const UserConfig config = Config::Parse(R"({
        "defaults": {"port": "5600", "control_port": 70000, "autostart": "yes"}
    })");
    CHECK(config.defaults.port == 5699);
    CHECK(config.defaults.control_port == 5698);
    CHECK(config.defaults.autostart);
}

TEST_CASE("Malformed JSON raises ConfigError", "[config]") {
    REQUIRE_THROWS_AS(Config::Parse("{ not json"), ConfigError);
    REQUIRE_THROWS_AS(Config::Parse("[1, 2]"), ConfigError);

    TempDir tmp;
    WriteFile(tmp / "config.json", "{\"defaults\": ");
    REQUIRE_THROWS_AS(Config::LoadOrCreate(tmp / "config.json"), ConfigError);
}

TEST_CASE("Dump output parses back to the same values", "[config]") {
    UserConfig config = Config::Default();
    config.defaults.port = 5700;
    config.autostart_modules = {ModuleConfig{"aw-watcher-afk", "--verbose"}};

    const UserConfig parsed = Config::Parse(Config::Dump(config));
    CHECK(parsed.defaults.port == 5700);
    REQUIRE(parsed.autostart_modules.size() == 1);
    CHECK(parsed.autostart_modules[0].args == "--verbose");
}

TEST_CASE("SplitArgs splits on any whitespace", "[config]") {
    CHECK(SplitArgs("").empty());
    CHECK(SplitArgs("  --a   b\t--c ") == std::vector<std::string>{"--a", "b", "--c"});
}
