#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "json.hpp"

class ConfigError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

struct ModuleConfig {
    std::string name;
    std::string args;
};

struct Defaults {
    bool autostart = true;
    bool autostart_minimized = true;
    uint16_t port = 5699;
    uint16_t control_port = 5698;
    std::filesystem::path discovery_path;
};

struct UserConfig {
    Defaults defaults;
    std::vector<ModuleConfig> autostart_modules;
};

class Config {
  public:
    // Built-in configuration written on first run.
    static UserConfig Default();

    // Returns the loaded config and whether this was the first run (file was missing).
    static std::pair<UserConfig, bool> LoadOrCreate(const std::filesystem::path &path);

    static UserConfig Parse(const std::string &text);
    static std::string Dump(const UserConfig &config);

  private:
    static Defaults ParseDefaults(const nlohmann::json &j, JsonParse &parse);
    static std::vector<ModuleConfig> ParseModules(const nlohmann::json &j);
};

// Splits module args the way a shell would for plain words (no quoting).
std::vector<std::string> SplitArgs(const std::string &args);
