#include "config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>

namespace {
// ─────────────────────────────────────
std::filesystem::path DefaultDiscoveryPath() {
    const char *home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return {};
    }
    return std::filesystem::path(home) / "aw-modules";
}

// ─────────────────────────────────────
uint16_t GetPort(const nlohmann::json &j, const std::string &key, uint16_t fallback,
                 JsonParse &parse) {
    const int value = parse.GetInt(j, key, fallback);
    if (value < 1 || value > 65535) {
        spdlog::warn("Config: '{}' out of range ({}), using {}", key, value, fallback);
        return fallback;
    }
    return static_cast<uint16_t>(value);
}
} // namespace

// ─────────────────────────────────────
UserConfig Config::Default() {
    UserConfig config;
    config.defaults.discovery_path = DefaultDiscoveryPath();
    config.autostart_modules = {
        {"aw-watcher-afk", ""},
        {"aw-watcher-window", ""},
        {"aw-awatcher", ""},
    };
    return config;
}

// ─────────────────────────────────────
std::pair<UserConfig, bool> Config::LoadOrCreate(const std::filesystem::path &path) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw ConfigError("Failed to read config file " + path.string());
        }
        std::stringstream ss;
        ss << file.rdbuf();
        try {
            UserConfig config = Parse(ss.str());
            spdlog::info("Loaded config from {}", path.string());
            return {std::move(config), false};
        } catch (const ConfigError &e) {
            throw ConfigError("Failed to parse config file " + path.string() + ": " + e.what());
        }
    }

    UserConfig config = Default();
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        throw ConfigError("Failed to create config dir " + path.parent_path().string() + ": " +
                          ec.message());
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw ConfigError("Failed to write config file " + path.string());
    }
    out << Dump(config);
    spdlog::info("Wrote default config to {}", path.string());
    return {std::move(config), true};
}

// ─────────────────────────────────────
UserConfig Config::Parse(const std::string &text) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error &e) {
        throw ConfigError(e.what());
    }
    if (!root.is_object()) {
        throw ConfigError("top-level value must be an object");
    }

    JsonParse parse;
    UserConfig config = Default();

    if (root.contains("defaults")) {
        config.defaults = ParseDefaults(root["defaults"], parse);
    }
    if (root.contains("autostart_modules")) {
        config.autostart_modules = ParseModules(root["autostart_modules"]);
    }
    return config;
}

// ─────────────────────────────────────
Defaults Config::ParseDefaults(const nlohmann::json &j, JsonParse &parse) {
    Defaults defaults;
    defaults.discovery_path = DefaultDiscoveryPath();
    if (!j.is_object()) {
        spdlog::warn("Config: 'defaults' is not an object, using built-in defaults");
        return defaults;
    }

    defaults.autostart = parse.GetBool(j, "autostart", defaults.autostart);
    defaults.autostart_minimized =
        parse.GetBool(j, "autostart_minimized", defaults.autostart_minimized);
    defaults.port = GetPort(j, "port", defaults.port, parse);
    defaults.control_port = GetPort(j, "control_port", defaults.control_port, parse);
    defaults.discovery_path =
        parse.GetString(j, "discovery_path", defaults.discovery_path.string());
    return defaults;
}

// ─────────────────────────────────────
std::vector<ModuleConfig> Config::ParseModules(const nlohmann::json &j) {
    std::vector<ModuleConfig> modules;
    if (!j.is_array()) {
        spdlog::warn("Config: 'autostart_modules' is not an array, no modules will autostart");
        return modules;
    }

    JsonParse parse;
    for (const auto &entry : j) {
        ModuleConfig module;
        if (entry.is_string()) {
            module.name = entry.get<std::string>();
        } else if (entry.is_object()) {
            module.name = parse.GetString(entry, "name", "");
            module.args = parse.GetString(entry, "args", "");
        }

        if (module.name.empty()) {
            spdlog::warn("Config: skipping autostart module entry without a name: {}",
                         entry.dump());
            continue;
        }
        modules.push_back(std::move(module));
    }
    return modules;
}

// ─────────────────────────────────────
std::string Config::Dump(const UserConfig &config) {
    nlohmann::json modules = nlohmann::json::array();
    for (const auto &module : config.autostart_modules) {
        modules.push_back({{"name", module.name}, {"args", module.args}});
    }

    nlohmann::json root = {
        {"defaults",
         {{"autostart", config.defaults.autostart},
          {"autostart_minimized", config.defaults.autostart_minimized},
          {"port", config.defaults.port},
          {"control_port", config.defaults.control_port},
          {"discovery_path", config.defaults.discovery_path.string()}}},
        {"autostart_modules", modules},
    };
    return root.dump(4) + "\n";
}

// ─────────────────────────────────────
std::vector<std::string> SplitArgs(const std::string &args) {
    std::vector<std::string> out;
    std::istringstream ss(args);
    std::string word;
    while (ss >> word) {
        out.push_back(word);
    }
    return out;
}
