#include "dirs.hpp"

#include <cstdlib>
#include <system_error>

namespace {
constexpr const char *kVendorDir = "activitywatch";
constexpr const char *kAppDir = "aw-tray";

// ─────────────────────────────────────
std::string GetEnv(const char *name) {
    const char *value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return {};
    }
    return value;
}

// ─────────────────────────────────────
std::filesystem::path GetHome() {
    const std::string home = GetEnv("HOME");
    if (home.empty()) {
        throw DirsError("HOME environment variable not set");
    }
    return home;
}

// ─────────────────────────────────────
std::filesystem::path GetXdgBase(const char *var, const char *fallbackRelative) {
    const std::string xdg = GetEnv(var);
    if (!xdg.empty()) {
        return xdg;
    }
    return GetHome() / fallbackRelative;
}

// ─────────────────────────────────────
std::filesystem::path EnsureDir(const std::filesystem::path &dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw DirsError("Unable to create directory " + dir.string() + ": " + ec.message());
    }
    return dir;
}
} // namespace

// ─────────────────────────────────────
std::filesystem::path GetConfigDir() {
    return EnsureDir(GetXdgBase("XDG_CONFIG_HOME", ".config") / kVendorDir / kAppDir);
}

// ─────────────────────────────────────
std::filesystem::path GetDataDir() {
    return EnsureDir(GetXdgBase("XDG_DATA_HOME", ".local/share") / kVendorDir / kAppDir);
}

// ─────────────────────────────────────
std::filesystem::path GetLogDir() {
    // Linux keeps logs in the cache dir
    return EnsureDir(GetXdgBase("XDG_CACHE_HOME", ".cache") / kVendorDir / kAppDir / "log");
}

// ─────────────────────────────────────
std::filesystem::path GetRuntimeDir() {
    const std::string runtime = GetEnv("XDG_RUNTIME_DIR");
    if (!runtime.empty()) {
        std::filesystem::path dir = std::filesystem::path(runtime) / kVendorDir / kAppDir;
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (!ec) {
            return dir;
        }
    }

    try {
        return EnsureDir(GetXdgBase("XDG_CACHE_HOME", ".cache") / kVendorDir / kAppDir);
    } catch (const DirsError &) {
        return "/tmp";
    }
}

// ─────────────────────────────────────
std::filesystem::path GetConfigPath() {
    return GetConfigDir() / "config.json";
}

// ─────────────────────────────────────
std::filesystem::path GetLogPath() {
    return GetLogDir() / "aw-tray.log";
}

// ─────────────────────────────────────
std::vector<std::filesystem::path> GetDiscoveryPaths() {
    std::vector<std::filesystem::path> paths;
    const std::string home = GetEnv("HOME");
    if (home.empty()) {
        return paths;
    }

    const std::filesystem::path homePath(home);
    paths.push_back(homePath / "bin");
    paths.push_back(homePath / ".local" / "bin");

    const std::string dataHome = GetEnv("XDG_DATA_HOME");
    const std::filesystem::path dataDir =
        dataHome.empty() ? homePath / ".local" / "share" : std::filesystem::path(dataHome);
    paths.push_back(dataDir / kVendorDir / kAppDir / "modules");

    // Legacy location
    paths.push_back(homePath / "aw-modules");
    return paths;
}

// ─────────────────────────────────────
std::vector<std::filesystem::path> GetPathDirs() {
    std::vector<std::filesystem::path> dirs;
    const std::string path = GetEnv("PATH");
    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t end = path.find(':', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        if (end > start) {
            dirs.emplace_back(path.substr(start, end - start));
        }
        start = end + 1;
    }
    return dirs;
}
