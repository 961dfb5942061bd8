#include "registry.hpp"

#include <algorithm>
#include <system_error>

#include <spdlog/spdlog.h>

#include "dirs.hpp"

namespace {
// Executables that match the naming scheme but are not watchers.
const std::set<std::string> kIgnoredNames = {"awk", "aw-tray", "aw-tauri", "aw-client",
                                             "aw-cli"};

// ─────────────────────────────────────
bool IsModuleName(const std::string &name) {
    if (name.rfind("aw", 0) != 0 || name.find('.') != std::string::npos) {
        return false;
    }
    return kIgnoredNames.count(name) == 0;
}

// ─────────────────────────────────────
bool IsExecutable(const std::filesystem::directory_entry &entry) {
    std::error_code ec;
    // status() follows symlinks, so a link to an executable counts
    const auto st = entry.status(ec);
    if (ec || !std::filesystem::is_regular_file(st)) {
        return false;
    }
    using std::filesystem::perms;
    return (st.permissions() & (perms::owner_exec | perms::group_exec | perms::others_exec)) !=
           perms::none;
}
} // namespace

// ─────────────────────────────────────
ModuleRegistry::ModuleRegistry(std::map<std::string, std::filesystem::path> modules)
    : m_Modules(std::move(modules)) {}

// ─────────────────────────────────────
std::set<std::string> ModuleRegistry::Names() const {
    std::set<std::string> names;
    for (const auto &[name, path] : m_Modules) {
        names.insert(name);
    }
    return names;
}

// ─────────────────────────────────────
bool ModuleRegistry::Contains(const std::string &name) const {
    return m_Modules.count(name) != 0;
}

// ─────────────────────────────────────
std::string ModuleRegistry::Resolve(const std::string &name) const {
    auto it = m_Modules.find(name);
    if (it == m_Modules.end()) {
        return name;
    }
    return it->second.string();
}

// ─────────────────────────────────────
std::map<std::string, std::filesystem::path> ScanDirectory(const std::filesystem::path &dir) {
    std::map<std::string, std::filesystem::path> found;

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        spdlog::debug("Registry: skipping {}: {}", dir.string(), ec.message());
        return found;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        const std::string name = it->path().filename().string();
        if (!IsModuleName(name) || !IsExecutable(*it)) {
            continue;
        }
        found.emplace(name, it->path());
    }
    if (ec) {
        spdlog::warn("Registry: skipping {}: {}", dir.string(), ec.message());
        found.clear();
    }
    return found;
}

// ─────────────────────────────────────
ModuleRegistry DiscoverModules(const std::vector<std::filesystem::path> &dirs) {
    std::map<std::string, std::filesystem::path> modules;
    for (const auto &dir : dirs) {
        for (auto &[name, path] : ScanDirectory(dir)) {
            // emplace keeps the entry from the earlier directory
            if (modules.emplace(name, path).second) {
                spdlog::debug("Registry: found {} at {}", name, path.string());
            }
        }
    }
    spdlog::info("Registry: {} modules discovered", modules.size());
    return ModuleRegistry(std::move(modules));
}

// ─────────────────────────────────────
std::vector<std::filesystem::path> DefaultSearchDirs(const std::filesystem::path &extra) {
    std::vector<std::filesystem::path> dirs;
    auto add = [&dirs](const std::filesystem::path &dir) {
        if (dir.empty() || std::find(dirs.begin(), dirs.end(), dir) != dirs.end()) {
            return;
        }
        dirs.push_back(dir);
    };

    add(extra);
    for (const auto &dir : GetDiscoveryPaths()) {
        add(dir);
    }
    for (const auto &dir : GetPathDirs()) {
        add(dir);
    }
    return dirs;
}
