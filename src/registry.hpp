#pragma once

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

// Watcher executables found on disk, keyed by executable name.
class ModuleRegistry {
  public:
    ModuleRegistry() = default;
    explicit ModuleRegistry(std::map<std::string, std::filesystem::path> modules);

    std::set<std::string> Names() const;
    bool Contains(const std::string &name) const;

    // Absolute path for known modules, the bare name otherwise (execvp searches PATH).
    std::string Resolve(const std::string &name) const;

    std::size_t Size() const {
        return m_Modules.size();
    }

  private:
    std::map<std::string, std::filesystem::path> m_Modules;
};

// Executables in dir named aw* without an extension. Missing dirs yield nothing.
std::map<std::string, std::filesystem::path> ScanDirectory(const std::filesystem::path &dir);

// Scans dirs in order; the first directory that provides a name wins.
ModuleRegistry DiscoverModules(const std::vector<std::filesystem::path> &dirs);

// GetDiscoveryPaths() followed by GetPathDirs(), plus an extra dir when non-empty.
std::vector<std::filesystem::path> DefaultSearchDirs(const std::filesystem::path &extra = {});
