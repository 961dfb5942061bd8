#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

class DirsError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// XDG base directory layout for aw-tray. Every Get*Dir creates the directory.
std::filesystem::path GetConfigDir();
std::filesystem::path GetDataDir();
std::filesystem::path GetLogDir();
std::filesystem::path GetRuntimeDir();

std::filesystem::path GetConfigPath();
std::filesystem::path GetLogPath();

// Extra directories searched for watcher executables, in priority order.
std::vector<std::filesystem::path> GetDiscoveryPaths();

// Directories listed in $PATH, in order. Empty entries are skipped.
std::vector<std::filesystem::path> GetPathDirs();
