#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

class CliError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

struct CliOptions {
    std::optional<uint16_t> port;
    std::filesystem::path config_path; // empty: GetConfigPath()
    bool minimized = false;
    bool verbose = false;
    bool download_modules = false;
    bool list_modules = false;
    bool version = false;
    bool help = false;
};

// Throws CliError for unknown options, missing values and invalid ports.
CliOptions ParseArgs(int argc, const char *const *argv);

std::string Usage(const std::string &program);
