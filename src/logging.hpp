#pragma once

#include <filesystem>

#include "common.hpp"

// Picks the level from AW_TRACE / AW_DEBUG, or debug when verbose is requested.
LogLevel LogLevelFromEnv(bool verbose);

// Installs the default spdlog logger: colored console plus a file sink at log_path.
// A log file that can't be opened degrades to console-only logging.
void SetupLogging(LogLevel level, const std::filesystem::path &log_path);
