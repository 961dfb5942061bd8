#include "logging.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// ─────────────────────────────────────
LogLevel LogLevelFromEnv(bool verbose) {
    if (std::getenv("AW_TRACE") != nullptr) {
        return LOG_TRACE;
    }
    if (std::getenv("AW_DEBUG") != nullptr || verbose) {
        return LOG_DEBUG;
    }
    return LOG_INFO;
}

// ─────────────────────────────────────
void SetupLogging(LogLevel log_level, const std::filesystem::path &log_path) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    try {
        // File only keeps info and above, like the console default
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path.string());
        file->set_level(spdlog::level::info);
        sinks.push_back(std::move(file));
    } catch (const spdlog::spdlog_ex &e) {
        std::cerr << "Failed to open log file " << log_path << ": " << e.what() << "\n";
    }

    auto logger = std::make_shared<spdlog::logger>(AW_TRAY_NAME, sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S][%^%l%$][%n] %v");
    spdlog::set_default_logger(logger);

    if (log_level == LOG_TRACE) {
        spdlog::set_level(spdlog::level::trace);
    } else if (log_level == LOG_DEBUG) {
        spdlog::set_level(spdlog::level::debug);
    } else if (log_level == LOG_INFO) {
        spdlog::set_level(spdlog::level::info);
    } else if (log_level == LOG_OFF) {
        spdlog::set_level(spdlog::level::off);
    }
    spdlog::flush_on(spdlog::level::warn);

    spdlog::info("Logging initialized ({})", log_path.string());
}
