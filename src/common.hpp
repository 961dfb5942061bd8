#pragma once

#include <sys/types.h>

#include <map>
#include <set>
#include <string>

#ifndef AW_TRAY_VERSION
#define AW_TRAY_VERSION "0.1.0"
#endif

#define AW_TRAY_NAME "aw-tray"

enum LogLevel { LOG_TRACE, LOG_DEBUG, LOG_INFO, LOG_OFF };

// State of every module the manager knows about, copied out for the UI.
struct ModuleSnapshot {
    std::map<std::string, bool> running;
    std::map<std::string, pid_t> pids;
    std::set<std::string> discovered;
};
