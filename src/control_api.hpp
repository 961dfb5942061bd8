#pragma once

#include <cstdint>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "common.hpp"

class ModuleManager;

// Local HTTP endpoints for driving the module manager without the tray.
class ControlApi {
  public:
    explicit ControlApi(ModuleManager &manager);
    ~ControlApi();

    ControlApi(const ControlApi &) = delete;
    ControlApi &operator=(const ControlApi &) = delete;

    // Binds 127.0.0.1:port (0 picks a free port) and serves on a background thread.
    bool Start(uint16_t port);
    void Stop();

    int Port() const {
        return m_Port;
    }

  private:
    void InitRoutes();

    ModuleManager &m_Manager;
    httplib::Server m_Server;
    std::thread m_Thread;
    int m_Port = -1;
};

// {"modules":[{"name","running","pid","discovered"}...]}, sorted by name.
nlohmann::json SnapshotToJson(const ModuleSnapshot &snapshot);

// True when 127.0.0.1:port can be bound, false on EADDRINUSE.
// Throws std::system_error for any other socket failure.
bool IsPortAvailable(uint16_t port);
