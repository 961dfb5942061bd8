#include "control_api.hpp"

#include <cerrno>
#include <set>
#include <system_error>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "manager.hpp"

namespace {
// ─────────────────────────────────────
void JsonError(httplib::Response &res, int status, const std::string &message) {
    res.status = status;
    res.set_content(nlohmann::json{{"error", message}}.dump(), "application/json");
}
} // namespace

// ─────────────────────────────────────
nlohmann::json SnapshotToJson(const ModuleSnapshot &snapshot) {
    std::set<std::string> names = snapshot.discovered;
    for (const auto &[name, running] : snapshot.running) {
        names.insert(name);
    }

    nlohmann::json modules = nlohmann::json::array();
    for (const auto &name : names) {
        auto running = snapshot.running.find(name);
        auto pid = snapshot.pids.find(name);

        nlohmann::json entry;
        entry["name"] = name;
        entry["running"] = running != snapshot.running.end() && running->second;
        entry["pid"] = pid != snapshot.pids.end() ? nlohmann::json(pid->second) : nlohmann::json();
        entry["discovered"] = snapshot.discovered.count(name) != 0;
        modules.push_back(std::move(entry));
    }
    return nlohmann::json{{"modules", modules}};
}

// ─────────────────────────────────────
bool IsPortAvailable(uint16_t port) {
    const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "socket");
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    const int rc = ::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
    const int err = errno;
    ::close(fd);

    if (rc == 0) {
        return true;
    }
    if (err == EADDRINUSE) {
        return false;
    }
    throw std::system_error(err, std::generic_category(), "bind 127.0.0.1:" + std::to_string(port));
}

// ─────────────────────────────────────
ControlApi::ControlApi(ModuleManager &manager) : m_Manager(manager) {}

// ─────────────────────────────────────
ControlApi::~ControlApi() {
    Stop();
}

// ─────────────────────────────────────
bool ControlApi::Start(uint16_t port) {
    if (m_Thread.joinable()) {
        return true;
    }

    m_Server.set_keep_alive_max_count(1);
    m_Server.set_keep_alive_timeout(1);
    m_Server.set_payload_max_length(64 * 1024);
    m_Server.set_read_timeout(5, 0);
    m_Server.set_write_timeout(5, 0);

    InitRoutes();

    const std::string host = "127.0.0.1";
    if (port == 0) {
        m_Port = m_Server.bind_to_any_port(host);
    } else {
        m_Port = m_Server.bind_to_port(host, port) ? port : -1;
    }
    if (m_Port < 0) {
        spdlog::error("Control API: unable to bind {}:{}", host, port);
        return false;
    }

    m_Thread = std::thread([this] { m_Server.listen_after_bind(); });
    m_Server.wait_until_ready();
    spdlog::info("Control API on http://{}:{}", host, m_Port);
    return true;
}

// ─────────────────────────────────────
void ControlApi::Stop() {
    m_Server.stop();
    if (m_Thread.joinable()) {
        m_Thread.join();
    }
}

// ─────────────────────────────────────
void ControlApi::InitRoutes() {
    m_Server.Get("/api/v1/version", [](const httplib::Request &, httplib::Response &res) {
        res.set_content(nlohmann::json{{"version", AW_TRAY_VERSION}}.dump(), "application/json");
    });

    m_Server.Get("/api/v1/modules", [this](const httplib::Request &, httplib::Response &res) {
        res.set_content(SnapshotToJson(m_Manager.Snapshot()).dump(), "application/json");
    });

    m_Server.Post(R"(/api/v1/modules/([^/]+)/([a-z]+))",
                  [this](const httplib::Request &req, httplib::Response &res) {
                      const std::string name = req.matches[1];
                      const std::string action = req.matches[2];

                      const ModuleSnapshot snapshot = m_Manager.Snapshot();
                      if (snapshot.discovered.count(name) == 0 &&
                          snapshot.running.count(name) == 0) {
                          JsonError(res, 404, "unknown module: " + name);
                          return;
                      }

                      if (action == "start") {
                          m_Manager.StartModule(name);
                      } else if (action == "stop") {
                          m_Manager.StopModule(name);
                      } else if (action == "toggle") {
                          m_Manager.HandleMenuClick(name);
                      } else {
                          JsonError(res, 404, "unknown action: " + action);
                          return;
                      }

                      spdlog::info("Control API: {} {}", action, name);
                      res.set_content(R"({"status":"ok"})", "application/json");
                  });
}
