#pragma once

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <random>
#include <sstream>
#include <string>
#include <thread>

// Fresh directory under the system temp dir, removed on scope exit.
class TempDir {
  public:
    explicit TempDir(const std::string &prefix = "aw_tray_test") {
        std::random_device rd;
        m_Path = std::filesystem::temp_directory_path() /
                 (prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(m_Path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_Path, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &Path() const {
        return m_Path;
    }
    std::filesystem::path operator/(const std::string &name) const {
        return m_Path / name;
    }

  private:
    std::filesystem::path m_Path;
};

// Sets an environment variable for the current scope and restores it afterwards.
class ScopedEnv {
  public:
    ScopedEnv(const std::string &name, const std::string &value) : m_Name(name) {
        const char *old = std::getenv(name.c_str());
        if (old) {
            m_Had = true;
            m_Old = old;
        }
        ::setenv(name.c_str(), value.c_str(), 1);
    }
    ~ScopedEnv() {
        if (m_Had) {
            ::setenv(m_Name.c_str(), m_Old.c_str(), 1);
        } else {
            ::unsetenv(m_Name.c_str());
        }
    }

    ScopedEnv(const ScopedEnv &) = delete;
    ScopedEnv &operator=(const ScopedEnv &) = delete;

  private:
    std::string m_Name;
    std::string m_Old;
    bool m_Had = false;
};

inline void WriteFile(const std::filesystem::path &path, const std::string &content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

inline std::string ReadFile(const std::filesystem::path &path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Writes a /bin/sh script and marks it executable.
inline std::filesystem::path WriteScript(const std::filesystem::path &path,
                                         const std::string &body) {
    WriteFile(path, "#!/bin/sh\n" + body + "\n");
    ::chmod(path.c_str(), 0755);
    return path;
}

// Polls pred every 20ms until it holds or timeout expires.
inline bool WaitFor(const std::function<bool()> &pred,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return pred();
}

// False once pid is gone or only a zombie is left.
inline bool IsProcessAlive(pid_t pid) {
    if (::kill(pid, 0) != 0) {
        return false;
    }
    const std::string stat = ReadFile("/proc/" + std::to_string(pid) + "/stat");
    const auto paren = stat.rfind(')');
    if (paren == std::string::npos || paren + 2 >= stat.size()) {
        return false;
    }
    return stat[paren + 2] != 'Z';
}

// Waits for a script to write a pid into path and returns it.
inline pid_t ReadPidFile(const std::filesystem::path &path) {
    std::string content;
    WaitFor([&] {
        content = ReadFile(path);
        return !content.empty() && content.back() == '\n';
    });
    return content.empty() ? -1 : static_cast<pid_t>(std::stol(content));
}
