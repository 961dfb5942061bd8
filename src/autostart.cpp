#include "autostart.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "common.hpp"

// ─────────────────────────────────────
Autostart::Autostart(std::filesystem::path entry_path) : m_Path(std::move(entry_path)) {}

// ─────────────────────────────────────
std::filesystem::path Autostart::DefaultEntryPath() {
    std::filesystem::path base;
    const char *xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        base = xdg;
    } else {
        const char *home = std::getenv("HOME");
        base = std::filesystem::path(home ? home : "") / ".config";
    }
    return base / "autostart" / (std::string(AW_TRAY_NAME) + ".desktop");
}

// ─────────────────────────────────────
bool Autostart::IsEnabled() const {
    std::error_code ec;
    return std::filesystem::is_regular_file(m_Path, ec);
}

// ─────────────────────────────────────
bool Autostart::Enable(const std::string &exec_path) {
    std::error_code ec;
    std::filesystem::create_directories(m_Path.parent_path(), ec);
    if (ec) {
        spdlog::error("Autostart: cannot create {}: {}", m_Path.parent_path().string(),
                      ec.message());
        return false;
    }

    std::ofstream out(m_Path, std::ios::trunc);
    if (!out) {
        spdlog::error("Autostart: cannot write {}", m_Path.string());
        return false;
    }
    out << "[Desktop Entry]\n"
        << "Type=Application\n"
        << "Version=1.0\n"
        << "Name=ActivityWatch\n"
        << "Comment=Starts the ActivityWatch tray and its watchers\n"
        << "Exec=" << exec_path << "\n"
        << "Icon=activitywatch\n"
        << "Terminal=false\n"
        << "StartupNotify=false\n"
        << "X-GNOME-Autostart-enabled=true\n";
    out.close();
    if (!out) {
        spdlog::error("Autostart: failed writing {}", m_Path.string());
        return false;
    }

    spdlog::info("Registered for autostart: true ({})", m_Path.string());
    return true;
}

// ─────────────────────────────────────
bool Autostart::Disable() {
    std::error_code ec;
    std::filesystem::remove(m_Path, ec);
    if (ec) {
        spdlog::error("Autostart: cannot remove {}: {}", m_Path.string(), ec.message());
        return false;
    }
    spdlog::info("Registered for autostart: false");
    return true;
}

// ─────────────────────────────────────
void Autostart::Apply(bool enabled, const std::string &exec_path) {
    if (enabled) {
        if (!IsEnabled()) {
            Enable(exec_path);
        }
    } else if (IsEnabled()) {
        Disable();
    }
}

// ─────────────────────────────────────
std::string CurrentExecutable(const char *argv0) {
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        spdlog::debug("Unable to read /proc/self/exe: {}", ec.message());
        return argv0 ? argv0 : AW_TRAY_NAME;
    }
    return exe.string();
}
