#pragma once

#include <filesystem>
#include <string>

// XDG autostart entry ($XDG_CONFIG_HOME/autostart/aw-tray.desktop).
class Autostart {
  public:
    explicit Autostart(std::filesystem::path entry_path = DefaultEntryPath());

    static std::filesystem::path DefaultEntryPath();

    const std::filesystem::path &EntryPath() const {
        return m_Path;
    }

    bool IsEnabled() const;
    bool Enable(const std::string &exec_path);
    bool Disable();

    // Writes or removes the entry to match the configured value.
    void Apply(bool enabled, const std::string &exec_path);

  private:
    std::filesystem::path m_Path;
};

// Absolute path of the running executable (/proc/self/exe), argv0 when unavailable.
std::string CurrentExecutable(const char *argv0);
