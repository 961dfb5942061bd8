#pragma once

#include <dbus/dbus.h>

#include <chrono>
#include <map>
#include <string>

// Desktop notifications through org.freedesktop.Notifications.
class Notification {
  public:
    Notification();
    ~Notification();

    Notification(const Notification &) = delete;
    Notification &operator=(const Notification &) = delete;

    bool IsConnected() const {
        return m_Conn != nullptr;
    }

    // Returns false when the message was not sent (no bus, or the same summary was
    // shown less than kRateLimit ago).
    bool SendNotification(const std::string &icon, const std::string &summary,
                          const std::string &msg);

    // Drops whatever the bus sent us (NameAcquired and friends).
    void Poll();

    static constexpr std::chrono::milliseconds kRateLimit{3000};

  private:
    DBusConnection *m_Conn = nullptr;
    std::map<std::string, std::chrono::steady_clock::time_point> m_LastSent;
};
