#include "notification.hpp"

#include <cstdint>

#include <spdlog/spdlog.h>

#include "common.hpp"

// ─────────────────────────────────────
Notification::Notification() {
    DBusError err;
    dbus_error_init(&err);

    // Private so that draining it never steals messages from the tray connection
    m_Conn = dbus_bus_get_private(DBUS_BUS_SESSION, &err);
    if (dbus_error_is_set(&err) || !m_Conn) {
        spdlog::warn("Notification: failed to connect to session bus: {}",
                     dbus_error_is_set(&err) ? err.message : "unknown error");
        dbus_error_free(&err);
        if (m_Conn) {
            dbus_connection_close(m_Conn);
            dbus_connection_unref(m_Conn);
            m_Conn = nullptr;
        }
        return;
    }
    dbus_connection_set_exit_on_disconnect(m_Conn, FALSE);
}

// ─────────────────────────────────────
Notification::~Notification() {
    if (m_Conn) {
        dbus_connection_close(m_Conn);
        dbus_connection_unref(m_Conn);
        m_Conn = nullptr;
    }
}

// ─────────────────────────────────────
bool Notification::SendNotification(const std::string &icon, const std::string &summary,
                                    const std::string &msg) {
    if (!m_Conn) {
        spdlog::info("Notification (no bus): {}: {}", summary, msg);
        return false;
    }

    const auto now = std::chrono::steady_clock::now();
    auto last = m_LastSent.find(summary);
    if (last != m_LastSent.end() && now - last->second < kRateLimit) {
        spdlog::debug("Notification skipped: rate limit exceeded for '{}'", summary);
        return false;
    }

    DBusMessage *msg_dbus = dbus_message_new_method_call("org.freedesktop.Notifications",
                                                         "/org/freedesktop/Notifications",
                                                         "org.freedesktop.Notifications", "Notify");
    if (!msg_dbus) {
        spdlog::error("Failed to create DBus message");
        return false;
    }

    DBusMessageIter args;
    dbus_message_iter_init_append(msg_dbus, &args);

    const char *app_name = AW_TRAY_NAME;
    uint32_t replaces_id = 0;
    const char *icon_c = icon.c_str();
    const char *summary_c = summary.c_str();
    const char *body_c = msg.c_str();
    int32_t timeout = -1; // server default

    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &app_name);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_UINT32, &replaces_id);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &icon_c);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &summary_c);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &body_c);

    DBusMessageIter array;
    dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "s", &array);
    dbus_message_iter_close_container(&args, &array);

    DBusMessageIter dict;
    dbus_message_iter_open_container(&args, DBUS_TYPE_ARRAY, "{sv}", &dict);
    dbus_message_iter_close_container(&args, &dict);

    dbus_message_iter_append_basic(&args, DBUS_TYPE_INT32, &timeout);

    if (!dbus_connection_send(m_Conn, msg_dbus, nullptr)) {
        spdlog::error("Failed to send DBus message");
        dbus_message_unref(msg_dbus);
        return false;
    }
    dbus_connection_flush(m_Conn);

    dbus_message_unref(msg_dbus);
    m_LastSent[summary] = now;
    return true;
}

// ─────────────────────────────────────
void Notification::Poll() {
    if (!m_Conn) {
        return;
    }
    if (!dbus_connection_read_write(m_Conn, 0)) {
        spdlog::warn("Notification: session bus connection lost");
        dbus_connection_close(m_Conn);
        dbus_connection_unref(m_Conn);
        m_Conn = nullptr;
        return;
    }

    DBusMessage *msg;
    while ((msg = dbus_connection_pop_message(m_Conn)) != nullptr) {
        dbus_message_unref(msg);
    }
}
