#pragma once

#include <dbus/dbus.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

#include "tray_menu.hpp"

// StatusNotifierItem with a com.canonical.dbusmenu menu, driven from the main loop via Poll().
class TrayIcon {
  public:
    TrayIcon() = default;
    ~TrayIcon();

    TrayIcon(const TrayIcon &) = delete;
    TrayIcon &operator=(const TrayIcon &) = delete;

    // Returns false when the session bus is unreachable; the app keeps running without a tray.
    bool Start(std::string title);
    void Poll();

    // Replaces the menu, bumps the layout revision and emits LayoutUpdated.
    void SetMenu(MenuModel menu);

    // Non-blocking, edge-triggered requests coming from tray interactions.
    bool TakeOpenUiRequested();
    // Key of the next clicked menu item, in click order.
    bool TakeClicked(std::string &key);

  private:
    static DBusHandlerResult MessageHandler(DBusConnection *conn, DBusMessage *msg,
                                            void *user_data);
    DBusHandlerResult HandleMessage(DBusConnection *conn, DBusMessage *msg);
    DBusHandlerResult HandleMenuMessage(DBusConnection *conn, DBusMessage *msg);

    // Catches NameOwnerChanged for the watcher; a restarted watcher forgets its items.
    static DBusHandlerResult FilterHandler(DBusConnection *conn, DBusMessage *msg, void *user_data);
    DBusHandlerResult HandleFilter(DBusMessage *msg);

    // com.canonical.dbusmenu
    void ReplyMenuIntrospect(DBusConnection *conn, DBusMessage *msg);
    void ReplyMenuGetLayout(DBusConnection *conn, DBusMessage *msg);
    void ReplyMenuGetGroupProperties(DBusConnection *conn, DBusMessage *msg);
    void ReplyMenuGetProperty(DBusConnection *conn, DBusMessage *msg);
    void ReplyMenuEvent(DBusConnection *conn, DBusMessage *msg);
    void ReplyMenuEventGroup(DBusConnection *conn, DBusMessage *msg);
    void ReplyMenuAboutToShow(DBusConnection *conn, DBusMessage *msg);
    void ReplyMenuAboutToShowGroup(DBusConnection *conn, DBusMessage *msg);
    void ReplyMenuProperties(DBusConnection *conn, DBusMessage *msg, bool all);
    void OnMenuEvent(int id, const std::string &event);
    void EmitLayoutUpdated();

    void RegisterWithWatcher();
    bool SetupConnection();
    void TeardownConnection();

    void ReplyIntrospect(DBusConnection *conn, DBusMessage *msg);
    void ReplyGetProperty(DBusConnection *conn, DBusMessage *msg);
    void ReplyGetAllProperties(DBusConnection *conn, DBusMessage *msg);
    void ReplyEmptyMethodReturn(DBusConnection *conn, DBusMessage *msg);

    const char *GetPropString(const char *prop) const;

  private:
    DBusConnection *m_Conn = nullptr;
    std::string m_BusName;
    std::string m_Title;
    std::string m_IconName = "activitywatch";
    bool m_Started = false;
    bool m_ReregisterPending = false;
    std::chrono::steady_clock::time_point m_LastReconnect;

    std::mutex m_MenuMutex;
    MenuModel m_Menu;
    uint32_t m_Revision = 1;

    std::atomic<bool> m_OpenUiRequested{false};
    std::mutex m_ClickMutex;
    std::deque<std::string> m_Clicked;
};
