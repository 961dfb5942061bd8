#include "tray.hpp"

#include <spdlog/spdlog.h>

#include <cstring>
#include <string>
#include <vector>
#include <unistd.h>

namespace {
static constexpr const char *kObjPath = "/StatusNotifierItem";
static constexpr const char *kMenuPath = "/MenuBar";
static constexpr const char *kIfaceSNI = "org.kde.StatusNotifierItem";
static constexpr const char *kIfaceMenu = "com.canonical.dbusmenu";
static constexpr const char *kIfaceProps = "org.freedesktop.DBus.Properties";
static constexpr const char *kIfaceIntro = "org.freedesktop.DBus.Introspectable";
static constexpr const char *kWatcherName = "org.kde.StatusNotifierWatcher";

static void append_variant_string(DBusMessageIter *iter, const char *value) {
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "s", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_STRING, &value);
    dbus_message_iter_close_container(iter, &variant);
}

static void append_variant_bool(DBusMessageIter *iter, bool value) {
    DBusMessageIter variant;
    dbus_bool_t b = value ? TRUE : FALSE;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "b", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_BOOLEAN, &b);
    dbus_message_iter_close_container(iter, &variant);
}

static void append_variant_int(DBusMessageIter *iter, int value) {
    DBusMessageIter variant;
    dbus_int32_t i = value;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "i", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_INT32, &i);
    dbus_message_iter_close_container(iter, &variant);
}

static void append_variant_uint(DBusMessageIter *iter, uint32_t value) {
    DBusMessageIter variant;
    dbus_uint32_t u = value;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "u", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_UINT32, &u);
    dbus_message_iter_close_container(iter, &variant);
}

static void append_variant_path(DBusMessageIter *iter, const char *path) {
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "o", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_OBJECT_PATH, &path);
    dbus_message_iter_close_container(iter, &variant);
}

static void append_variant_empty_strings(DBusMessageIter *iter) {
    DBusMessageIter variant, arr;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "as", &variant);
    dbus_message_iter_open_container(&variant, DBUS_TYPE_ARRAY, "s", &arr);
    dbus_message_iter_close_container(&variant, &arr);
    dbus_message_iter_close_container(iter, &variant);
}

static void dict_append_string(DBusMessageIter *dictIter, const char *key, const char *value) {
    DBusMessageIter entry;
    dbus_message_iter_open_container(dictIter, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    append_variant_string(&entry, value);
    dbus_message_iter_close_container(dictIter, &entry);
}

static void dict_append_bool(DBusMessageIter *dictIter, const char *key, bool value) {
    DBusMessageIter entry;
    dbus_message_iter_open_container(dictIter, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    append_variant_bool(&entry, value);
    dbus_message_iter_close_container(dictIter, &entry);
}

static void dict_append_int(DBusMessageIter *dictIter, const char *key, int value) {
    DBusMessageIter entry;
    dbus_message_iter_open_container(dictIter, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    append_variant_int(&entry, value);
    dbus_message_iter_close_container(dictIter, &entry);
}

// dbusmenu properties of a single item; defaults (visible, standard type) are implied.
static void append_item_properties(DBusMessageIter *dict, const MenuItem &item) {
    if (item.type == MENU_SEPARATOR) {
        dict_append_string(dict, "type", "separator");
        return;
    }
    dict_append_string(dict, "label", item.label.c_str());
    dict_append_bool(dict, "enabled", item.enabled);
    dict_append_bool(dict, "visible", true);
    if (item.type == MENU_CHECKMARK) {
        dict_append_string(dict, "toggle-type", "checkmark");
        dict_append_int(dict, "toggle-state", item.checked ? 1 : 0);
    }
    if (item.type == MENU_SUBMENU) {
        dict_append_string(dict, "children-display", "submenu");
    }
}

static bool append_item_property(DBusMessageIter *iter, const MenuItem &item, const char *name) {
    if (std::strcmp(name, "type") == 0) {
        append_variant_string(iter, item.type == MENU_SEPARATOR ? "separator" : "standard");
    } else if (std::strcmp(name, "label") == 0) {
        append_variant_string(iter, item.label.c_str());
    } else if (std::strcmp(name, "enabled") == 0) {
        append_variant_bool(iter, item.enabled);
    } else if (std::strcmp(name, "visible") == 0) {
        append_variant_bool(iter, true);
    } else if (std::strcmp(name, "toggle-type") == 0 && item.type == MENU_CHECKMARK) {
        append_variant_string(iter, "checkmark");
    } else if (std::strcmp(name, "toggle-state") == 0 && item.type == MENU_CHECKMARK) {
        append_variant_int(iter, item.checked ? 1 : 0);
    } else if (std::strcmp(name, "children-display") == 0 && item.type == MENU_SUBMENU) {
        append_variant_string(iter, "submenu");
    } else {
        return false;
    }
    return true;
}

// (ia{sv}av); depth < 0 means the whole subtree.
static void append_layout(DBusMessageIter *iter, const MenuItem &item, int depth) {
    DBusMessageIter st, dict, children;
    dbus_message_iter_open_container(iter, DBUS_TYPE_STRUCT, nullptr, &st);

    dbus_int32_t id = item.id;
    dbus_message_iter_append_basic(&st, DBUS_TYPE_INT32, &id);

    dbus_message_iter_open_container(&st, DBUS_TYPE_ARRAY, "{sv}", &dict);
    append_item_properties(&dict, item);
    dbus_message_iter_close_container(&st, &dict);

    dbus_message_iter_open_container(&st, DBUS_TYPE_ARRAY, "v", &children);
    if (depth != 0) {
        for (const auto &child : item.children) {
            DBusMessageIter variant;
            dbus_message_iter_open_container(&children, DBUS_TYPE_VARIANT, "(ia{sv}av)", &variant);
            append_layout(&variant, child, depth < 0 ? -1 : depth - 1);
            dbus_message_iter_close_container(&children, &variant);
        }
    }
    dbus_message_iter_close_container(&st, &children);

    dbus_message_iter_close_container(iter, &st);
}

static void collect_items(const MenuItem &item, std::vector<const MenuItem *> &out) {
    out.push_back(&item);
    for (const auto &child : item.children) {
        collect_items(child, out);
    }
}

static void reply_error(DBusConnection *conn, DBusMessage *msg, const char *name,
                        const std::string &text) {
    DBusMessage *reply = dbus_message_new_error(msg, name, text.c_str());
    if (!reply) {
        return;
    }
    dbus_connection_send(conn, reply, nullptr);
    dbus_message_unref(reply);
}

static bool read_int32(DBusMessageIter *iter, int &out) {
    if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_INT32) {
        return false;
    }
    dbus_int32_t value = 0;
    dbus_message_iter_get_basic(iter, &value);
    out = value;
    return true;
}

static bool read_string(DBusMessageIter *iter, std::string &out) {
    if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_STRING) {
        return false;
    }
    const char *value = nullptr;
    dbus_message_iter_get_basic(iter, &value);
    out = value ? value : "";
    return true;
}
} // namespace

// ─────────────────────────────────────
TrayIcon::~TrayIcon() {
    TeardownConnection();
}

// ─────────────────────────────────────
bool TrayIcon::Start(std::string title) {
    if (m_Started) {
        return true;
    }

    m_Title = std::move(title);
    if (!SetupConnection()) {
        return false;
    }

    m_Started = true;
    spdlog::info("Tray: StatusNotifierItem exported as {}{}", m_BusName, kObjPath);
    return true;
}

// ─────────────────────────────────────
bool TrayIcon::SetupConnection() {
    DBusError err;
    dbus_error_init(&err);

    m_Conn = dbus_bus_get(DBUS_BUS_SESSION, &err);
    if (!m_Conn) {
        if (dbus_error_is_set(&err)) {
            spdlog::warn("Tray: DBus session connection failed: {}", err.message);
            dbus_error_free(&err);
        } else {
            spdlog::warn("Tray: DBus session connection failed");
        }
        return false;
    }
    // A lost session bus must not take the process down with it.
    dbus_connection_set_exit_on_disconnect(m_Conn, FALSE);

    const pid_t pid = getpid();
    m_BusName = "org.kde.StatusNotifierItem-" + std::to_string(static_cast<int>(pid)) + "-1";

    const int req = dbus_bus_request_name(m_Conn, m_BusName.c_str(), DBUS_NAME_FLAG_REPLACE_EXISTING,
                                          &err);
    if (req != DBUS_REQUEST_NAME_REPLY_PRIMARY_OWNER) {
        if (dbus_error_is_set(&err)) {
            spdlog::warn("Tray: request_name failed: {}", err.message);
            dbus_error_free(&err);
        } else {
            spdlog::warn("Tray: request_name failed");
        }
        dbus_connection_unref(m_Conn);
        m_Conn = nullptr;
        return false;
    }

    static DBusObjectPathVTable vtable{};
    vtable.message_function = &TrayIcon::MessageHandler;

    if (!dbus_connection_register_object_path(m_Conn, kObjPath, &vtable, this) ||
        !dbus_connection_register_object_path(m_Conn, kMenuPath, &vtable, this)) {
        spdlog::warn("Tray: failed to register object paths");
        dbus_connection_unregister_object_path(m_Conn, kObjPath);
        dbus_connection_unref(m_Conn);
        m_Conn = nullptr;
        return false;
    }

    dbus_bus_add_match(m_Conn,
                       "type='signal',sender='org.freedesktop.DBus',"
                       "interface='org.freedesktop.DBus',member='NameOwnerChanged',"
                       "arg0='org.kde.StatusNotifierWatcher'",
                       &err);
    if (dbus_error_is_set(&err)) {
        spdlog::debug("Tray: add_match failed: {}", err.message);
        dbus_error_free(&err);
    }
    dbus_connection_add_filter(m_Conn, &TrayIcon::FilterHandler, this, nullptr);

    RegisterWithWatcher();
    return true;
}

// ─────────────────────────────────────
void TrayIcon::TeardownConnection() {
    if (!m_Conn) {
        return;
    }
    dbus_connection_remove_filter(m_Conn, &TrayIcon::FilterHandler, this);
    dbus_connection_unregister_object_path(m_Conn, kObjPath);
    dbus_connection_unregister_object_path(m_Conn, kMenuPath);
    // Drop our reference; DBus will close when refcount hits zero.
    dbus_connection_unref(m_Conn);
    m_Conn = nullptr;
}

// ─────────────────────────────────────
void TrayIcon::Poll() {
    if (!m_Conn) {
        if (!m_Started) {
            return;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now - m_LastReconnect < std::chrono::seconds(5)) {
            return;
        }
        m_LastReconnect = now;
        if (SetupConnection()) {
            spdlog::info("Tray: reconnected to the session bus");
            EmitLayoutUpdated();
        }
        return;
    }

    if (!dbus_connection_read_write(m_Conn, 0)) {
        spdlog::warn("Tray: session bus connection lost");
        TeardownConnection();
        m_LastReconnect = std::chrono::steady_clock::now();
        return;
    }
    while (dbus_connection_dispatch(m_Conn) == DBUS_DISPATCH_DATA_REMAINS) {
    }

    if (m_ReregisterPending) {
        m_ReregisterPending = false;
        spdlog::info("Tray: StatusNotifierWatcher restarted, registering again");
        RegisterWithWatcher();
    }
}

// ─────────────────────────────────────
void TrayIcon::SetMenu(MenuModel menu) {
    {
        std::lock_guard<std::mutex> lock(m_MenuMutex);
        m_Menu = std::move(menu);
        ++m_Revision;
    }
    EmitLayoutUpdated();
}

// ─────────────────────────────────────
bool TrayIcon::TakeOpenUiRequested() {
    return m_OpenUiRequested.exchange(false);
}

// ─────────────────────────────────────
bool TrayIcon::TakeClicked(std::string &key) {
    std::lock_guard<std::mutex> lock(m_ClickMutex);
    if (m_Clicked.empty()) {
        return false;
    }
    key = std::move(m_Clicked.front());
    m_Clicked.pop_front();
    return true;
}

// ─────────────────────────────────────
DBusHandlerResult TrayIcon::MessageHandler(DBusConnection *conn, DBusMessage *msg, void *user_data) {
    auto *self = static_cast<TrayIcon *>(user_data);
    if (!self) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }
    return self->HandleMessage(conn, msg);
}

// ─────────────────────────────────────
DBusHandlerResult TrayIcon::FilterHandler(DBusConnection *, DBusMessage *msg, void *user_data) {
    auto *self = static_cast<TrayIcon *>(user_data);
    if (!self) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }
    return self->HandleFilter(msg);
}

// ─────────────────────────────────────
DBusHandlerResult TrayIcon::HandleFilter(DBusMessage *msg) {
    if (!dbus_message_is_signal(msg, "org.freedesktop.DBus", "NameOwnerChanged")) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    const char *name = nullptr;
    const char *oldOwner = nullptr;
    const char *newOwner = nullptr;
    DBusError err;
    dbus_error_init(&err);
    if (!dbus_message_get_args(msg, &err, DBUS_TYPE_STRING, &name, DBUS_TYPE_STRING, &oldOwner,
                               DBUS_TYPE_STRING, &newOwner, DBUS_TYPE_INVALID)) {
        if (dbus_error_is_set(&err)) {
            dbus_error_free(&err);
        }
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    // Registration blocks on a reply, so it is deferred until dispatch is done.
    if (name && std::strcmp(name, kWatcherName) == 0 && newOwner && newOwner[0] != '\0') {
        m_ReregisterPending = true;
    }
    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

// ─────────────────────────────────────
DBusHandlerResult TrayIcon::HandleMessage(DBusConnection *conn, DBusMessage *msg) {
    const char *path = dbus_message_get_path(msg);
    if (path && std::strcmp(path, kMenuPath) == 0) {
        return HandleMenuMessage(conn, msg);
    }

    if (dbus_message_is_method_call(msg, kIfaceIntro, "Introspect")) {
        ReplyIntrospect(conn, msg);
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    if (dbus_message_is_method_call(msg, kIfaceProps, "Get")) {
        ReplyGetProperty(conn, msg);
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    if (dbus_message_is_method_call(msg, kIfaceProps, "GetAll")) {
        ReplyGetAllProperties(conn, msg);
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    // Left click opens the dashboard; the menu covers everything else.
    if (dbus_message_is_method_call(msg, kIfaceSNI, "Activate")) {
        m_OpenUiRequested = true;
        ReplyEmptyMethodReturn(conn, msg);
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    if (dbus_message_is_method_call(msg, kIfaceSNI, "SecondaryActivate") ||
        dbus_message_is_method_call(msg, kIfaceSNI, "ContextMenu") ||
        dbus_message_is_method_call(msg, kIfaceSNI, "Scroll")) {
        ReplyEmptyMethodReturn(conn, msg);
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

// ─────────────────────────────────────
DBusHandlerResult TrayIcon::HandleMenuMessage(DBusConnection *conn, DBusMessage *msg) {
    if (dbus_message_is_method_call(msg, kIfaceIntro, "Introspect")) {
        ReplyMenuIntrospect(conn, msg);
    } else if (dbus_message_is_method_call(msg, kIfaceProps, "Get")) {
        ReplyMenuProperties(conn, msg, false);
    } else if (dbus_message_is_method_call(msg, kIfaceProps, "GetAll")) {
        ReplyMenuProperties(conn, msg, true);
    } else if (dbus_message_is_method_call(msg, kIfaceMenu, "GetLayout")) {
        ReplyMenuGetLayout(conn, msg);
    } else if (dbus_message_is_method_call(msg, kIfaceMenu, "GetGroupProperties")) {
        ReplyMenuGetGroupProperties(conn, msg);
    } else if (dbus_message_is_method_call(msg, kIfaceMenu, "GetProperty")) {
        ReplyMenuGetProperty(conn, msg);
    } else if (dbus_message_is_method_call(msg, kIfaceMenu, "Event")) {
        ReplyMenuEvent(conn, msg);
    } else if (dbus_message_is_method_call(msg, kIfaceMenu, "EventGroup")) {
        ReplyMenuEventGroup(conn, msg);
    } else if (dbus_message_is_method_call(msg, kIfaceMenu, "AboutToShow")) {
        ReplyMenuAboutToShow(conn, msg);
    } else if (dbus_message_is_method_call(msg, kIfaceMenu, "AboutToShowGroup")) {
        ReplyMenuAboutToShowGroup(conn, msg);
    } else {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }
    return DBUS_HANDLER_RESULT_HANDLED;
}

// ─────────────────────────────────────
void TrayIcon::RegisterWithWatcher() {
    if (!m_Conn) {
        return;
    }

    DBusMessage *msg = dbus_message_new_method_call(kWatcherName, "/StatusNotifierWatcher",
                                                    kWatcherName, "RegisterStatusNotifierItem");
    if (!msg) {
        return;
    }

    const char *name = m_BusName.c_str();
    dbus_message_append_args(msg, DBUS_TYPE_STRING, &name, DBUS_TYPE_INVALID);

    DBusError err;
    dbus_error_init(&err);
    DBusMessage *reply = dbus_connection_send_with_reply_and_block(m_Conn, msg, 1000, &err);
    if (!reply) {
        // Watcher may not exist yet; NameOwnerChanged tells us when it appears.
        if (dbus_error_is_set(&err)) {
            spdlog::debug("Tray: watcher registration failed: {}", err.message);
            dbus_error_free(&err);
        }
    } else {
        dbus_message_unref(reply);
    }

    dbus_message_unref(msg);
    dbus_connection_flush(m_Conn);
}

// ─────────────────────────────────────
void TrayIcon::EmitLayoutUpdated() {
    if (!m_Conn) {
        return;
    }
    DBusMessage *sig = dbus_message_new_signal(kMenuPath, kIfaceMenu, "LayoutUpdated");
    if (!sig) {
        return;
    }

    dbus_uint32_t revision;
    {
        std::lock_guard<std::mutex> lock(m_MenuMutex);
        revision = m_Revision;
    }
    dbus_int32_t parent = 0;
    dbus_message_append_args(sig, DBUS_TYPE_UINT32, &revision, DBUS_TYPE_INT32, &parent,
                             DBUS_TYPE_INVALID);

    dbus_connection_send(m_Conn, sig, nullptr);
    dbus_message_unref(sig);
    dbus_connection_flush(m_Conn);
}

// ─────────────────────────────────────
void TrayIcon::ReplyIntrospect(DBusConnection *conn, DBusMessage *msg) {
    static const char *xml =
        "<node>"
        " <interface name='org.freedesktop.DBus.Introspectable'>"
        "  <method name='Introspect'>"
        "   <arg name='xml_data' type='s' direction='out'/>"
        "  </method>"
        " </interface>"
        " <interface name='org.freedesktop.DBus.Properties'>"
        "  <method name='Get'>"
        "   <arg name='interface' type='s' direction='in'/>"
        "   <arg name='prop' type='s' direction='in'/>"
        "   <arg name='value' type='v' direction='out'/>"
        "  </method>"
        "  <method name='GetAll'>"
        "   <arg name='interface' type='s' direction='in'/>"
        "   <arg name='props' type='a{sv}' direction='out'/>"
        "  </method>"
        " </interface>"
        " <interface name='org.kde.StatusNotifierItem'>"
        "  <property name='Category' type='s' access='read'/>"
        "  <property name='Id' type='s' access='read'/>"
        "  <property name='Title' type='s' access='read'/>"
        "  <property name='Status' type='s' access='read'/>"
        "  <property name='IconName' type='s' access='read'/>"
        "  <property name='Menu' type='o' access='read'/>"
        "  <property name='ItemIsMenu' type='b' access='read'/>"
        "  <method name='Activate'>"
        "   <arg name='x' type='i' direction='in'/>"
        "   <arg name='y' type='i' direction='in'/>"
        "  </method>"
        "  <method name='SecondaryActivate'>"
        "   <arg name='x' type='i' direction='in'/>"
        "   <arg name='y' type='i' direction='in'/>"
        "  </method>"
        "  <method name='ContextMenu'>"
        "   <arg name='x' type='i' direction='in'/>"
        "   <arg name='y' type='i' direction='in'/>"
        "  </method>"
        "  <signal name='NewIcon'/>"
        " </interface>"
        "</node>";

    DBusMessage *reply = dbus_message_new_method_return(msg);
    if (!reply) {
        return;
    }

    dbus_message_append_args(reply, DBUS_TYPE_STRING, &xml, DBUS_TYPE_INVALID);
    dbus_connection_send(conn, reply, nullptr);
    dbus_message_unref(reply);
}

// ─────────────────────────────────────
void TrayIcon::ReplyMenuIntrospect(DBusConnection *conn, DBusMessage *msg) {
    static const char *xml =
        "<node>"
        " <interface name='com.canonical.dbusmenu'>"
        "  <property name='Version' type='u' access='read'/>"
        "  <property name='TextDirection' type='s' access='read'/>"
        "  <property name='Status' type='s' access='read'/>"
        "  <property name='IconThemePath' type='as' access='read'/>"
        "  <method name='GetLayout'>"
        "   <arg name='parentId' type='i' direction='in'/>"
        "   <arg name='recursionDepth' type='i' direction='in'/>"
        "   <arg name='propertyNames' type='as' direction='in'/>"
        "   <arg name='revision' type='u' direction='out'/>"
        "   <arg name='layout' type='(ia{sv}av)' direction='out'/>"
        "  </method>"
        "  <method name='GetGroupProperties'>"
        "   <arg name='ids' type='ai' direction='in'/>"
        "   <arg name='propertyNames' type='as' direction='in'/>"
        "   <arg name='properties' type='a(ia{sv})' direction='out'/>"
        "  </method>"
        "  <method name='GetProperty'>"
        "   <arg name='id' type='i' direction='in'/>"
        "   <arg name='name' type='s' direction='in'/>"
        "   <arg name='value' type='v' direction='out'/>"
        "  </method>"
        "  <method name='Event'>"
        "   <arg name='id' type='i' direction='in'/>"
        "   <arg name='eventId' type='s' direction='in'/>"
        "   <arg name='data' type='v' direction='in'/>"
        "   <arg name='timestamp' type='u' direction='in'/>"
        "  </method>"
        "  <method name='EventGroup'>"
        "   <arg name='events' type='a(isvu)' direction='in'/>"
        "   <arg name='idErrors' type='ai' direction='out'/>"
        "  </method>"
        "  <method name='AboutToShow'>"
        "   <arg name='id' type='i' direction='in'/>"
        "   <arg name='needUpdate' type='b' direction='out'/>"
        "  </method>"
        "  <method name='AboutToShowGroup'>"
        "   <arg name='ids' type='ai' direction='in'/>"
        "   <arg name='updatesNeeded' type='ai' direction='out'/>"
        "   <arg name='idErrors' type='ai' direction='out'/>"
        "  </method>"
        "  <signal name='LayoutUpdated'>"
        "   <arg name='revision' type='u'/>"
        "   <arg name='parent' type='i'/>"
        "  </signal>"
        "  <signal name='ItemsPropertiesUpdated'>"
        "   <arg name='updatedProps' type='a(ia{sv})'/>"
        "   <arg name='removedProps' type='a(ias)'/>"
        "  </signal>"
        " </interface>"
        "</node>";

    DBusMessage *reply = dbus_message_new_method_return(msg);
    if (!reply) {
        return;
    }
    dbus_message_append_args(reply, DBUS_TYPE_STRING, &xml, DBUS_TYPE_INVALID);
    dbus_connection_send(conn, reply, nullptr);
    dbus_message_unref(reply);
}

// ─────────────────────────────────────
void TrayIcon::ReplyMenuGetLayout(DBusConnection *conn, DBusMessage *msg) {
    DBusMessageIter args;
    int parentId = 0;
    int depth = -1;
    if (!dbus_message_iter_init(msg, &args) || !read_int32(&args, parentId) ||
        !dbus_message_iter_next(&args) || !read_int32(&args, depth)) {
        reply_error(conn, msg, DBUS_ERROR_INVALID_ARGS, "GetLayout expects (i, i, as)");
        return;
    }

    std::lock_guard<std::mutex> lock(m_MenuMutex);
    const MenuItem *parent = m_Menu.FindById(parentId);
    if (!parent) {
        reply_error(conn, msg, DBUS_ERROR_INVALID_ARGS, "Unknown menu id " + std::to_string(parentId));
        return;
    }

    DBusMessage *reply = dbus_message_new_method_return(msg);
    if (!reply) {
        return;
    }

    DBusMessageIter iter;
    dbus_message_iter_init_append(reply, &iter);
    dbus_uint32_t revision = m_Revision;
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_UINT32, &revision);
    append_layout(&iter, *parent, depth);

    dbus_connection_send(conn, reply, nullptr);
    dbus_message_unref(reply);
}

// ─────────────────────────────────────
void TrayIcon::ReplyMenuGetGroupProperties(DBusConnection *conn, DBusMessage *msg) {
    std::vector<int> ids;
    DBusMessageIter args;
    if (dbus_message_iter_init(msg, &args) &&
        dbus_message_iter_get_arg_type(&args) == DBUS_TYPE_ARRAY) {
        DBusMessageIter arr;
        dbus_message_iter_recurse(&args, &arr);
        int id = 0;
        while (read_int32(&arr, id)) {
            ids.push_back(id);
            dbus_message_iter_next(&arr);
        }
    }

    std::lock_guard<std::mutex> lock(m_MenuMutex);
    std::vector<const MenuItem *> items;
    if (ids.empty()) {
        collect_items(m_Menu.Root(), items);
    } else {
        for (int id : ids) {
            if (const MenuItem *item = m_Menu.FindById(id)) {
                items.push_back(item);
            }
        }
    }

    DBusMessage *reply = dbus_message_new_method_return(msg);
    if (!reply) {
        return;
    }

    DBusMessageIter iter, arr;
    dbus_message_iter_init_append(reply, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "(ia{sv})", &arr);
    for (const MenuItem *item : items) {
        DBusMessageIter st, dict;
        dbus_message_iter_open_container(&arr, DBUS_TYPE_STRUCT, nullptr, &st);
        dbus_int32_t id = item->id;
        dbus_message_iter_append_basic(&st, DBUS_TYPE_INT32, &id);
        dbus_message_iter_open_container(&st, DBUS_TYPE_ARRAY, "{sv}", &dict);
        append_item_properties(&dict, *item);
        dbus_message_iter_close_container(&st, &dict);
        dbus_message_iter_close_container(&arr, &st);
    }
    dbus_message_iter_close_container(&iter, &arr);

    dbus_connection_send(conn, reply, nullptr);
    dbus_message_unref(reply);
}

// ─────────────────────────────────────
void TrayIcon::ReplyMenuGetProperty(DBusConnection *conn, DBusMessage *msg) {
    DBusMessageIter args;
    int id = 0;
    std::string name;
    if (!dbus_message_iter_init(msg, &args) || !read_int32(&args, id) ||
        !dbus_message_iter_next(&args) || !read_string(&args, name)) {
        reply_error(conn, msg, DBUS_ERROR_INVALID_ARGS, "GetProperty expects (i, s)");
        return;
    }

    std::lock_guard<std::mutex> lock(m_MenuMutex);
    const MenuItem *item = m_Menu.FindById(id);
    if (!item) {
        reply_error(conn, msg, DBUS_ERROR_INVALID_ARGS, "Unknown menu id " + std::to_string(id));
        return;
    }

    DBusMessage *reply = dbus_message_new_method_return(msg);
    if (!reply) {
        return;
    }
    DBusMessageIter iter;
    dbus_message_iter_init_append(reply, &iter);
    if (!append_item_property(&iter, *item, name.c_str())) {
        dbus_message_unref(reply);
        reply_error(conn, msg, DBUS_ERROR_INVALID_ARGS, "Unknown property " + name);
        return;
    }
    dbus_connection_send(conn, reply, nullptr);
    dbus_message_unref(reply);
}

// ─────────────────────────────────────
void TrayIcon::ReplyMenuEvent(DBusConnection *conn, DBusMessage *msg) {
    DBusMessageIter args;
    int id = 0;
    std::string event;
    if (!dbus_message_iter_init(msg, &args) || !read_int32(&args, id) ||
        !dbus_message_iter_next(&args) || !read_string(&args, event)) {
        reply_error(conn, msg, DBUS_ERROR_INVALID_ARGS, "Event expects (i, s, v, u)");
        return;
    }

    OnMenuEvent(id, event);
    ReplyEmptyMethodReturn(conn, msg);
}

// ─────────────────────────────────────
void TrayIcon::ReplyMenuEventGroup(DBusConnection *conn, DBusMessage *msg) {
    DBusMessageIter args;
    if (dbus_message_iter_init(msg, &args) &&
        dbus_message_iter_get_arg_type(&args) == DBUS_TYPE_ARRAY) {
        DBusMessageIter arr;
        dbus_message_iter_recurse(&args, &arr);
        while (dbus_message_iter_get_arg_type(&arr) == DBUS_TYPE_STRUCT) {
            DBusMessageIter st;
            dbus_message_iter_recurse(&arr, &st);
            int id = 0;
            std::string event;
            if (read_int32(&st, id) && dbus_message_iter_next(&st) && read_string(&st, event)) {
                OnMenuEvent(id, event);
            }
            dbus_message_iter_next(&arr);
        }
    }

    DBusMessage *reply = dbus_message_new_method_return(msg);
    if (!reply) {
        return;
    }
    DBusMessageIter iter, errors;
    dbus_message_iter_init_append(reply, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "i", &errors);
    dbus_message_iter_close_container(&iter, &errors);
    dbus_connection_send(conn, reply, nullptr);
    dbus_message_unref(reply);
}

// ─────────────────────────────────────
void TrayIcon::ReplyMenuAboutToShow(DBusConnection *conn, DBusMessage *msg) {
    DBusMessage *reply = dbus_message_new_method_return(msg);
    if (!reply) {
        return;
    }
    dbus_bool_t needUpdate = FALSE;
    dbus_message_append_args(reply, DBUS_TYPE_BOOLEAN, &needUpdate, DBUS_TYPE_INVALID);
    dbus_connection_send(conn, reply, nullptr);
    dbus_message_unref(reply);
}

// ─────────────────────────────────────
void TrayIcon::ReplyMenuAboutToShowGroup(DBusConnection *conn, DBusMessage *msg) {
    DBusMessage *reply = dbus_message_new_method_return(msg);
    if (!reply) {
        return;
    }
    DBusMessageIter iter, updates, errors;
    dbus_message_iter_init_append(reply, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "i", &updates);
    dbus_message_iter_close_container(&iter, &updates);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "i", &errors);
    dbus_message_iter_close_container(&iter, &errors);
    dbus_connection_send(conn, reply, nullptr);
    dbus_message_unref(reply);
}

// ─────────────────────────────────────
void TrayIcon::ReplyMenuProperties(DBusConnection *conn, DBusMessage *msg, bool all) {
    DBusMessageIter args;
    std::string iface;
    std::string prop;
    if (!dbus_message_iter_init(msg, &args) || !read_string(&args, iface) ||
        (!all && (!dbus_message_iter_next(&args) || !read_string(&args, prop)))) {
        reply_error(conn, msg, DBUS_ERROR_INVALID_ARGS, "Invalid Properties call");
        return;
    }
    if (iface != kIfaceMenu) {
        reply_error(conn, msg, DBUS_ERROR_INVALID_ARGS, "Unknown interface " + iface);
        return;
    }

    DBusMessage *reply = dbus_message_new_method_return(msg);
    if (!reply) {
        return;
    }
    DBusMessageIter iter;
    dbus_message_iter_init_append(reply, &iter);

    if (all) {
        DBusMessageIter dict, entry;
        dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);

        const char *key = "Version";
        dbus_message_iter_open_container(&dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
        append_variant_uint(&entry, 3);
        dbus_message_iter_close_container(&dict, &entry);

        dict_append_string(&dict, "TextDirection", "ltr");
        dict_append_string(&dict, "Status", "normal");

        key = "IconThemePath";
        dbus_message_iter_open_container(&dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
        append_variant_empty_strings(&entry);
        dbus_message_iter_close_container(&dict, &entry);

        dbus_message_iter_close_container(&iter, &dict);
    } else if (prop == "Version") {
        append_variant_uint(&iter, 3);
    } else if (prop == "TextDirection") {
        append_variant_string(&iter, "ltr");
    } else if (prop == "Status") {
        append_variant_string(&iter, "normal");
    } else if (prop == "IconThemePath") {
        append_variant_empty_strings(&iter);
    } else {
        dbus_message_unref(reply);
        reply_error(conn, msg, DBUS_ERROR_INVALID_ARGS, "Unknown property " + prop);
        return;
    }

    dbus_connection_send(conn, reply, nullptr);
    dbus_message_unref(reply);
}

// ─────────────────────────────────────
void TrayIcon::OnMenuEvent(int id, const std::string &event) {
    if (event != "clicked") {
        return;
    }

    std::string key;
    {
        std::lock_guard<std::mutex> lock(m_MenuMutex);
        const MenuItem *item = m_Menu.FindById(id);
        if (!item || !item->enabled || item->key.empty() || item->type == MENU_SEPARATOR ||
            item->type == MENU_SUBMENU) {
            return;
        }
        key = item->key;
    }

    spdlog::debug("Tray: menu item {} ({}) clicked", id, key);
    std::lock_guard<std::mutex> lock(m_ClickMutex);
    m_Clicked.push_back(std::move(key));
}

// ─────────────────────────────────────
const char *TrayIcon::GetPropString(const char *prop) const {
    if (std::strcmp(prop, "Category") == 0) {
        return "ApplicationStatus";
    }
    if (std::strcmp(prop, "Id") == 0) {
        return AW_TRAY_NAME;
    }
    if (std::strcmp(prop, "Title") == 0) {
        return m_Title.c_str();
    }
    if (std::strcmp(prop, "Status") == 0) {
        return "Active";
    }
    if (std::strcmp(prop, "IconName") == 0) {
        return m_IconName.c_str();
    }

    return "";
}

// ─────────────────────────────────────
void TrayIcon::ReplyGetProperty(DBusConnection *conn, DBusMessage *msg) {
    const char *iface = nullptr;
    const char *prop = nullptr;

    DBusError err;
    dbus_error_init(&err);

    if (!dbus_message_get_args(msg, &err, DBUS_TYPE_STRING, &iface, DBUS_TYPE_STRING, &prop,
                               DBUS_TYPE_INVALID)) {
        if (dbus_error_is_set(&err)) {
            spdlog::debug("Tray: Properties.Get args error: {}", err.message);
            reply_error(conn, msg, DBUS_ERROR_INVALID_ARGS, err.message);
            dbus_error_free(&err);
        }
        return;
    }

    if (!iface || std::strcmp(iface, kIfaceSNI) != 0) {
        reply_error(conn, msg, DBUS_ERROR_INVALID_ARGS, "Unknown interface");
        return;
    }

    DBusMessage *reply = dbus_message_new_method_return(msg);
    if (!reply) {
        return;
    }

    DBusMessageIter iter;
    dbus_message_iter_init_append(reply, &iter);
    const char *name = prop ? prop : "";
    if (std::strcmp(name, "Menu") == 0) {
        append_variant_path(&iter, kMenuPath);
    } else if (std::strcmp(name, "ItemIsMenu") == 0) {
        append_variant_bool(&iter, false);
    } else {
        append_variant_string(&iter, GetPropString(name));
    }

    dbus_connection_send(conn, reply, nullptr);
    dbus_message_unref(reply);
}

// ─────────────────────────────────────
void TrayIcon::ReplyGetAllProperties(DBusConnection *conn, DBusMessage *msg) {
    const char *iface = nullptr;

    DBusError err;
    dbus_error_init(&err);
    if (!dbus_message_get_args(msg, &err, DBUS_TYPE_STRING, &iface, DBUS_TYPE_INVALID)) {
        if (dbus_error_is_set(&err)) {
            reply_error(conn, msg, DBUS_ERROR_INVALID_ARGS, err.message);
            dbus_error_free(&err);
        }
        return;
    }

    if (!iface || std::strcmp(iface, kIfaceSNI) != 0) {
        reply_error(conn, msg, DBUS_ERROR_INVALID_ARGS, "Unknown interface");
        return;
    }

    DBusMessage *reply = dbus_message_new_method_return(msg);
    if (!reply) {
        return;
    }

    DBusMessageIter iter;
    dbus_message_iter_init_append(reply, &iter);

    DBusMessageIter dict, entry;
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);
    dict_append_string(&dict, "Category", GetPropString("Category"));
    dict_append_string(&dict, "Id", GetPropString("Id"));
    dict_append_string(&dict, "Title", GetPropString("Title"));
    dict_append_string(&dict, "Status", GetPropString("Status"));
    dict_append_string(&dict, "IconName", GetPropString("IconName"));
    dict_append_bool(&dict, "ItemIsMenu", false);

    const char *key = "Menu";
    dbus_message_iter_open_container(&dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
    append_variant_path(&entry, kMenuPath);
    dbus_message_iter_close_container(&dict, &entry);

    dbus_message_iter_close_container(&iter, &dict);

    dbus_connection_send(conn, reply, nullptr);
    dbus_message_unref(reply);
}

// ─────────────────────────────────────
void TrayIcon::ReplyEmptyMethodReturn(DBusConnection *conn, DBusMessage *msg) {
    DBusMessage *reply = dbus_message_new_method_return(msg);
    if (!reply) {
        return;
    }
    dbus_connection_send(conn, reply, nullptr);
    dbus_message_unref(reply);
}
