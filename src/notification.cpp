#include "notification.hpp"

#include <cstdint>

#include <spdlog/spdlog.h>

#define NOTIFICATION_MIN_INTERVAL_MS 3000
#define NOTIFICATION_TIMEOUT_MS 5000

// ─────────────────────────────────────
Notification::Notification() {
    dbus_error_init(&m_Err);
    m_Conn = dbus_bus_get(DBUS_BUS_SESSION, &m_Err);
    if (dbus_error_is_set(&m_Err) || !m_Conn) {
        spdlog::warn("Notifications disabled, no session bus: {}",
                     m_Err.message ? m_Err.message : "unknown error");
        dbus_error_free(&m_Err);
        m_Conn = nullptr;
        return;
    }
    // The process must survive the bus going away.
    dbus_connection_set_exit_on_disconnect(m_Conn, FALSE);
}

// ─────────────────────────────────────
Notification::~Notification() {
    if (m_Conn) {
        dbus_connection_flush(m_Conn);
        dbus_connection_unref(m_Conn);
        m_Conn = nullptr;
    }

    if (dbus_error_is_set(&m_Err)) {
        dbus_error_free(&m_Err);
    }
}

// ─────────────────────────────────────
bool Notification::Admit(std::chrono::system_clock::time_point now, bool urgent) {
    if (!urgent &&
        now - m_LastNotification < std::chrono::milliseconds(NOTIFICATION_MIN_INTERVAL_MS)) {
        return false;
    }
    m_LastNotification = now;
    return true;
}

// ─────────────────────────────────────
void Notification::SendNotification(const std::string &icon, const std::string &summary,
                                    const std::string &msg, bool urgent) {
    if (!m_Conn) {
        spdlog::debug("Notification skipped, not connected: {}", summary);
        return;
    }

    if (!Admit(std::chrono::system_clock::now(), urgent)) {
        spdlog::debug("Notification skipped: rate limit exceeded");
        return;
    }

    DBusMessage *msg_dbus = dbus_message_new_method_call("org.freedesktop.Notifications",
                                                         "/org/freedesktop/Notifications",
                                                         "org.freedesktop.Notifications", "Notify");
    if (!msg_dbus) {
        spdlog::error("Failed to create DBus message");
        return;
    }

    DBusMessageIter args;
    dbus_message_iter_init_append(msg_dbus, &args);

    const char *app_name = "HyprPomo";
    uint32_t replaces_id = 0;
    const char *icon_cstr = icon.c_str();
    const char *summary_cstr = summary.c_str();
    const char *body = msg.c_str();
    int32_t timeout = NOTIFICATION_TIMEOUT_MS;

    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &app_name);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_UINT32, &replaces_id);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &icon_cstr);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &summary_cstr);
    dbus_message_iter_append_basic(&args, DBUS_TYPE_STRING, &body);

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
        return;
    }
    dbus_connection_flush(m_Conn);

    dbus_message_unref(msg_dbus);
}
