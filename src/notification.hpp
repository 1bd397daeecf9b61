#pragma once

#include <dbus/dbus.h>

#include <chrono>
#include <string>

// Desktop notifications over org.freedesktop.Notifications. Without a session bus every
// call is a logged no-op.
class Notification {
  public:
    Notification();
    ~Notification();
    Notification(const Notification &) = delete;
    Notification &operator=(const Notification &) = delete;

    // Urgent notifications ignore the rate limit.
    void SendNotification(const std::string &icon, const std::string &summary,
                          const std::string &msg, bool urgent = false);

    // Returns false while inside the rate-limit window. An admitted call restarts the window.
    bool Admit(std::chrono::system_clock::time_point now, bool urgent);

  private:
    DBusError m_Err;
    DBusConnection *m_Conn = nullptr;
    std::chrono::time_point<std::chrono::system_clock> m_LastNotification;
};
