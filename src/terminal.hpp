#pragma once

#include <chrono>
#include <optional>

#include <termios.h>

// Puts stdin in non-canonical, no-echo mode for single-key controls and restores it on
// destruction. ISIG stays on so Ctrl-C still raises SIGINT.
class Terminal {
  public:
    Terminal();
    ~Terminal();
    Terminal(const Terminal &) = delete;
    Terminal &operator=(const Terminal &) = delete;

    // Waits at most timeout for a key. std::nullopt on timeout or when stdin is closed.
    std::optional<char> ReadKey(std::chrono::milliseconds timeout);
    bool AtEof() const {
        return m_Eof;
    }

    void Restore();

  private:
    termios m_Original{};
    bool m_Interactive = false;
    bool m_Active = false;
    bool m_Eof = false;
};
