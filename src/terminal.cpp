#include "terminal.hpp"

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
Terminal::Terminal() {
    m_Interactive = ::isatty(STDIN_FILENO) == 1;
    if (!m_Interactive) {
        spdlog::debug("stdin is not a terminal, key controls read line-buffered input");
        return;
    }
    if (tcgetattr(STDIN_FILENO, &m_Original) != 0) {
        spdlog::warn("tcgetattr failed: {}", std::strerror(errno));
        return;
    }

    termios raw = m_Original;
    raw.c_lflag &= static_cast<tcflag_t>(~(ICANON | ECHO));
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) == 0) {
        m_Active = true;
    } else {
        spdlog::warn("tcsetattr failed: {}", std::strerror(errno));
    }
}

// ─────────────────────────────────────
Terminal::~Terminal() {
    Restore();
}

// ─────────────────────────────────────
void Terminal::Restore() {
    if (m_Active) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &m_Original);
        m_Active = false;
    }
}

// ─────────────────────────────────────
std::optional<char> Terminal::ReadKey(std::chrono::milliseconds timeout) {
    if (m_Eof) {
        return std::nullopt;
    }

    pollfd pfd{};
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc < 0) {
        if (errno != EINTR) {
            spdlog::warn("poll on stdin failed: {}", std::strerror(errno));
        }
        return std::nullopt;
    }
    if (rc == 0) {
        return std::nullopt;
    }

    char c = 0;
    ssize_t n = ::read(STDIN_FILENO, &c, 1);
    if (n == 1) {
        return c;
    }
    if (n == 0 || (n < 0 && errno != EINTR && errno != EAGAIN)) {
        spdlog::debug("stdin closed, key controls disabled");
        m_Eof = true;
    }
    return std::nullopt;
}
