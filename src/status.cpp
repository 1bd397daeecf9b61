#include "status.hpp"
#include "timeutils.hpp"

#include <fstream>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
StatusPublisher::StatusPublisher() : StatusPublisher(DefaultPath()) {}

// ─────────────────────────────────────
StatusPublisher::StatusPublisher(const std::filesystem::path &path) : m_Path(path) {}

// ─────────────────────────────────────
std::filesystem::path StatusPublisher::DefaultPath() {
    std::error_code ec;
    std::filesystem::path tmp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        tmp = "/tmp";
    }
    return tmp / "hypr_pomo_status";
}

// ─────────────────────────────────────
std::string StatusPublisher::Format(const SessionSnapshot &snapshot) {
    using std::chrono::duration_cast;
    using std::chrono::seconds;

    std::string line;
    switch (snapshot.phase) {
    case TERMINATED:
        return "";
    case FLOW:
        line = "FLOW +" + FormatClock(duration_cast<seconds>(snapshot.elapsed));
        break;
    case WORK:
    case BREAK:
    case LONG_BREAK: {
        auto remaining = snapshot.planned - snapshot.elapsed;
        if (remaining.count() < 0) {
            remaining = std::chrono::milliseconds(0);
        }
        const char *tag = snapshot.phase == WORK ? "WORK" : (snapshot.phase == BREAK ? "BREAK" : "LONG BREAK");
        line = std::string(tag) + " " + FormatClock(duration_cast<seconds>(remaining));
        break;
    }
    }

    if (snapshot.paused) {
        line = "PAUSED " + line;
    }
    return line;
}

// ─────────────────────────────────────
void StatusPublisher::Publish(const SessionSnapshot &snapshot) {
    const std::string line = Format(snapshot);
    if (line == m_LastLine) {
        return;
    }
    Write(line);
}

// ─────────────────────────────────────
void StatusPublisher::Clear() {
    Write("");
}

// ─────────────────────────────────────
void StatusPublisher::Write(const std::string &line) {
    std::ofstream file(m_Path, std::ios::trunc);
    if (!file.is_open() || !(file << line)) {
        if (!m_WriteFailed) {
            spdlog::warn("Cannot write status file {}", m_Path.string());
            m_WriteFailed = true;
        }
        return;
    }
    m_WriteFailed = false;
    m_LastLine = line;
}
