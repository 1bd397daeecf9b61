#include "lock.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

// ─────────────────────────────────────
InstanceLock::InstanceLock(const std::filesystem::path &lockPath) : m_Path(lockPath) {
    m_Fd = ::open(m_Path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (m_Fd < 0) {
        spdlog::warn("Could not open lock file {}: {}", m_Path.string(), strerror(errno));
        return;
    }

    if (flock(m_Fd, LOCK_EX | LOCK_NB) != 0) {
        if (errno == EWOULDBLOCK) {
            spdlog::debug("Lock {} is held by another instance", m_Path.string());
            m_State = LOCK_BUSY;
        } else {
            spdlog::warn("flock failed on {}: {}", m_Path.string(), strerror(errno));
        }
        close(m_Fd);
        m_Fd = -1;
        return;
    }

    m_State = LOCK_HELD;
    spdlog::debug("Acquired instance lock {}", m_Path.string());
}

// ─────────────────────────────────────
InstanceLock::~InstanceLock() {
    if (m_Fd >= 0) {
        flock(m_Fd, LOCK_UN);
        close(m_Fd);
        m_Fd = -1;
    }
}
