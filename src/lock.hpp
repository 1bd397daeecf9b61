#pragma once

#include <filesystem>

enum LockState {
    LOCK_HELD = 0,
    LOCK_BUSY,        // another process holds it
    LOCK_UNAVAILABLE, // the lock file could not be opened or locked
};

// Advisory flock() on a file next to the data store. Released on destruction.
class InstanceLock {
  public:
    explicit InstanceLock(const std::filesystem::path &lockPath);
    ~InstanceLock();

    InstanceLock(const InstanceLock &) = delete;
    InstanceLock &operator=(const InstanceLock &) = delete;

    bool IsHeld() const {
        return m_State == LOCK_HELD;
    }
    LockState State() const {
        return m_State;
    }

  private:
    std::filesystem::path m_Path;
    int m_Fd = -1;
    LockState m_State = LOCK_UNAVAILABLE;
};
