#pragma once

#include <chrono>
#include <functional>

#include "common.hpp"
#include "config.hpp"
#include "progress.hpp"
#include "xp.hpp"

#define LONG_BREAK_EVERY 4

struct SessionReport {
    SessionOutcome outcome;
    int workXP = 0;
    int overtimeXP = 0;
    SessionRecord record;
    SessionPhase nextPhase = BREAK;
    std::chrono::milliseconds breakDuration{0};
};

// Callbacks fire on transitions only, never per tick.
class SessionObserver {
  public:
    virtual ~SessionObserver() = default;

    virtual void OnPhaseStarted(SessionPhase, std::chrono::milliseconds) {}
    virtual void OnSessionCompleted(const SessionReport &) {}
    virtual void OnBreakSkipped(int, const XpAward &) {}
    virtual void OnTerminated(TerminationReason) {}
};

class SessionEngine {
  public:
    using WallClock = std::function<std::chrono::system_clock::time_point()>;

    SessionEngine(ProgressStore &store, const SessionTimes &times, const GameBalance &balance,
                  SessionObserver *observer = nullptr, WallClock wallClock = nullptr);

    // Only valid while TERMINATED. Returns false otherwise.
    bool Start();
    bool Start(std::chrono::milliseconds work);

    void Tick(std::chrono::milliseconds interval);
    void HandleKey(char key);

    void TogglePause();
    void Skip();
    void BreakFlow();
    void Quit();

    SessionPhase GetPhase() const {
        return m_Phase;
    }
    bool IsPaused() const {
        return m_Paused;
    }
    bool PausedThisSession() const {
        return m_PausedThisSession;
    }
    std::chrono::milliseconds Elapsed() const {
        return m_Elapsed;
    }
    std::chrono::milliseconds Planned() const {
        return m_Planned;
    }
    TerminationReason LastTermination() const {
        return m_LastTermination;
    }
    SessionSnapshot Snapshot() const;

  private:
    void ChangePhase(SessionPhase phase, std::chrono::milliseconds planned);
    void EnterFlow();
    void CompleteWork(std::chrono::milliseconds worked, std::chrono::milliseconds overtime);
    void SkipBreak();
    void Terminate(TerminationReason reason);

  private:
    ProgressStore &m_Store;
    SessionTimes m_Times;
    XpCalculator m_Xp;
    SessionObserver *m_Observer;
    WallClock m_WallClock;

    SessionPhase m_Phase{TERMINATED};
    std::chrono::milliseconds m_Planned{0};
    std::chrono::milliseconds m_Elapsed{0};
    // Work duration the session started with, kept through FLOW for the base XP.
    std::chrono::milliseconds m_PlannedWork{0};
    bool m_Paused{false};
    bool m_PausedThisSession{false};
    TerminationReason m_LastTermination{END_NONE};
};
