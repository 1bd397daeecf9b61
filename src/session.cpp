#include "session.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <utility>

#include <spdlog/spdlog.h>

namespace {
const char *PhaseName(SessionPhase phase) {
    switch (phase) {
    case WORK:
        return "work";
    case BREAK:
        return "break";
    case LONG_BREAK:
        return "long break";
    case FLOW:
        return "flow";
    case TERMINATED:
        return "terminated";
    }
    return "unknown";
}
} // namespace

// ─────────────────────────────────────
SessionEngine::SessionEngine(ProgressStore &store, const SessionTimes &times,
                             const GameBalance &balance, SessionObserver *observer,
                             WallClock wallClock)
    : m_Store(store), m_Times(times), m_Xp(balance), m_Observer(observer),
      m_WallClock(std::move(wallClock)) {
    if (!m_WallClock) {
        m_WallClock = [] { return std::chrono::system_clock::now(); };
    }
}

// ─────────────────────────────────────
bool SessionEngine::Start() {
    return Start(std::chrono::duration_cast<std::chrono::milliseconds>(m_Times.work));
}

// ─────────────────────────────────────
bool SessionEngine::Start(std::chrono::milliseconds work) {
    if (m_Phase != TERMINATED) {
        spdlog::debug("Start ignored, session already in {}", PhaseName(m_Phase));
        return false;
    }
    if (work.count() <= 0) {
        work = std::chrono::duration_cast<std::chrono::milliseconds>(m_Times.work);
    }

    m_PlannedWork = work;
    m_PausedThisSession = false;
    m_LastTermination = END_NONE;
    ChangePhase(WORK, work);
    return true;
}

// ─────────────────────────────────────
void SessionEngine::ChangePhase(SessionPhase phase, std::chrono::milliseconds planned) {
    spdlog::debug("Phase {} -> {} (planned {} ms)", PhaseName(m_Phase), PhaseName(phase),
                  planned.count());
    m_Phase = phase;
    m_Planned = planned;
    m_Elapsed = std::chrono::milliseconds(0);
    m_Paused = false;

    if (m_Observer && phase != TERMINATED) {
        m_Observer->OnPhaseStarted(phase, planned);
    }
}

// ─────────────────────────────────────
SessionSnapshot SessionEngine::Snapshot() const {
    SessionSnapshot s;
    s.phase = m_Phase;
    s.planned = m_Planned;
    s.elapsed = m_Elapsed;
    s.paused = m_Paused;
    return s;
}

// ─────────────────────────────────────
void SessionEngine::Tick(std::chrono::milliseconds interval) {
    if (m_Phase == TERMINATED || m_Paused || interval.count() <= 0) {
        return;
    }

    m_Elapsed += interval;

    switch (m_Phase) {
    case WORK:
        if (m_Elapsed >= m_Planned) {
            EnterFlow();
        }
        break;
    case BREAK:
    case LONG_BREAK:
        if (m_Elapsed >= m_Planned) {
            spdlog::info("Break finished");
            Terminate(END_BREAK_FINISHED);
        }
        break;
    case FLOW:
    case TERMINATED:
        break;
    }
}

// ─────────────────────────────────────
void SessionEngine::HandleKey(char key) {
    switch (std::tolower(static_cast<unsigned char>(key))) {
    case 'p':
        TogglePause();
        break;
    case 's':
        Skip();
        break;
    case 'b':
        BreakFlow();
        break;
    case 'q':
        Quit();
        break;
    default:
        spdlog::debug("Ignoring key 0x{:02x}", static_cast<unsigned char>(key));
        break;
    }
}

// ─────────────────────────────────────
void SessionEngine::TogglePause() {
    if (m_Phase == TERMINATED) {
        return;
    }
    m_Paused = !m_Paused;
    if (m_Paused) {
        m_PausedThisSession = true;
    }
    spdlog::info("{} {}", m_Paused ? "Paused" : "Resumed", PhaseName(m_Phase));
}

// ─────────────────────────────────────
void SessionEngine::Skip() {
    switch (m_Phase) {
    case WORK:
        CompleteWork(m_Elapsed, std::chrono::milliseconds(0));
        break;
    case FLOW:
        CompleteWork(m_PlannedWork, m_Elapsed);
        break;
    case BREAK:
    case LONG_BREAK:
        SkipBreak();
        break;
    case TERMINATED:
        break;
    }
}

// ─────────────────────────────────────
void SessionEngine::BreakFlow() {
    if (m_Phase != FLOW) {
        spdlog::debug("Break-flow ignored in {}", PhaseName(m_Phase));
        return;
    }
    CompleteWork(m_PlannedWork, m_Elapsed);
}

// ─────────────────────────────────────
void SessionEngine::Quit() {
    if (m_Phase == TERMINATED) {
        return;
    }
    spdlog::info("Session abandoned during {}", PhaseName(m_Phase));
    Terminate(END_QUIT);
}

// ─────────────────────────────────────
void SessionEngine::EnterFlow() {
    spdlog::info("Work countdown finished, entering flow");
    // Overtime counts from zero; m_PlannedWork still holds the base portion.
    ChangePhase(FLOW, std::chrono::milliseconds(0));
}

// ─────────────────────────────────────
void SessionEngine::CompleteWork(std::chrono::milliseconds worked,
                                 std::chrono::milliseconds overtime) {
    SessionReport report;
    report.outcome.workMinutes = XpCalculator::WholeMinutes(worked);
    report.outcome.overtimeMinutes = XpCalculator::WholeMinutes(overtime);
    report.outcome.totalWorked = std::chrono::duration_cast<std::chrono::seconds>(worked + overtime);
    report.outcome.pausedThisSession = m_PausedThisSession;
    report.outcome.finishedAt = m_WallClock();

    report.workXP = m_Xp.WorkXP(report.outcome.workMinutes);
    report.overtimeXP = m_Xp.OvertimeXP(report.outcome.overtimeMinutes);
    const long long sessionXP = static_cast<long long>(report.workXP) + report.overtimeXP;
    report.record = m_Store.RecordSession(
        report.outcome,
        static_cast<int>(std::min<long long>(sessionXP, std::numeric_limits<int>::max())));

    const bool isLong = report.record.sessionsToday % LONG_BREAK_EVERY == 0;
    const std::chrono::seconds base = isLong ? m_Times.longBreak : m_Times.shortBreak;
    // Flow time is added to the break 1:1.
    report.breakDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
        base + std::chrono::duration_cast<std::chrono::seconds>(overtime));
    report.nextPhase = isLong ? LONG_BREAK : BREAK;

    if (m_Observer) {
        m_Observer->OnSessionCompleted(report);
    }
    ChangePhase(report.nextPhase, report.breakDuration);
}

// ─────────────────────────────────────
void SessionEngine::SkipBreak() {
    auto remaining = m_Planned - m_Elapsed;
    if (remaining.count() < 0) {
        remaining = std::chrono::milliseconds(0);
    }

    const int remainingMinutes = XpCalculator::WholeMinutes(remaining);
    const int xp = m_Xp.BreakSkipXP(remainingMinutes);
    const XpAward award = m_Store.AwardXP(xp);
    spdlog::info("Break skipped with {}m left, +{} XP", remainingMinutes, award.amount);

    if (m_Observer) {
        m_Observer->OnBreakSkipped(remainingMinutes, award);
    }
    Terminate(END_BREAK_SKIPPED);
}

// ─────────────────────────────────────
void SessionEngine::Terminate(TerminationReason reason) {
    m_LastTermination = reason;
    ChangePhase(TERMINATED, std::chrono::milliseconds(0));
    if (m_Observer) {
        m_Observer->OnTerminated(reason);
    }
}
