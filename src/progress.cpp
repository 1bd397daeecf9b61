#include "progress.hpp"
#include "errors.hpp"
#include "timeutils.hpp"

#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <limits>
#include <stdexcept>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
ProgressStore::ProgressStore(const std::filesystem::path &dbPath,
                             std::unique_ptr<BountyBoard> board)
    : m_DbPath(dbPath), m_Board(std::move(board)) {
    if (!m_Board) {
        m_Board = std::make_unique<BountyBoard>();
    }
    Open();
    m_Profile = m_SQLite->LoadProfile();
    Reconcile();
}

// ─────────────────────────────────────
std::filesystem::path ProgressStore::DefaultPath() {
    const char *xdgDataHome = std::getenv("XDG_DATA_HOME");
    std::filesystem::path baseDir;
    if (xdgDataHome && *xdgDataHome) {
        baseDir = xdgDataHome;
    } else {
        const char *home = std::getenv("HOME");
        if (!home || !*home) {
            throw std::runtime_error("HOME environment variable not set");
        }
        baseDir = std::filesystem::path(home) / ".local" / "share";
    }

    std::filesystem::path dbPath = baseDir / "hyprpomo" / "data.sqlite";
    std::error_code ec;
    std::filesystem::create_directories(dbPath.parent_path(), ec);
    if (ec) {
        throw std::runtime_error("cannot create " + dbPath.parent_path().string() + ": " +
                                 ec.message());
    }
    return dbPath;
}

// ─────────────────────────────────────
void ProgressStore::Open() {
    try {
        m_SQLite = std::make_unique<SQLite>(m_DbPath.string());
        return;
    } catch (const StoreCorruptionError &e) {
        spdlog::warn("Progress store {} is unreadable ({}); starting with a fresh profile",
                     m_DbPath.string(), e.what());
    }

    BackupCorruptFile();
    m_Recovered = true;
    m_SQLite = std::make_unique<SQLite>(m_DbPath.string());
}

// ─────────────────────────────────────
void ProgressStore::BackupCorruptFile() {
    const std::string suffix = ".corrupt-" + std::to_string(std::time(nullptr));
    const std::filesystem::path backup = m_DbPath.string() + suffix;

    std::error_code ec;
    std::filesystem::rename(m_DbPath, backup, ec);
    if (ec) {
        spdlog::error("Could not move {} aside: {}", m_DbPath.string(), ec.message());
        throw std::runtime_error("cannot back up corrupt store " + m_DbPath.string());
    }
    spdlog::warn("Unreadable progress store saved as {}", backup.string());

    // WAL side files belong to the old database.
    for (const char *side : {"-wal", "-shm"}) {
        const std::filesystem::path sidePath = m_DbPath.string() + side;
        if (!std::filesystem::exists(sidePath, ec)) {
            continue;
        }
        std::filesystem::rename(sidePath, backup.string() + side, ec);
        if (ec) {
            spdlog::warn("Could not move {} aside: {}", sidePath.string(), ec.message());
        }
    }
}

// ─────────────────────────────────────
void ProgressStore::Reconcile() {
    if (m_Profile.totalXP < 0) {
        spdlog::warn("Stored XP {} is negative, resetting to 0", m_Profile.totalXP);
        m_Profile.totalXP = 0;
    }

    const int derived = XpCalculator::LevelForXP(m_Profile.totalXP);
    if (m_Profile.level != derived) {
        spdlog::warn("Stored level {} does not match {} XP, using level {}", m_Profile.level,
                     m_Profile.totalXP, derived);
        m_Profile.level = derived;
    }

    if (m_Profile.sessionsToday < 0) {
        m_Profile.sessionsToday = 0;
    }
    m_Profile.stats.sessionsCompleted = std::max(0, m_Profile.stats.sessionsCompleted);
    m_Profile.stats.focusMinutes = std::max(0, m_Profile.stats.focusMinutes);
}

// ─────────────────────────────────────
bool ProgressStore::Save() {
    std::string error;
    if (!m_SQLite->SaveProfile(m_Profile, error)) {
        m_LastError = error;
        spdlog::error("Progress not saved: {}", error);
        return false;
    }
    m_LastError.clear();
    return true;
}

// ─────────────────────────────────────
bool ProgressStore::RefreshBounties(const std::string &today) {
    if (!m_Board->Refresh(m_Profile, today)) {
        return false;
    }
    Save();
    return true;
}

// ─────────────────────────────────────
XpAward ProgressStore::AddXP(long long amount) {
    XpAward award;
    award.levelBefore = m_Profile.level;
    // totalXP saturates at INT_MAX.
    const long long room =
        std::numeric_limits<int>::max() - static_cast<long long>(m_Profile.totalXP);
    award.amount = static_cast<int>(std::clamp(amount, 0LL, room));

    m_Profile.totalXP += award.amount;
    m_Profile.level = XpCalculator::LevelForXP(m_Profile.totalXP);

    award.totalXP = m_Profile.totalXP;
    award.levelAfter = m_Profile.level;
    if (award.LeveledUp()) {
        spdlog::info("Level up: {} -> {}", award.levelBefore, award.levelAfter);
    }
    return award;
}

// ─────────────────────────────────────
XpAward ProgressStore::AwardXP(int amount) {
    XpAward award = AddXP(amount);
    if (award.amount > 0) {
        Save();
    }
    return award;
}

// ─────────────────────────────────────
SessionRecord ProgressStore::RecordSession(const SessionOutcome &outcome, int sessionXP) {
    // A session that runs past midnight counts for the day it finished on.
    m_Board->Refresh(m_Profile, LocalDate(outcome.finishedAt));

    SessionRecord record;
    m_Profile.stats.sessionsCompleted += 1;
    m_Profile.stats.focusMinutes += outcome.workMinutes + outcome.overtimeMinutes;
    m_Profile.sessionsToday += 1;
    record.sessionsToday = m_Profile.sessionsToday;

    record.completedBounties = m_Board->Evaluate(m_Profile.bounties, outcome);
    for (const auto &b : record.completedBounties) {
        record.bountyXP += b.rewardXP;
    }

    record.sessionXP = std::max(0, sessionXP);
    record.award = AddXP(static_cast<long long>(record.sessionXP) + record.bountyXP);

    spdlog::info("Session recorded: {}m work, {}m flow, +{} XP ({} from bounties), {} today",
                 outcome.workMinutes, outcome.overtimeMinutes, record.award.amount,
                 record.bountyXP, record.sessionsToday);
    Save();
    return record;
}

// ─────────────────────────────────────
int ProgressStore::AddTask(const std::string &name) {
    const auto first = name.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        throw InvalidCommandError("task name must not be empty");
    }
    const auto last = name.find_last_not_of(" \t\r\n");

    int nextId = 1;
    for (const auto &t : m_Profile.tasks) {
        nextId = std::max(nextId, t.id + 1);
    }

    Task t;
    t.id = nextId;
    t.name = name.substr(first, last - first + 1);
    t.done = false;
    m_Profile.tasks.push_back(t);

    spdlog::info("Task {} added: {}", t.id, t.name);
    Save();
    return t.id;
}

// ─────────────────────────────────────
void ProgressStore::CompleteTask(int id) {
    auto it = std::find_if(m_Profile.tasks.begin(), m_Profile.tasks.end(),
                           [id](const Task &t) { return t.id == id; });
    if (it == m_Profile.tasks.end()) {
        throw InvalidCommandError("task " + std::to_string(id) + " not found");
    }
    if (it->done) {
        throw InvalidCommandError("task " + std::to_string(id) + " is already done");
    }

    it->done = true;
    spdlog::info("Task {} completed: {}", it->id, it->name);
    Save();
}

// ─────────────────────────────────────
std::vector<Task> ProgressStore::PendingTasks() const {
    std::vector<Task> pending;
    for (const auto &t : m_Profile.tasks) {
        if (!t.done) {
            pending.push_back(t);
        }
    }
    return pending;
}
