#include "sqlite.hpp"
#include "bounty.hpp"
#include "errors.hpp"

#include <ctime>
#include <stdexcept>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
SQLite::SQLite(const std::string &db_path) : m_Db(nullptr), m_DbPath(db_path) {
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    if (sqlite3_open_v2(m_DbPath.c_str(), &m_Db, flags, nullptr) != SQLITE_OK) {
        spdlog::error("unable to open database: {}", m_DbPath);
        Close();
        throw std::runtime_error("unable to open database " + m_DbPath);
    }

    spdlog::debug("SQLite database opened: {}", m_DbPath);

    try {
        CheckIntegrity();
    } catch (...) {
        Close();
        throw;
    }

    sqlite3_busy_timeout(m_Db, 2000);
    ExecIgnoringErrors("PRAGMA journal_mode=WAL");
    // Every save must survive power loss, so no NORMAL here.
    ExecIgnoringErrors("PRAGMA synchronous=FULL");
    ExecIgnoringErrors("PRAGMA temp_store=FILE");

    Init();
    PrepareStatements();
}

// ─────────────────────────────────────
SQLite::~SQLite() {
    Close();
}

// ─────────────────────────────────────
void SQLite::Close() {
    if (m_UpsertProfileStmt) {
        sqlite3_finalize(m_UpsertProfileStmt);
        m_UpsertProfileStmt = nullptr;
    }
    if (m_InsertTaskStmt) {
        sqlite3_finalize(m_InsertTaskStmt);
        m_InsertTaskStmt = nullptr;
    }
    if (m_InsertBountyStmt) {
        sqlite3_finalize(m_InsertBountyStmt);
        m_InsertBountyStmt = nullptr;
    }
    if (m_Db) {
        sqlite3_close(m_Db);
        m_Db = nullptr;
    }
}

// ─────────────────────────────────────
void SQLite::CheckIntegrity() {
    sqlite3_stmt *stmt = nullptr;
    const int rc = sqlite3_prepare_v2(m_Db, "PRAGMA quick_check", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        const std::string msg = sqlite3_errmsg(m_Db);
        spdlog::error("integrity check failed for {}: {}", m_DbPath, msg);
        if (stmt) {
            sqlite3_finalize(stmt);
        }
        throw StoreCorruptionError(msg);
    }

    std::string result;
    const int step = sqlite3_step(stmt);
    if (step == SQLITE_ROW) {
        const char *txt = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
        result = txt ? txt : "";
    } else {
        result = sqlite3_errmsg(m_Db);
    }
    sqlite3_finalize(stmt);

    if (result != "ok") {
        spdlog::error("integrity check failed for {}: {}", m_DbPath, result);
        throw StoreCorruptionError(result);
    }
}

// ─────────────────────────────────────
void SQLite::Init() {
    spdlog::debug("Initializing SQLite database tables");

    // Single row; level is a cache of 1 + total_xp / 500.
    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS profile ("
                       "id INTEGER PRIMARY KEY CHECK (id = 1),"
                       "total_xp INTEGER NOT NULL,"
                       "level INTEGER NOT NULL,"
                       "sessions_completed INTEGER NOT NULL,"
                       "focus_minutes INTEGER NOT NULL,"
                       "bounty_date TEXT NOT NULL,"
                       "sessions_today INTEGER NOT NULL,"
                       "updated_at REAL NOT NULL"
                       ")");

    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS tasks ("
                       "id INTEGER PRIMARY KEY,"
                       "position INTEGER NOT NULL,"
                       "name TEXT NOT NULL,"
                       "done INTEGER NOT NULL"
                       ")");

    // Rewards are not stored; they come from the bounty catalog.
    ExecIgnoringErrors("CREATE TABLE IF NOT EXISTS bounties ("
                       "slot INTEGER PRIMARY KEY,"
                       "kind TEXT NOT NULL,"
                       "progress INTEGER NOT NULL,"
                       "completed INTEGER NOT NULL"
                       ")");

    spdlog::debug("SQLite database tables initialized");
}

// ─────────────────────────────────────
void SQLite::PrepareStatements() {
    {
        const char *sql = R"(
            INSERT INTO profile
            (id, total_xp, level, sessions_completed, focus_minutes, bounty_date,
             sessions_today, updated_at)
            VALUES (1, ?, ?, ?, ?, ?, ?, ?)
            ON CONFLICT(id) DO UPDATE SET
                total_xp = excluded.total_xp,
                level = excluded.level,
                sessions_completed = excluded.sessions_completed,
                focus_minutes = excluded.focus_minutes,
                bounty_date = excluded.bounty_date,
                sessions_today = excluded.sessions_today,
                updated_at = excluded.updated_at
        )";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &m_UpsertProfileStmt, nullptr) != SQLITE_OK) {
            const std::string msg = sqlite3_errmsg(m_Db);
            spdlog::error("db prepare failed for UpsertProfile stmt: {}", msg);
            Close();
            throw StoreCorruptionError("unexpected profile schema: " + msg);
        }
    }

    {
        const char *sql = "INSERT INTO tasks (id, position, name, done) VALUES (?, ?, ?, ?)";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &m_InsertTaskStmt, nullptr) != SQLITE_OK) {
            const std::string msg = sqlite3_errmsg(m_Db);
            spdlog::error("db prepare failed for InsertTask stmt: {}", msg);
            Close();
            throw StoreCorruptionError("unexpected tasks schema: " + msg);
        }
    }

    {
        const char *sql =
            "INSERT INTO bounties (slot, kind, progress, completed) VALUES (?, ?, ?, ?)";
        if (sqlite3_prepare_v2(m_Db, sql, -1, &m_InsertBountyStmt, nullptr) != SQLITE_OK) {
            const std::string msg = sqlite3_errmsg(m_Db);
            spdlog::error("db prepare failed for InsertBounty stmt: {}", msg);
            Close();
            throw StoreCorruptionError("unexpected bounties schema: " + msg);
        }
    }
}

// ─────────────────────────────────────
void SQLite::ExecIgnoringErrors(const std::string &sql) {
    char *err = nullptr;
    if (sqlite3_exec(m_Db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        spdlog::warn("sqlite exec failed ({}): {}", sql, err ? err : "unknown");
    }
    if (err) {
        sqlite3_free(err);
    }
}

// ─────────────────────────────────────
bool SQLite::Exec(const std::string &sql, std::string &error) {
    char *err = nullptr;
    const int rc = sqlite3_exec(m_Db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        error = err ? err : sqlite3_errmsg(m_Db);
    }
    if (err) {
        sqlite3_free(err);
    }
    return rc == SQLITE_OK;
}

// ─────────────────────────────────────
UserProfile SQLite::LoadProfile() {
    UserProfile profile;

    sqlite3_stmt *stmt = nullptr;
    const char *sql = "SELECT total_xp, level, sessions_completed, focus_minutes, bounty_date, "
                      "sessions_today FROM profile WHERE id = 1";
    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in LoadProfile: {}", sqlite3_errmsg(m_Db));
        return profile;
    }

    if (sqlite3_step(stmt) == SQLITE_ROW) {
        profile.totalXP = sqlite3_column_int(stmt, 0);
        profile.level = sqlite3_column_int(stmt, 1);
        profile.stats.sessionsCompleted = sqlite3_column_int(stmt, 2);
        profile.stats.focusMinutes = sqlite3_column_int(stmt, 3);
        const char *dateTxt = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 4));
        profile.bountyDate = dateTxt ? dateTxt : "";
        profile.sessionsToday = sqlite3_column_int(stmt, 5);
    } else {
        spdlog::info("No stored profile yet, starting fresh");
    }
    sqlite3_finalize(stmt);

    LoadTasks(profile);
    LoadBounties(profile);
    return profile;
}

// ─────────────────────────────────────
void SQLite::LoadTasks(UserProfile &profile) {
    sqlite3_stmt *stmt = nullptr;
    const char *sql = "SELECT id, name, done FROM tasks ORDER BY position ASC";
    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in LoadTasks: {}", sqlite3_errmsg(m_Db));
        return;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        Task t;
        t.id = sqlite3_column_int(stmt, 0);
        const char *nameTxt = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 1));
        t.name = nameTxt ? nameTxt : "";
        t.done = sqlite3_column_int(stmt, 2) != 0;
        profile.tasks.push_back(std::move(t));
    }
    sqlite3_finalize(stmt);
}

// ─────────────────────────────────────
void SQLite::LoadBounties(UserProfile &profile) {
    sqlite3_stmt *stmt = nullptr;
    const char *sql = "SELECT kind, progress, completed FROM bounties ORDER BY slot ASC";
    if (sqlite3_prepare_v2(m_Db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed in LoadBounties: {}", sqlite3_errmsg(m_Db));
        return;
    }

    bool unknownKind = false;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char *kindTxt = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
        const auto kind = BountyBoard::KindFromId(kindTxt ? kindTxt : "");
        if (!kind) {
            spdlog::warn("Ignoring stored bounty of unknown kind '{}'", kindTxt ? kindTxt : "");
            unknownKind = true;
            continue;
        }

        Bounty b;
        b.kind = *kind;
        b.rewardXP = BountyBoard::Definition(*kind).rewardXP;
        b.progress = sqlite3_column_int(stmt, 1);
        b.completed = sqlite3_column_int(stmt, 2) != 0;
        profile.bounties.push_back(b);
    }
    sqlite3_finalize(stmt);

    if (unknownKind) {
        // Forces a fresh draw on the next refresh.
        profile.bountyDate.clear();
    }
}

// ─────────────────────────────────────
bool SQLite::WriteProfileRow(const UserProfile &profile, std::string &error) {
    sqlite3_reset(m_UpsertProfileStmt);
    sqlite3_clear_bindings(m_UpsertProfileStmt);

    sqlite3_bind_int(m_UpsertProfileStmt, 1, profile.totalXP);
    sqlite3_bind_int(m_UpsertProfileStmt, 2, profile.level);
    sqlite3_bind_int(m_UpsertProfileStmt, 3, profile.stats.sessionsCompleted);
    sqlite3_bind_int(m_UpsertProfileStmt, 4, profile.stats.focusMinutes);
    sqlite3_bind_text(m_UpsertProfileStmt, 5, profile.bountyDate.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(m_UpsertProfileStmt, 6, profile.sessionsToday);
    sqlite3_bind_double(m_UpsertProfileStmt, 7, static_cast<double>(std::time(nullptr)));

    if (sqlite3_step(m_UpsertProfileStmt) != SQLITE_DONE) {
        error = std::string("profile write failed: ") + sqlite3_errmsg(m_Db);
        return false;
    }
    return true;
}

// ─────────────────────────────────────
bool SQLite::WriteTasks(const UserProfile &profile, std::string &error) {
    if (!Exec("DELETE FROM tasks", error)) {
        return false;
    }

    int position = 0;
    for (const auto &t : profile.tasks) {
        sqlite3_reset(m_InsertTaskStmt);
        sqlite3_clear_bindings(m_InsertTaskStmt);
        sqlite3_bind_int(m_InsertTaskStmt, 1, t.id);
        sqlite3_bind_int(m_InsertTaskStmt, 2, position++);
        sqlite3_bind_text(m_InsertTaskStmt, 3, t.name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(m_InsertTaskStmt, 4, t.done ? 1 : 0);
        if (sqlite3_step(m_InsertTaskStmt) != SQLITE_DONE) {
            error = std::string("task write failed: ") + sqlite3_errmsg(m_Db);
            return false;
        }
    }
    return true;
}

// ─────────────────────────────────────
bool SQLite::WriteBounties(const UserProfile &profile, std::string &error) {
    if (!Exec("DELETE FROM bounties", error)) {
        return false;
    }

    int slot = 0;
    for (const auto &b : profile.bounties) {
        const char *kindId = BountyBoard::Definition(b.kind).id;
        sqlite3_reset(m_InsertBountyStmt);
        sqlite3_clear_bindings(m_InsertBountyStmt);
        sqlite3_bind_int(m_InsertBountyStmt, 1, slot++);
        sqlite3_bind_text(m_InsertBountyStmt, 2, kindId, -1, SQLITE_STATIC);
        sqlite3_bind_int(m_InsertBountyStmt, 3, b.progress);
        sqlite3_bind_int(m_InsertBountyStmt, 4, b.completed ? 1 : 0);
        if (sqlite3_step(m_InsertBountyStmt) != SQLITE_DONE) {
            error = std::string("bounty write failed: ") + sqlite3_errmsg(m_Db);
            return false;
        }
    }
    return true;
}

// ─────────────────────────────────────
bool SQLite::SaveProfile(const UserProfile &profile, std::string &error) {
    error.clear();
    if (!m_Db) {
        error = "database is closed";
        return false;
    }

    if (!Exec("BEGIN IMMEDIATE", error)) {
        spdlog::error("SaveProfile could not begin transaction: {}", error);
        return false;
    }

    const bool ok =
        WriteProfileRow(profile, error) && WriteTasks(profile, error) && WriteBounties(profile, error);
    if (!ok) {
        spdlog::error("SaveProfile failed: {}", error);
        std::string rollbackError;
        if (!Exec("ROLLBACK", rollbackError)) {
            spdlog::error("SaveProfile rollback failed: {}", rollbackError);
        }
        return false;
    }

    if (!Exec("COMMIT", error)) {
        spdlog::error("SaveProfile commit failed: {}", error);
        std::string rollbackError;
        if (!Exec("ROLLBACK", rollbackError)) {
            spdlog::debug("SaveProfile rollback after failed commit: {}", rollbackError);
        }
        return false;
    }

    spdlog::debug("Profile saved: xp={}, tasks={}, bounties={}", profile.totalXP,
                  profile.tasks.size(), profile.bounties.size());
    return true;
}
