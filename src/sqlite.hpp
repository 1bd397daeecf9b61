#pragma once

#include <sqlite3.h>

#include <string>

#include "common.hpp"

class SQLite {
  public:
    // Throws StoreCorruptionError when the file is not a readable database.
    SQLite(const std::string &db_path);
    ~SQLite();

    SQLite(const SQLite &) = delete;
    SQLite &operator=(const SQLite &) = delete;

    UserProfile LoadProfile();

    // Replaces the stored profile in a single transaction.
    bool SaveProfile(const UserProfile &profile, std::string &error);

  private:
    void CheckIntegrity();
    void Init();
    void PrepareStatements();
    void Close();
    void ExecIgnoringErrors(const std::string &sql);
    bool Exec(const std::string &sql, std::string &error);

    void LoadTasks(UserProfile &profile);
    void LoadBounties(UserProfile &profile);
    bool WriteProfileRow(const UserProfile &profile, std::string &error);
    bool WriteTasks(const UserProfile &profile, std::string &error);
    bool WriteBounties(const UserProfile &profile, std::string &error);

  private:
    sqlite3 *m_Db;
    std::string m_DbPath;

    sqlite3_stmt *m_UpsertProfileStmt = nullptr;
    sqlite3_stmt *m_InsertTaskStmt = nullptr;
    sqlite3_stmt *m_InsertBountyStmt = nullptr;
};
