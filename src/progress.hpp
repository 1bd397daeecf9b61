#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "bounty.hpp"
#include "common.hpp"
#include "sqlite.hpp"
#include "xp.hpp"

struct SessionRecord {
    int sessionXP = 0;
    int bountyXP = 0;
    int sessionsToday = 0;
    std::vector<Bounty> completedBounties;
    XpAward award;
};

// Owns the one UserProfile of this process. Every mutating call persists before returning;
// a failed write is logged and reported through LastError() but never thrown.
class ProgressStore {
  public:
    explicit ProgressStore(const std::filesystem::path &dbPath,
                           std::unique_ptr<BountyBoard> board = std::make_unique<BountyBoard>());

    // $XDG_DATA_HOME/hyprpomo/data.sqlite or ~/.local/share/hyprpomo/data.sqlite
    static std::filesystem::path DefaultPath();

    const UserProfile &Profile() const {
        return m_Profile;
    }

    bool RefreshBounties(const std::string &today);
    XpAward AwardXP(int amount);
    SessionRecord RecordSession(const SessionOutcome &outcome, int sessionXP);

    int AddTask(const std::string &name);
    void CompleteTask(int id);
    std::vector<Task> PendingTasks() const;

    bool Save();
    const std::string &LastError() const {
        return m_LastError;
    }
    bool RecoveredFromCorruption() const {
        return m_Recovered;
    }
    const std::filesystem::path &Path() const {
        return m_DbPath;
    }

  private:
    void Open();
    void BackupCorruptFile();
    void Reconcile();
    XpAward AddXP(long long amount);

  private:
    std::filesystem::path m_DbPath;
    std::unique_ptr<SQLite> m_SQLite;
    std::unique_ptr<BountyBoard> m_Board;
    UserProfile m_Profile;
    std::string m_LastError;
    bool m_Recovered = false;
};
