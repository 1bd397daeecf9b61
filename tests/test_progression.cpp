#include <cassert>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <set>
#include <string>

#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include "bounty.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "json.hpp"
#include "progress.hpp"
#include "status.hpp"
#include "timeutils.hpp"
#include "xp.hpp"

namespace {

std::filesystem::path temp_dir(const std::string &name) {
    const auto root = std::filesystem::temp_directory_path() / "hyprpomo-tests" / name;
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    std::filesystem::create_directories(root, ec);
    return root;
}

std::chrono::system_clock::time_point local_time(int hour, int minute = 0) {
    std::tm tm{};
    tm.tm_year = 2026 - 1900;
    tm.tm_mon = 9;
    tm.tm_mday = 19;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

std::string read_file(const std::filesystem::path &path) {
    std::ifstream in(path);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

SessionOutcome outcome_at(int hour, std::chrono::minutes worked, bool paused) {
    SessionOutcome o;
    o.workMinutes = static_cast<int>(worked.count());
    o.totalWorked = worked;
    o.pausedThisSession = paused;
    o.finishedAt = local_time(hour);
    return o;
}

Bounty bounty_of(BountyKind kind) {
    Bounty b;
    b.kind = kind;
    b.rewardXP = BountyBoard::Definition(kind).rewardXP;
    return b;
}

void test_xp_values() {
    XpCalculator xp;
    assert(xp.WorkXP(25) == 250);
    assert(xp.OvertimeXP(10) == 200);
    assert(xp.BreakSkipXP(3) == 15);
    assert(xp.WorkXP(0) == 0);
    assert(xp.BreakSkipXP(-2) == 0);

    GameBalance odd;
    odd.overtimeMultiplier = 1.5;
    odd.xpPerMinute = 3;
    XpCalculator custom(odd);
    assert(custom.OvertimeXP(3) == 13);

    assert(XpCalculator::WholeMinutes(std::chrono::seconds(179)) == 2);
    assert(XpCalculator::WholeMinutes(std::chrono::milliseconds(-5)) == 0);

    assert(XpCalculator::LevelForXP(0) == 1);
    assert(XpCalculator::LevelForXP(499) == 1);
    assert(XpCalculator::LevelForXP(500) == 2);
    assert(XpCalculator::LevelForXP(1499) == 3);
    assert(XpCalculator::XpIntoLevel(1120) == 120);
}

void test_xp_saturates() {
    const int max = std::numeric_limits<int>::max();
    XpCalculator xp;
    assert(xp.BreakSkipXP(500000000) == max);
    assert(xp.WorkXP(max) == max);

    GameBalance steep;
    steep.overtimeMultiplier = 1e12;
    assert(XpCalculator(steep).OvertimeXP(10) == max);

    assert(XpCalculator::WholeMinutes(std::chrono::hours(1LL << 40)) == max);

    const auto dir = temp_dir("saturate");
    ProgressStore store(dir / "data.sqlite");
    store.AwardXP(max - 100);
    XpAward award = store.AwardXP(1000);
    assert(award.amount == 100);
    assert(store.Profile().totalXP == max);
    assert(store.Profile().level == 1 + max / XpCalculator::kXpPerLevel);
    assert(store.AwardXP(5).amount == 0);
    assert(store.Profile().totalXP == max);
}

void test_duration_parsing() {
    assert(ParseDuration("90s") == std::chrono::seconds(90));
    assert(ParseDuration("45m") == std::chrono::minutes(45));
    assert(ParseDuration("1h") == std::chrono::hours(1));
    assert(ParseDuration("2H") == std::chrono::hours(2));
    assert(ParseDuration("25") == std::chrono::minutes(25));
    assert(ParseDuration("24h") == std::chrono::hours(24));
    assert(ParseDuration("1440") == std::chrono::hours(24));
    assert(ParseDuration("86400s") == std::chrono::hours(24));

    for (const char *bad : {"", "0", "0m", "5x", "10mm", "m5", "99999999999", "25h", "1441m",
                            "86401s", "500000000m"}) {
        bool threw = false;
        try {
            ParseDuration(bad);
        } catch (const DurationParseError &) {
            threw = true;
        }
        assert(threw);
    }

    assert(LooksLikeDuration("45m"));
    assert(!LooksLikeDuration("write"));
    assert(!LooksLikeDuration(""));

    assert(FormatClock(std::chrono::seconds(90)) == "01:30");
    assert(FormatClock(std::chrono::minutes(90)) == "90:00");
    assert(FormatClock(std::chrono::seconds(-3)) == "00:00");
}

void test_bounty_refresh() {
    BountyBoard board(7);
    UserProfile profile;

    assert(board.Refresh(profile, "2026-10-19"));
    assert(profile.bounties.size() == BOUNTIES_PER_DAY);
    std::set<int> kinds;
    for (const auto &b : profile.bounties) {
        kinds.insert(b.kind);
        assert(b.rewardXP == BountyBoard::Definition(b.kind).rewardXP);
        assert(!b.completed);
    }
    assert(kinds.size() == BOUNTIES_PER_DAY);

    // Same day: untouched.
    profile.bounties[0].completed = true;
    profile.sessionsToday = 3;
    const auto before = profile;
    assert(!board.Refresh(profile, "2026-10-19"));
    assert(profile == before);

    // Rollover resets progress, completion and the day counter.
    assert(board.Refresh(profile, "2026-10-20"));
    assert(profile.bountyDate == "2026-10-20");
    assert(profile.sessionsToday == 0);
    for (const auto &b : profile.bounties) {
        assert(!b.completed);
        assert(b.progress == 0);
    }
}

void test_bounty_evaluation() {
    BountyBoard board(1);

    std::vector<Bounty> marathon{bounty_of(MARATHON)};
    for (int i = 0; i < 3; i++) {
        assert(board.Evaluate(marathon, outcome_at(12, std::chrono::minutes(25), false)).empty());
    }
    auto done = board.Evaluate(marathon, outcome_at(12, std::chrono::minutes(25), false));
    assert(done.size() == 1);
    assert(marathon[0].completed);
    assert(marathon[0].progress == MARATHON_TARGET);
    // Completed bounties are not re-awarded or advanced.
    assert(board.Evaluate(marathon, outcome_at(12, std::chrono::minutes(25), false)).empty());
    assert(marathon[0].progress == MARATHON_TARGET);

    std::vector<Bounty> deep{bounty_of(DEEP_DIVE)};
    assert(board.Evaluate(deep, outcome_at(12, std::chrono::minutes(45), false)).empty());
    assert(board.Evaluate(deep, outcome_at(12, std::chrono::minutes(46), false)).size() == 1);

    std::vector<Bounty> early{bounty_of(EARLY_BIRD)};
    assert(board.Evaluate(early, outcome_at(9, std::chrono::minutes(25), false)).empty());
    assert(board.Evaluate(early, outcome_at(8, std::chrono::minutes(25), false)).size() == 1);

    std::vector<Bounty> owl{bounty_of(NIGHT_OWL)};
    assert(board.Evaluate(owl, outcome_at(19, std::chrono::minutes(25), false)).empty());
    assert(board.Evaluate(owl, outcome_at(20, std::chrono::minutes(25), false)).size() == 1);

    std::vector<Bounty> iron{bounty_of(IRON_WILL)};
    assert(board.Evaluate(iron, outcome_at(12, std::chrono::minutes(25), true)).empty());
    assert(!iron[0].completed);
    assert(board.Evaluate(iron, outcome_at(12, std::chrono::minutes(25), false)).size() == 1);

    assert(BountyBoard::KindFromId("deep_dive") == DEEP_DIVE);
    assert(!BountyBoard::KindFromId("speedrun").has_value());
}

void test_level_invariant() {
    const auto dir = temp_dir("levels");
    ProgressStore store(dir / "data.sqlite", std::make_unique<BountyBoard>(3));

    for (int amount : {120, 380, 1, 999, 0, 4500, 37}) {
        XpAward award = store.AwardXP(amount);
        const UserProfile &p = store.Profile();
        assert(award.totalXP == p.totalXP);
        assert(p.level == 1 + p.totalXP / 500);
        assert(award.levelAfter == p.level);
    }
    assert(store.Profile().totalXP == 6037);

    XpAward none = store.AwardXP(-50);
    assert(none.amount == 0);
    assert(store.Profile().totalXP == 6037);
}

void test_store_round_trip() {
    const auto dir = temp_dir("roundtrip");
    const auto path = dir / "data.sqlite";

    UserProfile saved;
    {
        ProgressStore store(path, std::make_unique<BountyBoard>(11));
        assert(store.RefreshBounties("2026-10-19"));
        assert(store.AddTask("Write report") == 1);
        assert(store.AddTask("  Review PR  ") == 2);
        store.CompleteTask(1);

        SessionRecord rec =
            store.RecordSession(outcome_at(12, std::chrono::minutes(25), false), 250);
        assert(rec.sessionXP == 250);
        assert(rec.sessionsToday == 1);
        assert(store.LastError().empty());
        saved = store.Profile();
    }

    ProgressStore reopened(path, std::make_unique<BountyBoard>(99));
    assert(!reopened.RecoveredFromCorruption());
    assert(reopened.Profile() == saved);
    assert(reopened.Profile().tasks[1].name == "Review PR");
    assert(reopened.Profile().stats.sessionsCompleted == 1);
    assert(reopened.Profile().stats.focusMinutes == 25);
    // Same date: the reopened store keeps the persisted set and counter.
    assert(!reopened.RefreshBounties("2026-10-19"));
    assert(reopened.Profile().sessionsToday == 1);
}

void test_level_reconciled_on_load() {
    const auto dir = temp_dir("reconcile");
    const auto path = dir / "data.sqlite";
    {
        ProgressStore store(path);
        store.AwardXP(1200);
        assert(store.Profile().level == 3);
    }

    sqlite3 *db = nullptr;
    assert(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    assert(sqlite3_exec(db, "UPDATE profile SET level = 9", nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(db);

    ProgressStore reopened(path);
    assert(!reopened.RecoveredFromCorruption());
    assert(reopened.Profile().totalXP == 1200);
    assert(reopened.Profile().level == 3);
}

void test_day_counter_rolls_over() {
    const auto dir = temp_dir("daycounter");
    ProgressStore store(dir / "data.sqlite", std::make_unique<BountyBoard>(4));
    for (int i = 1; i <= 3; i++) {
        SessionRecord rec = store.RecordSession(outcome_at(23, std::chrono::minutes(25), false), 0);
        assert(rec.sessionsToday == i);
    }
    assert(store.Profile().bountyDate == "2026-10-19");

    SessionOutcome next = outcome_at(12, std::chrono::minutes(25), false);
    next.finishedAt += std::chrono::hours(24);
    SessionRecord rec = store.RecordSession(next, 0);
    assert(rec.sessionsToday == 1);
    assert(store.Profile().bountyDate == "2026-10-20");
    assert(store.Profile().stats.sessionsCompleted == 4);
}

void test_tasks() {
    const auto dir = temp_dir("tasks");
    const auto path = dir / "data.sqlite";
    {
        ProgressStore store(path);
        assert(store.AddTask("a") == 1);
        assert(store.AddTask("b") == 2);
        assert(store.AddTask("c") == 3);
        store.CompleteTask(3);
        assert(store.PendingTasks().size() == 2);

        const UserProfile before = store.Profile();
        bool threw = false;
        try {
            store.CompleteTask(42);
        } catch (const InvalidCommandError &) {
            threw = true;
        }
        assert(threw);
        assert(store.Profile() == before);

        threw = false;
        try {
            store.CompleteTask(3);
        } catch (const InvalidCommandError &) {
            threw = true;
        }
        assert(threw);

        threw = false;
        try {
            store.AddTask("   ");
        } catch (const InvalidCommandError &) {
            threw = true;
        }
        assert(threw);
        assert(store.Profile() == before);
    }

    // Done tasks are retained, so ids keep counting past them.
    ProgressStore store(path);
    assert(store.Profile().tasks.size() == 3);
    assert(store.AddTask("d") == 4);
}

void test_corrupt_store_is_backed_up() {
    const auto dir = temp_dir("corrupt");
    const auto path = dir / "data.sqlite";
    {
        std::ofstream out(path, std::ios::binary);
        for (int i = 0; i < 256; i++) {
            out << "definitely not sqlite ";
        }
    }

    ProgressStore store(path);
    assert(store.RecoveredFromCorruption());
    assert(store.Profile().totalXP == 0);
    assert(store.Profile().level == 1);

    int backups = 0;
    for (const auto &entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().filename().string().rfind("data.sqlite.corrupt-", 0) == 0) {
            backups++;
        }
    }
    assert(backups == 1);

    store.AwardXP(10);
    assert(store.LastError().empty());
}

void test_config_defaults_and_fallbacks() {
    const auto dir = temp_dir("config");
    const auto path = dir / "hyprpomo" / "config.json";

    {
        Config cfg(path);
        assert(std::filesystem::exists(path));
        assert(cfg.Times().work == std::chrono::minutes(25));
        assert(cfg.Times().shortBreak == std::chrono::minutes(5));
        assert(cfg.Times().longBreak == std::chrono::minutes(15));
        assert(cfg.Balance().xpPerMinute == 10);
        assert(cfg.Balance().overtimeMultiplier == 2.0);
        assert(cfg.Balance().breakSkipXpPerMin == 5);
    }

    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ not json";
    }
    {
        Config cfg(path);
        assert(cfg.Times().work == std::chrono::minutes(25));
        assert(cfg.Balance().xpPerMinute == 10);
    }

    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({"times": {"work": "50m", "short_break": 10, "long_break": "soon"},
                   "game_balance": {"xp_per_minute": 20, "break_skip_xp_per_min": -4},
                   "colors": "red",
                   "extra": {"kept": true}})";
    }
    {
        Config cfg(path);
        assert(cfg.Times().work == std::chrono::minutes(50));
        assert(cfg.Times().shortBreak == std::chrono::minutes(10));
        assert(cfg.Times().longBreak == std::chrono::minutes(15));
        assert(cfg.Balance().xpPerMinute == 20);
        assert(cfg.Balance().overtimeMultiplier == 2.0);
        assert(cfg.Balance().breakSkipXpPerMin == 5);
        assert(cfg.Document().at("colors").is_object());
        assert(cfg.Document().at("extra").at("kept") == true);
    }
}

void test_json_merge() {
    JsonParse parse;
    const nlohmann::json base = {{"a", {{"x", 1}, {"y", "two"}}}, {"b", 3}};
    const nlohmann::json over = {{"a", {{"x", 5}, {"z", 9}}}, {"b", {{"nested", 1}}}};
    const nlohmann::json merged = parse.MergeObjects(base, over);

    assert(merged["a"]["x"] == 5);
    assert(merged["a"]["y"] == "two");
    assert(merged["a"]["z"] == 9);
    assert(merged["b"] == 3);

    assert(parse.GetInt(merged, "b", 0) == 3);
    assert(parse.GetInt(merged, "missing", 7) == 7);
    assert(parse.GetString(merged, "b", "fallback") == "fallback");
    assert(parse.GetObject(merged, "b").empty());
}

void test_status_lines() {
    using std::chrono::milliseconds;
    using std::chrono::minutes;
    using std::chrono::seconds;

    SessionSnapshot s;
    assert(StatusPublisher::Format(s) == "");

    s.phase = WORK;
    s.planned = minutes(25);
    s.elapsed = seconds(1);
    assert(StatusPublisher::Format(s) == "WORK 24:59");
    s.elapsed = milliseconds(500);
    assert(StatusPublisher::Format(s) == "WORK 24:59");
    s.paused = true;
    assert(StatusPublisher::Format(s) == "PAUSED WORK 24:59");
    s.paused = false;

    s.phase = BREAK;
    s.planned = minutes(5);
    s.elapsed = seconds(1);
    assert(StatusPublisher::Format(s) == "BREAK 04:59");

    s.phase = LONG_BREAK;
    s.planned = minutes(15);
    assert(StatusPublisher::Format(s) == "LONG BREAK 14:59");

    s.phase = FLOW;
    s.planned = milliseconds(0);
    s.elapsed = seconds(90);
    assert(StatusPublisher::Format(s) == "FLOW +01:30");

    s.phase = WORK;
    s.planned = minutes(90);
    s.elapsed = milliseconds(0);
    assert(StatusPublisher::Format(s) == "WORK 90:00");

    const auto dir = temp_dir("status");
    StatusPublisher publisher(dir / "hypr_pomo_status");
    publisher.Publish(s);
    assert(read_file(dir / "hypr_pomo_status") == "WORK 90:00");
    publisher.Clear();
    assert(read_file(dir / "hypr_pomo_status").empty());
}

} // namespace

int main() {
    spdlog::set_level(spdlog::level::off);

    test_xp_values();
    test_xp_saturates();
    test_duration_parsing();
    test_bounty_refresh();
    test_bounty_evaluation();
    test_level_invariant();
    test_store_round_trip();
    test_level_reconciled_on_load();
    test_day_counter_rolls_over();
    test_tasks();
    test_corrupt_store_is_backed_up();
    test_config_defaults_and_fallbacks();
    test_json_merge();
    test_status_lines();

    std::cout << "hyprpomo progression tests passed\n";
    return 0;
}
