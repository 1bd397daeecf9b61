#include <cassert>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "errors.hpp"
#include "hyprpomo.hpp"
#include "lock.hpp"
#include "notification.hpp"
#include "progress.hpp"
#include "session.hpp"

namespace {

std::filesystem::path temp_dir(const std::string &name) {
    const auto root = std::filesystem::temp_directory_path() / "hyprpomo-tests" / name;
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    std::filesystem::create_directories(root, ec);
    return root;
}

std::chrono::system_clock::time_point fixed_noon() {
    std::tm tm{};
    tm.tm_year = 2026 - 1900;
    tm.tm_mon = 9;
    tm.tm_mday = 19;
    tm.tm_hour = 12;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

template <typename Error, typename Fn> bool throws(Fn fn) {
    try {
        fn();
    } catch (const Error &) {
        return true;
    }
    return false;
}

void test_start_arguments() {
    StartOptions a = HyprPomo::ParseStartArgs({"45m", "Write", "report"});
    assert(a.work == std::chrono::minutes(45));
    assert(!a.shortBreak);
    assert(a.label == "Write report");

    StartOptions b = HyprPomo::ParseStartArgs({"50m", "10m", "20", "deep", "work"});
    assert(b.work == std::chrono::minutes(50));
    assert(b.shortBreak == std::chrono::minutes(10));
    assert(b.longBreak == std::chrono::minutes(20));
    assert(b.label == "deep work");

    StartOptions none = HyprPomo::ParseStartArgs({});
    assert(!none.work);
    assert(none.label.empty());

    assert(throws<DurationParseError>([] { HyprPomo::ParseStartArgs({"5x"}); }));
    assert(throws<DurationParseError>([] { HyprPomo::ParseStartArgs({"0m"}); }));
    assert(throws<InvalidCommandError>([] { HyprPomo::ParseStartArgs({"1m", "2m", "3m", "4m"}); }));
}

void test_task_ids() {
    assert(HyprPomo::ParseTaskId("3") == 3);
    for (const char *bad : {"", "abc", "0", "-1", "3x", " 3"}) {
        assert(throws<InvalidCommandError>([&] { HyprPomo::ParseTaskId(bad); }));
    }
}

void test_task_commands() {
    const auto dir = temp_dir("commands");
    const auto configPath = dir / "config" / "config.json";
    const auto dbPath = dir / "data" / "data.sqlite";
    std::filesystem::create_directories(dbPath.parent_path());

    {
        HyprPomo app(LOG_OFF, configPath, dbPath);
        assert(app.Run({"help"}) == 0);
        assert(app.Run({"add", "Write", "report"}) == 0);
        assert(app.Run({"ADD", "Review"}) == 0);
        assert(app.Run({"list"}) == 0);
        assert(app.Run({"done", "1"}) == 0);

        assert(throws<InvalidCommandError>([&] { app.Run({"done", "1"}); }));
        assert(throws<InvalidCommandError>([&] { app.Run({"finish", "9"}); }));
        assert(throws<InvalidCommandError>([&] { app.Run({"done"}); }));
        assert(throws<InvalidCommandError>([&] { app.Run({"done", "one"}); }));
        assert(throws<InvalidCommandError>([&] { app.Run({"add"}); }));
        assert(throws<InvalidCommandError>([&] { app.Run({"dance"}); }));
        // A leading duration means start; a malformed one aborts before anything runs.
        assert(throws<DurationParseError>([&] { app.Run({"5x"}); }));
    }

    assert(std::filesystem::exists(configPath));

    ProgressStore store(dbPath);
    const auto &tasks = store.Profile().tasks;
    assert(tasks.size() == 2);
    assert(tasks[0].name == "Write report");
    assert(tasks[0].done);
    assert(tasks[1].id == 2);
    assert(!tasks[1].done);
    assert(store.PendingTasks().size() == 1);
    assert(store.Profile().bounties.size() == BOUNTIES_PER_DAY);
}

bool task_done(HyprPomo &app, int id) {
    for (const Task &t : app.Store().Profile().tasks) {
        if (t.id == id) {
            return t.done;
        }
    }
    return false;
}

void test_session_keys() {
    const auto dir = temp_dir("keys");
    HyprPomo app(LOG_OFF, dir / "config.json", dir / "data.sqlite");
    assert(app.Run({"add", "Write", "report"}) == 0);
    assert(throws<InvalidCommandError>([&] { app.FocusOn(7); }));
    app.FocusOn(1);

    SessionEngine engine(app.Store(), SessionTimes{}, GameBalance{}, &app,
                         [] { return fixed_noon(); });
    engine.Start();

    // The y/N prompt is up during the break; 'n' only answers it.
    assert(app.HandleKey(engine, 's'));
    assert(engine.GetPhase() == BREAK);
    assert(app.HandleKey(engine, 'n'));
    assert(engine.GetPhase() == BREAK);
    assert(!task_done(app, 1));

    // Skipping the break starts the next session right away.
    assert(app.HandleKey(engine, 's'));
    assert(engine.GetPhase() == WORK);

    // Session keys still work while the prompt is up.
    assert(app.HandleKey(engine, 's'));
    assert(engine.GetPhase() == BREAK);
    assert(!app.HandleKey(engine, 'q'));
    assert(engine.GetPhase() == TERMINATED);
    assert(engine.LastTermination() == END_QUIT);
    assert(!task_done(app, 1));

    // Waiting after a stop: any key but q starts again.
    assert(app.HandleKey(engine, 'x'));
    assert(engine.GetPhase() == WORK);

    assert(app.HandleKey(engine, 's'));
    assert(app.HandleKey(engine, 'p'));
    assert(engine.IsPaused());
    assert(app.HandleKey(engine, 'y'));
    assert(!task_done(app, 1));
    assert(app.HandleKey(engine, 'p'));
    assert(!engine.IsPaused());

    assert(app.HandleKey(engine, 's'));
    assert(engine.GetPhase() == WORK);
    assert(app.HandleKey(engine, 's'));
    assert(app.HandleKey(engine, 'Y'));
    assert(task_done(app, 1));
    assert(engine.GetPhase() == LONG_BREAK);

    engine.Tick(engine.Planned());
    assert(engine.GetPhase() == TERMINATED);
    assert(engine.LastTermination() == END_BREAK_FINISHED);
    assert(!app.HandleKey(engine, 'q'));
    assert(engine.GetPhase() == TERMINATED);
}

void test_instance_lock() {
    const auto dir = temp_dir("lock");
    {
        InstanceLock first(dir / "hyprpomo.lock");
        assert(first.State() == LOCK_HELD);
        InstanceLock second(dir / "hyprpomo.lock");
        assert(second.State() == LOCK_BUSY);
        assert(!second.IsHeld());
    }
    InstanceLock again(dir / "hyprpomo.lock");
    assert(again.IsHeld());

    InstanceLock missing(dir / "no-such-dir" / "hyprpomo.lock");
    assert(missing.State() == LOCK_UNAVAILABLE);
}

void test_notification_rate_limit() {
    Notification notification;
    const auto t0 = std::chrono::system_clock::now();
    assert(notification.Admit(t0, false));
    assert(!notification.Admit(t0 + std::chrono::seconds(1), false));
    assert(notification.Admit(t0 + std::chrono::seconds(2), true));
    assert(!notification.Admit(t0 + std::chrono::seconds(4), false));
    assert(notification.Admit(t0 + std::chrono::seconds(6), false));
}

} // namespace

int main() {
    spdlog::set_level(spdlog::level::off);

    test_start_arguments();
    test_task_ids();
    test_task_commands();
    test_session_keys();
    test_instance_lock();
    test_notification_rate_limit();

    std::cout << "hyprpomo command tests passed\n";
    return 0;
}
