#include "hyprpomo.hpp"

#include "errors.hpp"
#include "timeutils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <thread>

#include <unistd.h>

#include <fmt/format.h>

namespace {
volatile std::sig_atomic_t g_Interrupted = 0;

void OnInterruptSignal(int) {
    g_Interrupted = 1;
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string Join(std::vector<std::string>::const_iterator begin,
                 std::vector<std::string>::const_iterator end) {
    std::string out;
    for (auto it = begin; it != end; ++it) {
        if (!out.empty()) {
            out += ' ';
        }
        out += *it;
    }
    return out;
}

// Restores the previous SIGINT/SIGTERM dispositions when the session loop ends.
class SignalGuard {
  public:
    SignalGuard() {
        g_Interrupted = 0;
        struct sigaction sa {};
        sa.sa_handler = OnInterruptSignal;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;
        sigaction(SIGINT, &sa, &m_OldInt);
        sigaction(SIGTERM, &sa, &m_OldTerm);
    }
    ~SignalGuard() {
        sigaction(SIGINT, &m_OldInt, nullptr);
        sigaction(SIGTERM, &m_OldTerm, nullptr);
    }

  private:
    struct sigaction m_OldInt {};
    struct sigaction m_OldTerm {};
};
} // namespace

// ─────────────────────────────────────
HyprPomo::HyprPomo(LogLevel log_level) : HyprPomo(log_level, Config::DefaultPath(), {}) {}

// ─────────────────────────────────────
HyprPomo::HyprPomo(LogLevel log_level, const std::filesystem::path &configPath,
                   const std::filesystem::path &dbPath)
    : m_DbPath(dbPath) {

    if (log_level == LOG_DEBUG) {
        spdlog::set_level(spdlog::level::debug);
    } else if (log_level == LOG_INFO) {
        spdlog::set_level(spdlog::level::info);
    } else if (log_level == LOG_WARN) {
        spdlog::set_level(spdlog::level::warn);
    } else if (log_level == LOG_OFF) {
        spdlog::set_level(spdlog::level::off);
    }

    m_Config = std::make_unique<Config>(configPath);
    m_Times = m_Config->Times();
    spdlog::info("Config file: {}", m_Config->Path().string());
}

// ─────────────────────────────────────
HyprPomo::~HyprPomo() {
    RequestStop();
}

// ─────────────────────────────────────
int HyprPomo::Run(const std::vector<std::string> &args) {
    if (args.empty()) {
        return RunStart(args);
    }

    const std::string cmd = Lower(args[0]);
    const std::vector<std::string> rest(args.begin() + 1, args.end());

    if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        PrintHelp();
        return 0;
    }
    if (cmd == "start") {
        return RunStart(rest);
    }
    if (cmd == "add") {
        return RunAdd(rest);
    }
    if (cmd == "list") {
        return RunList();
    }
    if (cmd == "done" || cmd == "finish") {
        return RunDone(rest);
    }
    if (LooksLikeDuration(args[0])) {
        return RunStart(args);
    }

    throw InvalidCommandError(fmt::format("unknown command '{}', see 'hyprpomo help'", args[0]));
}

// ─────────────────────────────────────
StartOptions HyprPomo::ParseStartArgs(const std::vector<std::string> &args) {
    StartOptions opts;
    std::vector<std::string> words;
    int durations = 0;

    for (const std::string &arg : args) {
        if (!LooksLikeDuration(arg)) {
            words.push_back(arg);
            continue;
        }
        std::chrono::seconds d = ParseDuration(arg);
        if (durations == 0) {
            opts.work = d;
        } else if (durations == 1) {
            opts.shortBreak = d;
        } else if (durations == 2) {
            opts.longBreak = d;
        } else {
            throw InvalidCommandError(
                fmt::format("too many durations, '{}' (expected work [short [long]])", arg));
        }
        durations++;
    }

    opts.label = Join(words.begin(), words.end());
    return opts;
}

// ─────────────────────────────────────
int HyprPomo::ParseTaskId(const std::string &token) {
    int id = 0;
    const char *first = token.data();
    const char *last = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(first, last, id);
    if (token.empty() || ec != std::errc() || ptr != last || id <= 0) {
        throw InvalidCommandError(fmt::format("'{}' is not a valid task id", token));
    }
    return id;
}

// ─────────────────────────────────────
ProgressStore &HyprPomo::Store() {
    if (!m_Store) {
        if (m_DbPath.empty()) {
            m_DbPath = ProgressStore::DefaultPath();
        }
        m_Store = std::make_unique<ProgressStore>(m_DbPath);
        if (m_Store->RecoveredFromCorruption()) {
            PrintLine("Progress file was unreadable, it was backed up and a fresh profile started.");
        }
        spdlog::info("Progress store: {}", m_DbPath.string());
    }
    return *m_Store;
}

// ─────────────────────────────────────
std::filesystem::path HyprPomo::LockPath() const {
    return m_DbPath.parent_path() / "hyprpomo.lock";
}

// ─────────────────────────────────────
void HyprPomo::WarnIfSessionRunning() {
    InstanceLock lock(LockPath());
    if (lock.State() == LOCK_BUSY) {
        spdlog::warn("A hyprpomo session is running, it may overwrite this change when it saves");
    }
}

// ─────────────────────────────────────
int HyprPomo::RunAdd(const std::vector<std::string> &args) {
    const std::string name = Join(args.begin(), args.end());
    if (args.empty()) {
        throw InvalidCommandError("usage: hyprpomo add <task name>");
    }

    ProgressStore &store = Store();
    WarnIfSessionRunning();
    int id = store.AddTask(name);
    if (!store.LastError().empty()) {
        spdlog::error("Task was not saved: {}", store.LastError());
        return 1;
    }
    fmt::print("Task added: [{}] {}\n", id, store.Profile().tasks.back().name);
    return 0;
}

// ─────────────────────────────────────
int HyprPomo::RunDone(const std::vector<std::string> &args) {
    if (args.empty()) {
        throw InvalidCommandError("usage: hyprpomo done <task id>");
    }
    const int id = ParseTaskId(args[0]);

    ProgressStore &store = Store();
    WarnIfSessionRunning();
    store.CompleteTask(id);
    if (!store.LastError().empty()) {
        spdlog::error("Task was not saved: {}", store.LastError());
        return 1;
    }
    fmt::print("Task {} marked as complete!\n", id);
    return 0;
}

// ─────────────────────────────────────
int HyprPomo::RunList() {
    ProgressStore &store = Store();
    WarnIfSessionRunning();
    store.RefreshBounties(LocalDate(std::chrono::system_clock::now()));

    const UserProfile &p = store.Profile();
    fmt::print("Level {}   XP {}/{}   (total {})\n", p.level, XpCalculator::XpIntoLevel(p.totalXP),
               XpCalculator::kXpPerLevel, p.totalXP);
    fmt::print("Sessions completed: {}   Focus time: {}h {:02}m   Today: {}\n",
               p.stats.sessionsCompleted, p.stats.focusMinutes / 60, p.stats.focusMinutes % 60,
               p.sessionsToday);

    fmt::print("\nDaily bounties ({})\n", p.bountyDate);
    for (const Bounty &b : p.bounties) {
        const BountyDefinition &def = BountyBoard::Definition(b.kind);
        std::string progress;
        if (b.kind == MARATHON && !b.completed) {
            progress = fmt::format(" ({}/{})", b.progress, MARATHON_TARGET);
        }
        fmt::print("  [{}] {}{}  +{} XP\n", b.completed ? 'x' : ' ', def.text, progress,
                   b.rewardXP);
    }

    fmt::print("\n");
    std::vector<Task> pending = store.PendingTasks();
    if (pending.empty()) {
        fmt::print("No active tasks. Use 'hyprpomo add <name>' to create one.\n");
        return 0;
    }
    fmt::print("Pending tasks\n");
    for (const Task &t : pending) {
        fmt::print("  {:>3}  {}\n", t.id, t.name);
    }
    return 0;
}

// ─────────────────────────────────────
void HyprPomo::PrintHelp() {
    fmt::print("hyprpomo - focus timer with XP, levels and daily bounties\n\n");
    fmt::print("Usage: hyprpomo [--debug|--verbose|--quiet] <command>\n\n");
    fmt::print("  hyprpomo                      start a session (pick a pending task)\n");
    fmt::print("  hyprpomo 45m [5m [15m]] [label]  start with work/short/long durations\n");
    fmt::print("  hyprpomo start [...]          same as above\n");
    fmt::print("  hyprpomo add <name>           add a task\n");
    fmt::print("  hyprpomo list                 show level, stats, bounties and tasks\n");
    fmt::print("  hyprpomo done <id>            mark a task as complete (alias: finish)\n");
    fmt::print("  hyprpomo help                 show this screen\n\n");
    fmt::print("Durations: 90s, 45m, 1h or bare minutes (25).\n\n");
    fmt::print("Keys during a session:\n");
    fmt::print("  p  pause / resume\n");
    fmt::print("  s  skip (skipping a break earns XP)\n");
    fmt::print("  b  break out of flow and start the break\n");
    fmt::print("  q  quit\n\n");
    fmt::print("Config file: {}\n", m_Config->Path().string());
}

// ─────────────────────────────────────
void HyprPomo::SelectTask() {
    std::vector<Task> pending = Store().PendingTasks();
    if (pending.empty() || ::isatty(STDIN_FILENO) != 1) {
        return;
    }

    fmt::print("Select a task:\n");
    for (const Task &t : pending) {
        fmt::print("  {}: {}\n", t.id, t.name);
    }
    fmt::print("  0: {}\n", GENERAL_FOCUS_LABEL);
    fmt::print("Enter ID [0]: ");
    std::fflush(stdout);

    std::string line;
    if (!std::getline(std::cin, line)) {
        return;
    }
    line.erase(0, line.find_first_not_of(" \t"));
    line.erase(line.find_last_not_of(" \t\r") + 1);
    if (line.empty() || line == "0") {
        return;
    }

    try {
        FocusOn(ParseTaskId(line));
    } catch (const InvalidCommandError &e) {
        fmt::print("{}, using {}\n", e.what(), GENERAL_FOCUS_LABEL);
    }
}

// ─────────────────────────────────────
void HyprPomo::FocusOn(int taskId) {
    std::vector<Task> pending = Store().PendingTasks();
    auto it = std::find_if(pending.begin(), pending.end(),
                           [&](const Task &t) { return t.id == taskId; });
    if (it == pending.end()) {
        throw InvalidCommandError(fmt::format("no pending task {}", taskId));
    }
    m_TaskId = it->id;
    m_Label = it->name;
}

// ─────────────────────────────────────
int HyprPomo::RunStart(const std::vector<std::string> &args) {
    StartOptions opts = ParseStartArgs(args);

    ProgressStore &store = Store();
    m_Lock = std::make_unique<InstanceLock>(LockPath());
    if (m_Lock->State() == LOCK_BUSY) {
        throw std::runtime_error("another hyprpomo session is already running");
    }
    if (!m_Lock->IsHeld()) {
        throw std::runtime_error(
            fmt::format("could not take the session lock {}", LockPath().string()));
    }

    if (opts.work) {
        m_Times.work = *opts.work;
    }
    if (opts.shortBreak) {
        m_Times.shortBreak = *opts.shortBreak;
    }
    if (opts.longBreak) {
        m_Times.longBreak = *opts.longBreak;
    }

    store.RefreshBounties(LocalDate(std::chrono::system_clock::now()));
    if (!opts.label.empty()) {
        m_Label = opts.label;
    } else {
        SelectTask();
    }

    m_Notification = std::make_unique<Notification>();
    m_Status = std::make_unique<StatusPublisher>();
    spdlog::info("Status file: {}", StatusPublisher::DefaultPath().string());

    SessionEngine engine(store, m_Times, m_Config->Balance(), this);
    RunEventLoop(engine);
    return 0;
}

// ─────────────────────────────────────
void HyprPomo::RunEventLoop(SessionEngine &engine) {
    Terminal terminal;
    SignalGuard signals;
    EventQueue queue;

    m_StopRequested = false;
    std::thread ticker([&] { RunTicker(queue); });
    std::thread input([&] { RunInput(queue, terminal); });

    auto shutdown = [&] {
        RequestStop();
        ticker.join();
        input.join();
        m_Status->Clear();
        if (m_StatusLineShown) {
            fmt::print("\n");
            m_StatusLineShown = false;
        }
        std::fflush(stdout);
    };

    try {
        engine.Start();
        m_Status->Publish(engine.Snapshot());
        RenderStatus(engine.Snapshot());

        bool running = true;
        while (running) {
            Event e = queue.WaitPop();
            switch (e.type) {
            case Event::TICK:
                engine.Tick(e.delta);
                break;
            case Event::KEY:
                running = HandleKey(engine, e.key);
                break;
            case Event::INTERRUPT:
                spdlog::info("Interrupted");
                engine.Quit();
                running = false;
                break;
            }
            m_Status->Publish(engine.Snapshot());
            RenderStatus(engine.Snapshot());
        }
    } catch (...) {
        shutdown();
        throw;
    }
    shutdown();
}

// ─────────────────────────────────────
void HyprPomo::RunTicker(EventQueue &queue) {
    auto last = std::chrono::steady_clock::now();
    std::unique_lock<std::mutex> lk(m_StopMutex);
    while (!m_StopRequested.load()) {
        m_StopCv.wait_for(lk, std::chrono::milliseconds(TICK_EVERY_MS),
                          [&] { return m_StopRequested.load(); });
        if (m_StopRequested.load()) {
            break;
        }
        const auto now = std::chrono::steady_clock::now();
        Event e;
        e.type = Event::TICK;
        e.delta = std::chrono::duration_cast<std::chrono::milliseconds>(now - last);
        last = now;
        queue.Push(e);
    }
}

// ─────────────────────────────────────
void HyprPomo::RunInput(EventQueue &queue, Terminal &terminal) {
    while (!m_StopRequested.load()) {
        if (g_Interrupted) {
            g_Interrupted = 0;
            Event e;
            e.type = Event::INTERRUPT;
            queue.Push(e);
        }

        if (terminal.AtEof()) {
            std::unique_lock<std::mutex> lk(m_StopMutex);
            m_StopCv.wait_for(lk, std::chrono::milliseconds(KEY_POLL_MS),
                              [&] { return m_StopRequested.load(); });
            continue;
        }

        std::optional<char> key = terminal.ReadKey(std::chrono::milliseconds(KEY_POLL_MS));
        if (key) {
            Event e;
            e.type = Event::KEY;
            e.key = *key;
            queue.Push(e);
        }
    }
}

// ─────────────────────────────────────
void HyprPomo::RequestStop() {
    {
        std::lock_guard<std::mutex> lk(m_StopMutex);
        m_StopRequested = true;
    }
    m_StopCv.notify_all();
}

// ─────────────────────────────────────
bool HyprPomo::HandleKey(SessionEngine &engine, char key) {
    const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(key)));
    if (m_AwaitingTaskAnswer) {
        m_AwaitingTaskAnswer = false;
        if (lower == 'y' && m_TaskId) {
            try {
                Store().CompleteTask(*m_TaskId);
                PrintLine(fmt::format("Task complete: {}", m_Label));
            } catch (const InvalidCommandError &e) {
                spdlog::warn("Could not complete task {}: {}", *m_TaskId, e.what());
            }
            m_TaskId.reset();
            m_Label = GENERAL_FOCUS_LABEL;
            return true;
        }
        if (lower == 'n' || lower == '\n' || lower == '\r') {
            return true;
        }
        // Any other key answers no and still acts as a session control.
    }

    // Break over, waiting for the user.
    if (engine.GetPhase() == TERMINATED) {
        if (lower == 'q') {
            return false;
        }
        engine.Start();
        return true;
    }

    engine.HandleKey(key);
    if (engine.GetPhase() != TERMINATED) {
        return true;
    }
    if (engine.LastTermination() == END_QUIT) {
        return false;
    }
    if (engine.LastTermination() == END_BREAK_SKIPPED) {
        engine.Start();
    }
    return true;
}

// ─────────────────────────────────────
void HyprPomo::RenderStatus(const SessionSnapshot &snapshot) {
    const std::string line = StatusPublisher::Format(snapshot);
    if (line.empty()) {
        if (m_StatusLineShown) {
            fmt::print("\r\x1b[K");
            m_StatusLineShown = false;
        }
        std::fflush(stdout);
        return;
    }

    const char *hint = snapshot.phase == FLOW ? "[p]ause [b]reak [q]uit" : "[p]ause [s]kip [q]uit";
    fmt::print("\r{}  {}  {}\x1b[K", line, m_Label, hint);
    std::fflush(stdout);
    m_StatusLineShown = true;
}

// ─────────────────────────────────────
void HyprPomo::PrintLine(const std::string &line) {
    if (m_StatusLineShown) {
        fmt::print("\r\x1b[K");
        m_StatusLineShown = false;
    }
    fmt::print("{}\n", line);
    std::fflush(stdout);
}

// ─────────────────────────────────────
void HyprPomo::PrintLevelUp(const XpAward &award) {
    if (award.LeveledUp()) {
        PrintLine(fmt::format("LEVEL UP! You reached level {}", award.levelAfter));
    }
}

// ─────────────────────────────────────
void HyprPomo::Notify(const std::string &summary, const std::string &body, bool urgent) {
    if (!m_Notification) {
        return;
    }
    m_Notification->SendNotification("alarm-clock", summary, body, urgent);
}

// ─────────────────────────────────────
void HyprPomo::OnPhaseStarted(SessionPhase phase, std::chrono::milliseconds planned) {
    switch (phase) {
    case WORK:
        PrintLine(fmt::format("Focus: {} ({})", m_Label,
                              FormatClock(std::chrono::duration_cast<std::chrono::seconds>(planned))));
        Notify("Focus", fmt::format("Time to work on: {}", m_Label));
        break;
    case FLOW:
        PrintLine("Time is up. Flow mode: overtime earns bonus XP, press b to take your break.");
        Notify("Flow", "Work time is up. Keep going or press b for a break.");
        break;
    case BREAK:
    case LONG_BREAK:
        PrintLine(fmt::format("{} for {}m", phase == LONG_BREAK ? "Long break" : "Break",
                              XpCalculator::WholeMinutes(planned)));
        break;
    case TERMINATED:
        break;
    }
}

// ─────────────────────────────────────
void HyprPomo::OnSessionCompleted(const SessionReport &report) {
    std::string msg = fmt::format("Session complete! Base: {} XP", report.workXP);
    if (report.overtimeXP > 0) {
        msg += fmt::format(" | Flow bonus: +{} XP", report.overtimeXP);
    }
    if (report.record.bountyXP > 0) {
        msg += fmt::format(" | Bounties: +{} XP", report.record.bountyXP);
    }
    PrintLine(msg);

    for (const Bounty &b : report.record.completedBounties) {
        PrintLine(fmt::format("Bounty completed: {} (+{} XP)", BountyBoard::Definition(b.kind).text,
                              b.rewardXP));
    }
    PrintLevelUp(report.record.award);

    std::string body = fmt::format("+{} XP. Time to relax ({}m).", report.record.award.amount,
                                   XpCalculator::WholeMinutes(report.breakDuration));
    if (report.record.award.LeveledUp()) {
        body += fmt::format(" Level {} reached!", report.record.award.levelAfter);
    }
    Notify("Session complete", body, true);

    if (m_TaskId) {
        PrintLine(fmt::format("Did you finish {}? [y/N]", m_Label));
        m_AwaitingTaskAnswer = true;
    }
}

// ─────────────────────────────────────
void HyprPomo::OnBreakSkipped(int remainingMinutes, const XpAward &award) {
    if (award.amount > 0) {
        PrintLine(fmt::format("Break skipped with {}m left! +{} XP for getting back to work!",
                              remainingMinutes, award.amount));
    } else {
        PrintLine("Break skipped.");
    }
    PrintLevelUp(award);
}

// ─────────────────────────────────────
void HyprPomo::OnTerminated(TerminationReason reason) {
    switch (reason) {
    case END_BREAK_FINISHED:
        PrintLine("Break over. Press any key to start the next session, q to quit.");
        Notify("Break over", "Press any key in the terminal to start focusing.", true);
        break;
    case END_QUIT:
        PrintLine("Timer stopped.");
        break;
    case END_BREAK_SKIPPED:
    case END_NONE:
        break;
    }
}
