#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

// parts
#include "config.hpp"
#include "event_queue.hpp"
#include "lock.hpp"
#include "notification.hpp"
#include "progress.hpp"
#include "session.hpp"
#include "status.hpp"
#include "terminal.hpp"

#include "common.hpp"

#define TICK_EVERY_MS 1000
#define KEY_POLL_MS 200
#define GENERAL_FOCUS_LABEL "General Focus"

struct StartOptions {
    std::optional<std::chrono::seconds> work;
    std::optional<std::chrono::seconds> shortBreak;
    std::optional<std::chrono::seconds> longBreak;
    std::string label;
};

class HyprPomo : public SessionObserver {
  public:
    HyprPomo(LogLevel log_level);
    HyprPomo(LogLevel log_level, const std::filesystem::path &configPath,
             const std::filesystem::path &dbPath);
    ~HyprPomo();

    // Dispatches one command line (global flags already removed). Returns the exit code.
    int Run(const std::vector<std::string> &args);

    // Leading duration tokens fill work/short/long in order, the rest is the label.
    // Throws DurationParseError.
    static StartOptions ParseStartArgs(const std::vector<std::string> &args);
    static int ParseTaskId(const std::string &token);

    // Attaches the session to a pending task. Throws InvalidCommandError.
    void FocusOn(int taskId);
    ProgressStore &Store();

    // One key from the session loop. Returns false once the loop should end.
    bool HandleKey(SessionEngine &engine, char key);

    // SessionObserver
    void OnPhaseStarted(SessionPhase phase, std::chrono::milliseconds planned) override;
    void OnSessionCompleted(const SessionReport &report) override;
    void OnBreakSkipped(int remainingMinutes, const XpAward &award) override;
    void OnTerminated(TerminationReason reason) override;

  private:
    // commands
    int RunStart(const std::vector<std::string> &args);
    int RunAdd(const std::vector<std::string> &args);
    int RunList();
    int RunDone(const std::vector<std::string> &args);
    void PrintHelp();

    std::filesystem::path LockPath() const;
    void WarnIfSessionRunning();
    void SelectTask();

    // session loop
    void RunEventLoop(SessionEngine &engine);
    void RunTicker(EventQueue &queue);
    void RunInput(EventQueue &queue, Terminal &terminal);
    void RequestStop();
    void RenderStatus(const SessionSnapshot &snapshot);
    void PrintLine(const std::string &line);
    void PrintLevelUp(const XpAward &award);
    void Notify(const std::string &summary, const std::string &body, bool urgent = false);

  private:
    std::filesystem::path m_DbPath;

    // Parts
    std::unique_ptr<Config> m_Config;
    std::unique_ptr<ProgressStore> m_Store;
    std::unique_ptr<Notification> m_Notification;
    std::unique_ptr<StatusPublisher> m_Status;
    std::unique_ptr<InstanceLock> m_Lock;

    // Current session
    SessionTimes m_Times;
    std::string m_Label{GENERAL_FOCUS_LABEL};
    std::optional<int> m_TaskId;
    bool m_AwaitingTaskAnswer{false};
    bool m_StatusLineShown{false};

    // Producers stop
    std::mutex m_StopMutex;
    std::condition_variable m_StopCv;
    std::atomic<bool> m_StopRequested{false};
};
