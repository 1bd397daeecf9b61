#pragma once

#include <chrono>
#include <string>
#include <vector>

enum SessionPhase { WORK = 1, BREAK = 2, LONG_BREAK = 3, FLOW = 4, TERMINATED = 5 };

enum TerminationReason { END_NONE, END_BREAK_FINISHED, END_BREAK_SKIPPED, END_QUIT };

enum BountyKind { MARATHON = 1, DEEP_DIVE = 2, EARLY_BIRD = 3, NIGHT_OWL = 4, IRON_WILL = 5 };

enum LogLevel { LOG_DEBUG, LOG_INFO, LOG_WARN, LOG_OFF };

struct Task {
    int id = 0;
    std::string name;
    bool done = false;

    bool operator==(const Task &) const = default;
};

struct Bounty {
    BountyKind kind = MARATHON;
    int rewardXP = 0;
    int progress = 0;
    bool completed = false;

    bool operator==(const Bounty &) const = default;
};

struct ProfileStats {
    int sessionsCompleted = 0;
    int focusMinutes = 0;

    bool operator==(const ProfileStats &) const = default;
};

struct UserProfile {
    int level = 1;
    int totalXP = 0;
    std::vector<Task> tasks;
    std::vector<Bounty> bounties;
    std::string bountyDate;
    int sessionsToday = 0;
    ProfileStats stats;

    bool operator==(const UserProfile &) const = default;
};

struct SessionSnapshot {
    SessionPhase phase = TERMINATED;
    std::chrono::milliseconds planned{0};
    std::chrono::milliseconds elapsed{0};
    bool paused = false;
};

// Facts about a completed work session, as seen by bounty evaluation.
struct SessionOutcome {
    int workMinutes = 0;
    int overtimeMinutes = 0;
    std::chrono::seconds totalWorked{0};
    bool pausedThisSession = false;
    std::chrono::system_clock::time_point finishedAt{};
};
