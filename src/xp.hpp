#pragma once

#include <chrono>

struct GameBalance {
    int xpPerMinute = 10;
    double overtimeMultiplier = 2.0;
    int breakSkipXpPerMin = 5;
};

struct XpAward {
    int amount = 0;
    int totalXP = 0;
    int levelBefore = 1;
    int levelAfter = 1;

    bool LeveledUp() const {
        return levelAfter > levelBefore;
    }
};

class XpCalculator {
  public:
    static constexpr int kXpPerLevel = 500;

    explicit XpCalculator(const GameBalance &balance = GameBalance{});

    // Results saturate at INT_MAX.
    int WorkXP(int minutes) const;
    int OvertimeXP(int minutes) const;
    int BreakSkipXP(int remainingMinutes) const;

    // Whole minutes, truncated. Every XP figure goes through this.
    static int WholeMinutes(std::chrono::milliseconds elapsed);

    static int LevelForXP(int totalXP);
    static int XpIntoLevel(int totalXP);

  private:
    GameBalance m_Balance;
};
