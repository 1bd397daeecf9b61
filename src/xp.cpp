#include "xp.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace {
int ClampXP(double xp) {
    if (xp <= 0.0) {
        return 0;
    }
    if (xp >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(std::floor(xp));
}
} // namespace

// ─────────────────────────────────────
XpCalculator::XpCalculator(const GameBalance &balance) : m_Balance(balance) {}

// ─────────────────────────────────────
int XpCalculator::WorkXP(int minutes) const {
    if (minutes <= 0) {
        return 0;
    }
    return ClampXP(static_cast<double>(minutes) * m_Balance.xpPerMinute);
}

// ─────────────────────────────────────
int XpCalculator::OvertimeXP(int minutes) const {
    if (minutes <= 0) {
        return 0;
    }
    return ClampXP(static_cast<double>(minutes) * m_Balance.xpPerMinute *
                   m_Balance.overtimeMultiplier);
}

// ─────────────────────────────────────
int XpCalculator::BreakSkipXP(int remainingMinutes) const {
    if (remainingMinutes <= 0) {
        return 0;
    }
    return ClampXP(static_cast<double>(remainingMinutes) * m_Balance.breakSkipXpPerMin);
}

// ─────────────────────────────────────
int XpCalculator::WholeMinutes(std::chrono::milliseconds elapsed) {
    if (elapsed.count() <= 0) {
        return 0;
    }
    const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(elapsed).count();
    return static_cast<int>(
        std::min<long long>(minutes, std::numeric_limits<int>::max()));
}

// ─────────────────────────────────────
int XpCalculator::LevelForXP(int totalXP) {
    if (totalXP < 0) {
        totalXP = 0;
    }
    return 1 + totalXP / kXpPerLevel;
}

// ─────────────────────────────────────
int XpCalculator::XpIntoLevel(int totalXP) {
    if (totalXP < 0) {
        return 0;
    }
    return totalXP % kXpPerLevel;
}
