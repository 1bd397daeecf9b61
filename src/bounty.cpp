#include "bounty.hpp"
#include "timeutils.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace {
const std::array<BountyDefinition, 5> kCatalog = {{
    {MARATHON, "marathon", "Marathon: Complete 4 sessions", 100},
    {DEEP_DIVE, "deep_dive", "Deep Dive: Complete a 45m+ session", 75},
    {EARLY_BIRD, "early_bird", "Early Bird: Finish a session before 9AM", 50},
    {NIGHT_OWL, "night_owl", "Night Owl: Finish a session after 8PM", 50},
    {IRON_WILL, "iron_will", "Iron Will: Complete a session without pausing", 60},
}};
} // namespace

// ─────────────────────────────────────
BountyBoard::BountyBoard() : m_Rng(std::random_device{}()) {}

// ─────────────────────────────────────
BountyBoard::BountyBoard(std::uint32_t seed) : m_Rng(seed) {}

// ─────────────────────────────────────
const std::array<BountyDefinition, 5> &BountyBoard::Catalog() {
    return kCatalog;
}

// ─────────────────────────────────────
const BountyDefinition &BountyBoard::Definition(BountyKind kind) {
    for (const auto &def : kCatalog) {
        if (def.kind == kind) {
            return def;
        }
    }
    throw std::out_of_range("unknown bounty kind");
}

// ─────────────────────────────────────
std::optional<BountyKind> BountyBoard::KindFromId(const std::string &id) {
    for (const auto &def : kCatalog) {
        if (id == def.id) {
            return def.kind;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────
bool BountyBoard::Refresh(UserProfile &profile, const std::string &today) {
    if (profile.bountyDate == today) {
        return false;
    }

    std::vector<BountyDefinition> picks;
    std::sample(kCatalog.begin(), kCatalog.end(), std::back_inserter(picks), BOUNTIES_PER_DAY,
                m_Rng);
    // std::sample keeps catalog order; shuffle so display order is random too.
    std::shuffle(picks.begin(), picks.end(), m_Rng);

    profile.bounties.clear();
    for (const auto &def : picks) {
        Bounty b;
        b.kind = def.kind;
        b.rewardXP = def.rewardXP;
        b.progress = 0;
        b.completed = false;
        profile.bounties.push_back(b);
    }

    spdlog::info("New daily bounties for {} (previous set: '{}')", today, profile.bountyDate);
    profile.bountyDate = today;
    profile.sessionsToday = 0;
    return true;
}

// ─────────────────────────────────────
bool BountyBoard::IsSatisfied(Bounty &bounty, const SessionOutcome &outcome) const {
    switch (bounty.kind) {
    case MARATHON:
        bounty.progress += 1;
        return bounty.progress >= MARATHON_TARGET;
    case DEEP_DIVE:
        return outcome.totalWorked > std::chrono::minutes(DEEP_DIVE_MINUTES);
    case EARLY_BIRD:
        return LocalHour(outcome.finishedAt) < EARLY_BIRD_BEFORE_HOUR;
    case NIGHT_OWL:
        return LocalHour(outcome.finishedAt) >= NIGHT_OWL_FROM_HOUR;
    case IRON_WILL:
        return !outcome.pausedThisSession;
    }
    spdlog::warn("Unknown bounty kind {}", static_cast<int>(bounty.kind));
    return false;
}

// ─────────────────────────────────────
std::vector<Bounty> BountyBoard::Evaluate(std::vector<Bounty> &bounties,
                                          const SessionOutcome &outcome) const {
    std::vector<Bounty> newlyCompleted;
    for (auto &b : bounties) {
        if (b.completed) {
            continue;
        }
        if (!IsSatisfied(b, outcome)) {
            continue;
        }
        b.completed = true;
        newlyCompleted.push_back(b);
        spdlog::info("Bounty completed: {} (+{} XP)", Definition(b.kind).text, b.rewardXP);
    }
    return newlyCompleted;
}
