#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "common.hpp"

#define BOUNTIES_PER_DAY 3
#define MARATHON_TARGET 4
#define DEEP_DIVE_MINUTES 45
#define EARLY_BIRD_BEFORE_HOUR 9
#define NIGHT_OWL_FROM_HOUR 20

struct BountyDefinition {
    BountyKind kind;
    const char *id;
    const char *text;
    int rewardXP;
};

class BountyBoard {
  public:
    BountyBoard();
    explicit BountyBoard(std::uint32_t seed);

    static const std::array<BountyDefinition, 5> &Catalog();
    static const BountyDefinition &Definition(BountyKind kind);
    static std::optional<BountyKind> KindFromId(const std::string &id);

    // Draws a new set when `today` differs from the profile's bounty date.
    // Returns true if the set was regenerated.
    bool Refresh(UserProfile &profile, const std::string &today);

    // Returns the bounties completed by this outcome. Completed ones are left alone.
    std::vector<Bounty> Evaluate(std::vector<Bounty> &bounties, const SessionOutcome &outcome) const;

  private:
    bool IsSatisfied(Bounty &bounty, const SessionOutcome &outcome) const;

  private:
    std::mt19937 m_Rng;
};
