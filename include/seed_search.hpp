#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "battle.hpp"
#include "rng.hpp"
#include "snapshot.hpp"

namespace lf {

struct SeedSearchConfig {
    std::uint32_t seedBound = 2000; // seeds 0 .. seedBound-1
    BattleConfig battle{};
};

struct SeedSearchResult {
    std::optional<std::uint32_t> seed;
    std::size_t probes = 0;
    // Probes that ran out of ticks without a winner.
    std::size_t undecided = 0;
};

struct MatchPlan {
    std::uint32_t chosenWinnerId = 0;
    std::size_t chosenIndex = 0;
    std::optional<std::uint32_t> seed;
    std::size_t probes = 0;
    bool soleCombatant = false;

    bool needsFallback() const { return !soleCombatant && !seed.has_value(); }
};

// Uniform pick over the snapshot entries. Consumes exactly one draw.
std::size_t drawWinnerIndex(const MatchSnapshot& snapshot, RandomSource& rng);

SeedSearchResult searchWinningSeed(const MatchSnapshot& snapshot,
                                   std::uint32_t desiredWinnerId,
                                   const SeedSearchConfig& cfg = {});

// Lowest seed in [0, seedBound) whose battle is won by desiredWinnerId.
std::optional<std::uint32_t> findWinningSeed(const MatchSnapshot& snapshot,
                                             std::uint32_t desiredWinnerId,
                                             const SeedSearchConfig& cfg = {});

MatchPlan planMatch(const MatchSnapshot& snapshot, RandomSource& drawSource, const SeedSearchConfig& cfg = {});

} // namespace lf
