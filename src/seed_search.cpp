#include "seed_search.hpp"

#include <stdexcept>
#include <string>

namespace lf {

std::size_t drawWinnerIndex(const MatchSnapshot& snapshot, RandomSource& rng) {
    if (snapshot.empty()) {
        throw std::invalid_argument("cannot draw a winner from an empty snapshot");
    }

    const std::size_t n = snapshot.size();
    double r = rng.uniform01();
    auto idx = static_cast<std::size_t>(r * static_cast<double>(n));
    return idx < n ? idx : n - 1;
}

SeedSearchResult searchWinningSeed(const MatchSnapshot& snapshot,
                                   std::uint32_t desiredWinnerId,
                                   const SeedSearchConfig& cfg) {
    if (!snapshot.contains(desiredWinnerId)) {
        throw std::invalid_argument("desired winner " + std::to_string(desiredWinnerId) +
                                    " is not part of the snapshot");
    }

    BattleConfig probeCfg = cfg.battle;
    probeCfg.recordTranscript = false;

    SeedSearchResult result;
    for (std::uint32_t seed = 0; seed < cfg.seedBound; ++seed) {
        BattleOutcome outcome = simulateBattle(snapshot, seed, probeCfg);
        ++result.probes;
        if (outcome.status == BattleStatus::Undecided) {
            ++result.undecided;
            continue;
        }
        if (outcome.status == BattleStatus::Winner && outcome.winnerId == desiredWinnerId) {
            result.seed = seed;
            break;
        }
    }
    return result;
}

std::optional<std::uint32_t> findWinningSeed(const MatchSnapshot& snapshot,
                                             std::uint32_t desiredWinnerId,
                                             const SeedSearchConfig& cfg) {
    return searchWinningSeed(snapshot, desiredWinnerId, cfg).seed;
}

MatchPlan planMatch(const MatchSnapshot& snapshot, RandomSource& drawSource, const SeedSearchConfig& cfg) {
    if (snapshot.empty()) {
        throw std::invalid_argument("cannot plan a match without towers");
    }

    MatchPlan plan;
    if (snapshot.size() == 1) {
        plan.chosenWinnerId = snapshot.entries().front().id;
        plan.soleCombatant = true;
        return plan;
    }

    plan.chosenIndex = drawWinnerIndex(snapshot, drawSource);
    plan.chosenWinnerId = snapshot.entries()[plan.chosenIndex].id;

    SeedSearchResult search = searchWinningSeed(snapshot, plan.chosenWinnerId, cfg);
    plan.seed = search.seed;
    plan.probes = search.probes;
    return plan;
}

} // namespace lf
