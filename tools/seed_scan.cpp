#include "battle.hpp"
#include "cli_args.hpp"
#include "seed_search.hpp"
#include "snapshot.hpp"

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <limits>
#include <map>
#include <vector>

// Runs every seed in the search window and reports how the winners spread.
// A tower with no winning seed at all forces the fallback ending whenever the
// draw picks it.
int main(int argc, char* argv[]) {
    std::size_t players = 4;
    std::uint32_t seedBound = lf::SeedSearchConfig{}.seedBound;
    if (argc > 1) {
        auto parsed = lf::parseUnsigned(argv[1], 64);
        if (parsed && *parsed > 0) {
            players = static_cast<std::size_t>(*parsed);
        } else {
            std::cerr << "Invalid player count provided. Using default of 4.\n";
        }
    }
    if (argc > 2) {
        auto parsed = lf::parseUnsigned(argv[2], std::numeric_limits<std::uint32_t>::max());
        if (parsed && *parsed > 0) {
            seedBound = static_cast<std::uint32_t>(*parsed);
        } else {
            std::cerr << "Invalid seed bound provided. Using default of " << seedBound << ".\n";
        }
    }

    lf::MatchSnapshot snapshot = lf::ringSnapshot(players);
    lf::BattleConfig cfg;

    std::map<std::uint32_t, std::size_t> wins;
    std::map<std::uint32_t, std::uint32_t> firstSeed;
    std::size_t undecided = 0;
    std::size_t totalTicks = 0;

    for (std::uint32_t seed = 0; seed < seedBound; ++seed) {
        lf::BattleOutcome outcome = lf::simulateBattle(snapshot, seed, cfg);
        totalTicks += outcome.ticks;
        if (outcome.status != lf::BattleStatus::Winner || !outcome.winnerId) {
            ++undecided;
            continue;
        }
        if (wins[*outcome.winnerId]++ == 0) {
            firstSeed[*outcome.winnerId] = seed;
        }
    }

    std::cout << "=== SEED SPACE SCAN ===\n";
    std::cout << "Players: " << players << "  seeds: 0.." << (seedBound - 1) << '\n';
    std::cout << "Mean battle length: " << std::fixed << std::setprecision(1)
              << static_cast<double>(totalTicks) / static_cast<double>(seedBound) << " ticks\n\n";

    std::cout << "Wins per tower:\n";
    for (const auto& entry : snapshot.entries()) {
        std::size_t count = wins.count(entry.id) ? wins[entry.id] : 0;
        double share = static_cast<double>(count) / static_cast<double>(seedBound) * 100.0;
        std::cout << "  [" << std::setw(2) << entry.id << "] " << std::setw(6) << count << "  (" << std::setprecision(2)
                  << share << "%)";
        if (count > 0) {
            std::cout << "  first seed " << firstSeed[entry.id];
        } else {
            std::cout << "  NO SEED: fallback ending";
        }
        std::cout << '\n';
    }
    std::cout << "  undecided " << undecided << '\n';

    return 0;
}
