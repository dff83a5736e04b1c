#include "battle.hpp"
#include "cinematic.hpp"
#include "cli_args.hpp"
#include "rng.hpp"
#include "secure_random.hpp"
#include "seed_search.hpp"
#include "snapshot.hpp"

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace lf;

namespace {

constexpr std::uint64_t kMaxPlayers = 64;

std::uint64_t envCount(const char* name, std::uint64_t fallback, std::uint64_t max) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') {
        return fallback;
    }
    auto parsed = parseUnsigned(raw, max);
    if (!parsed) {
        std::cerr << "Ignoring " << name << "=" << raw << " (not an unsigned integer up to " << max << ")\n";
        return fallback;
    }
    return *parsed;
}

void printTowers(const MatchSnapshot& snapshot) {
    std::cout << "Towers:\n";
    for (const auto& e : snapshot.entries()) {
        std::cout << "  [" << e.id << "] at (" << std::fixed << std::setprecision(1) << e.x << ", " << e.y
                  << ") color #" << std::hex << std::setw(6) << std::setfill('0') << e.color << std::dec
                  << std::setfill(' ') << "\n";
    }
}

void printBattleTick(const BattleEngine& engine) {
    const int barWidth = 20;
    std::cout << "\nt=" << std::fixed << std::setprecision(1) << engine.elapsed() << "s  bullets "
              << engine.bullets().size() << (engine.homingActive() ? "  [homing]" : "") << "\n";
    for (const auto& tower : engine.towers()) {
        int filled = tower.maxHealth() > 0 ? (tower.health() * barWidth) / tower.maxHealth() : 0;
        std::cout << "  [" << tower.id() << "] |";
        for (int x = 0; x < barWidth; ++x) {
            std::cout << (x < filled ? '#' : '.');
        }
        std::cout << "| " << towerStateName(tower.state()) << "  cannons " << tower.cannons().size() << "\n";
    }
}

void playCinematic(std::uint32_t winnerId) {
    FallbackCinematic cinematic(winnerId);
    CinematicPhase shown = CinematicPhase::Finished;
    while (!cinematic.finished()) {
        for (CinematicEvent ev : cinematic.advance(0.25)) {
            if (ev == CinematicEvent::EnemiesEliminated) {
                std::cout << "  ** every tower except [" << winnerId << "] is wiped out **\n";
            }
        }
        if (cinematic.phase() != shown) {
            shown = cinematic.phase();
            std::cout << "  phase: " << cinematicPhaseName(shown) << "\n";
        }
    }
}

} // namespace

int main() {
    const char* matchEnv = std::getenv("LF_MATCH_ID");
    std::string matchId = matchEnv ? matchEnv : "local-cli";
    std::size_t players = static_cast<std::size_t>(envCount("LF_PLAYERS", 4, kMaxPlayers));

    SeedSearchConfig searchCfg;
    searchCfg.seedBound = static_cast<std::uint32_t>(
        envCount("LF_SEED_BOUND", searchCfg.seedBound, std::numeric_limits<std::uint32_t>::max()));

    if (players < 1) {
        std::cerr << "LF_PLAYERS must be at least 1\n";
        return 1;
    }

    std::cout << "Last Finger: whoever keeps a finger down longest wins.\n";
    std::cout << "Using matchId=" << matchId << " players=" << players << " seedBound=" << searchCfg.seedBound
              << " (set LF_MATCH_ID/LF_PLAYERS/LF_SEED_BOUND to override)\n\n";

    try {
        MatchSnapshot snapshot = ringSnapshot(players);
        printTowers(snapshot);

        VrfKeyPair houseKeys = generateVrfKeypair();
        std::cout << "\n=== VERIFIABLE DRAW SETUP ===\n";
        std::cout << "Server VRF commitment (public key): " << houseKeys.publicKeyHex << "\n";
        std::cout << "Snapshot digest: " << snapshot.digest() << "\n";
        std::cout << "Enter your client seed (blank = random): ";
        std::string clientSeed;
        std::getline(std::cin, clientSeed);
        if (clientSeed.empty()) {
            clientSeed = secureRandomHex(8);
            std::cout << "Generated client seed: " << clientSeed << "\n";
        }

        const std::uint64_t nonce = 0;
        ProvablyFairRng drawRng(
            houseKeys.secretKeyHex, houseKeys.publicKeyHex, matchId, snapshot.digest(), clientSeed, nonce);

        MatchPlan plan = planMatch(snapshot, drawRng, searchCfg);
        std::cout << "\nChosen winner: tower " << plan.chosenWinnerId << "\n";

        if (plan.soleCombatant) {
            std::cout << "Only one tower placed; it wins without a fight.\n";
        } else if (plan.seed) {
            std::cout << "Battle seed " << *plan.seed << " found after " << plan.probes << " probes.\n";

            BattleConfig liveCfg = searchCfg.battle;
            liveCfg.recordTranscript = true;
            auto outcome = simulateBattle(snapshot, *plan.seed, liveCfg, [](const BattleEngine& engine) {
                if (engine.tick() % 60 == 0 || !engine.running()) {
                    printBattleTick(engine);
                    std::this_thread::sleep_for(std::chrono::milliseconds(120));
                }
            });
            std::cout << "\nBattle finished after " << outcome.ticks << " ticks: "
                      << battleStatusName(outcome.status) << "\n";
            if (outcome.winnerId) {
                std::cout << "Last finger standing: tower " << *outcome.winnerId << "\n";
            }
            std::cout << "Transcript Merkle root: " << outcome.transcriptRoot << "\n";
        } else {
            std::cout << "No seed below " << searchCfg.seedBound << " produces that winner ("
                      << plan.probes << " probes). Running the fallback ending.\n";
            playCinematic(plan.chosenWinnerId);
            std::cout << "Last finger standing: tower " << plan.chosenWinnerId << "\n";
        }

        std::cout << "\n=== PROVABLY FAIR REVEAL ===\n";
        std::cout << "VRF public key: " << drawRng.getPublicKey() << "\n";
        std::cout << "VRF input (alpha): " << drawRng.getAlpha() << "\n";
        std::cout << "VRF proof: " << drawRng.getVrfProof() << "\n";
        std::cout << "VRF output: " << drawRng.getVrfOutput() << "\n";
        std::cout << "Client seed: " << drawRng.getClientSeed() << "\n";
        std::cout << "Nonce: " << drawRng.getNonce() << "\n";
        std::cout << "Calls consumed: " << drawRng.getCallCount() << "\n";
        bool ok = ProvablyFairRng::verify(
            drawRng.getVrfProof(), drawRng.getVrfOutput(), drawRng.getPublicKey(), drawRng.getAlpha());
        std::cout << "VRF verification: " << (ok ? "valid" : "INVALID") << "\n";
        std::cout << "Share output, proof, public key, matchId, client seed, nonce and player count to let others "
                     "audit with audit_match.\n";
    } catch (const std::exception& ex) {
        std::cerr << "Match failed: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
