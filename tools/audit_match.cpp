#include "battle.hpp"
#include "cli_args.hpp"
#include "rng.hpp"
#include "seed_search.hpp"
#include "snapshot.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 7) {
        std::cerr << "Usage: audit_match <vrfOutputHex> <vrfProofHex> <publicKeyHex> <matchId> <clientSeed> <nonce> "
                     "[players] [seedBound]\n";
        return 1;
    }

    std::string vrfOutput = argv[1];
    std::string vrfProof = argv[2];
    std::string publicKey = argv[3];
    std::string matchId = argv[4];
    std::string clientSeed = argv[5];
    constexpr std::uint64_t kMaxPlayers = 64;
    auto nonce = lf::parseUnsigned(argv[6], std::numeric_limits<std::uint64_t>::max());
    auto players = lf::parseUnsigned(argc > 7 ? argv[7] : "4", kMaxPlayers);
    auto seedBound = argc > 8 ? lf::parseUnsigned(argv[8], std::numeric_limits<std::uint32_t>::max())
                              : std::optional<std::uint64_t>(lf::SeedSearchConfig{}.seedBound);
    if (!nonce || !players || !seedBound) {
        std::cerr << "nonce, players (up to " << kMaxPlayers
                  << ") and seedBound (up to 4294967295) must be unsigned decimal integers\n";
        return 1;
    }
    lf::SeedSearchConfig searchCfg;
    searchCfg.seedBound = static_cast<std::uint32_t>(*seedBound);

    if (*players < 1) {
        std::cerr << "players must be at least 1\n";
        return 1;
    }

    try {
        lf::MatchSnapshot snapshot = lf::ringSnapshot(static_cast<std::size_t>(*players));
        lf::ProvablyFairRng rng(vrfOutput, vrfProof, publicKey, matchId, snapshot.digest(), clientSeed, *nonce);

        bool ok = lf::ProvablyFairRng::verify(vrfProof, vrfOutput, publicKey, rng.getAlpha());
        std::cout << "VRF verification: " << (ok ? "valid" : "INVALID") << '\n';
        std::cout << "Snapshot digest: " << snapshot.digest() << '\n';

        lf::MatchPlan plan = lf::planMatch(snapshot, rng, searchCfg);
        std::cout << "Chosen winner: " << plan.chosenWinnerId << " (index " << plan.chosenIndex << " of "
                  << snapshot.size() << ")\n";

        if (plan.soleCombatant) {
            std::cout << "Sole combatant, no battle.\n";
            return 0;
        }
        if (!plan.seed) {
            std::cout << "No seed below " << searchCfg.seedBound << " (" << plan.probes
                      << " probes); match was settled by the fallback ending.\n";
            return 0;
        }

        lf::BattleConfig replayCfg = searchCfg.battle;
        replayCfg.recordTranscript = true;
        lf::BattleOutcome outcome = lf::simulateBattle(snapshot, *plan.seed, replayCfg);
        std::cout << "Battle seed: " << *plan.seed << '\n';
        std::cout << "Replay: " << lf::battleStatusName(outcome.status) << " after " << outcome.ticks << " ticks\n";
        if (outcome.winnerId) {
            std::cout << "Replay winner: " << *outcome.winnerId << '\n';
        }
        std::cout << "Transcript Merkle root: " << outcome.transcriptRoot << '\n';

        if (!ok || !outcome.winnerId || *outcome.winnerId != plan.chosenWinnerId) {
            std::cerr << "Audit FAILED\n";
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Audit error: " << ex.what() << '\n';
        return 1;
    }

    std::cout << "Audit passed.\n";
    return 0;
}
