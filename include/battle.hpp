#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "bullet.hpp"
#include "rng.hpp"
#include "snapshot.hpp"
#include "tower.hpp"
#include "transcript_log.hpp"

namespace lf {

struct BattleConfig {
    double tickSeconds = 1.0 / 60.0;
    double escalationSeconds = 3.0;
    double homingStartSeconds = 10.0;
    double volleySeconds = 1.5;
    std::size_t maxTicks = 3600;
    int maxHealth = 3;

    // Off for seed probes; the live replay and audits turn it on.
    bool recordTranscript = false;
    std::size_t transcriptInterval = 60;
};

enum class BattleStatus {
    Running,
    Winner,
    Undecided,
    NoContest
};

const char* battleStatusName(BattleStatus status);

struct BattleOutcome {
    BattleStatus status = BattleStatus::Running;
    std::optional<std::uint32_t> winnerId;
    std::size_t ticks = 0;
    std::string transcriptRoot;
};

// One battle attempt over a snapshot. The only randomness is the SeededRng built
// from `seed`, so (snapshot, seed, config) fully determines every tick.
class BattleEngine {
public:
    BattleEngine(const MatchSnapshot& snapshot, std::uint32_t seed, const BattleConfig& cfg = {});

    BattleStatus step();

    bool presenceLost(std::uint32_t towerId);
    bool presenceRestored(std::uint32_t towerId);
    // Scripted ending: every other tower is eliminated and the winner crowned.
    void concede(std::uint32_t winnerId);
    void injectBullet(const Bullet& bullet);

    BattleStatus status() const { return status_; }
    bool running() const { return status_ == BattleStatus::Running; }
    std::optional<std::uint32_t> winnerId() const { return winnerId_; }
    std::uint32_t seed() const { return seed_; }
    std::size_t tick() const { return tick_; }
    double elapsed() const { return static_cast<double>(tick_) * config_.tickSeconds; }
    bool homingActive() const { return homingActive_; }
    double arenaWidth() const { return arenaWidth_; }
    double arenaHeight() const { return arenaHeight_; }
    const BattleConfig& config() const { return config_; }

    const std::vector<Tower>& towers() const { return towers_; }
    const std::vector<Bullet>& bullets() const { return bullets_; }
    const Tower* findTower(std::uint32_t towerId) const;
    std::size_t aliveCount() const;
    // Alive and still held by a finger.
    std::size_t viableCount() const;

    const TranscriptLog& transcript() const { return transcript_; }
    BattleOutcome outcome() const;

private:
    Tower* findTowerMutable(std::uint32_t towerId);
    void escalate();
    void fireVolley();
    void fireHoming(const Tower& shooter);
    void advanceTowers();
    void advanceBullets();
    void checkTermination();
    void declareWinner(Tower& winner);
    void recordDeath(Tower& tower);
    void appendCheckpoint();

    double arenaWidth_;
    double arenaHeight_;
    BattleConfig config_;
    std::uint32_t seed_;
    SeededRng rng_;
    std::vector<Tower> towers_;
    std::vector<Bullet> bullets_;

    BattleStatus status_;
    std::optional<std::uint32_t> winnerId_;
    std::size_t tick_;
    std::size_t escalationTicks_;
    std::size_t homingStartTicks_;
    std::size_t volleyTicks_;
    std::size_t lastEscalationTick_;
    std::size_t nextVolleyTick_;
    bool homingActive_;
    std::uint32_t deathCounter_;
    TranscriptLog transcript_;
};

using BattleTickCallback = std::function<void(const BattleEngine& engine)>;

// Headless run to completion.
BattleOutcome simulateBattle(const MatchSnapshot& snapshot,
                             std::uint32_t seed,
                             const BattleConfig& cfg = {},
                             const BattleTickCallback& onTick = nullptr);

} // namespace lf
