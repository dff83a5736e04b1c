#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "battle.hpp"
#include "cinematic.hpp"
#include "rng.hpp"
#include "seed_search.hpp"
#include "snapshot.hpp"

namespace lf {

enum class MatchPhase {
    Waiting,
    Countdown,
    Battle,
    Cinematic,
    Finished
};

const char* matchPhaseName(MatchPhase phase);

struct LiveMatchConfig {
    double arenaWidth = 800.0;
    double arenaHeight = 600.0;
    double countdownSeconds = 3.0;
    // Fingers landing this close to a withdrawing tower reclaim it.
    double reclaimRadius = 100.0;
    bool recordTranscript = true;
    SeedSearchConfig search{};
};

enum class LiveEventType {
    BattleStarted,
    FallbackStarted,
    BattleAborted,
    WinnerDecided
};

struct LiveEvent {
    LiveEventType type;
    std::optional<std::uint32_t> towerId;
    std::optional<std::uint32_t> seed;
};

struct Participant {
    std::uint32_t id;
    double x;
    double y;
    std::uint32_t color;
    bool present;
};

// Drives one local match from placement to a decided winner. The host calls
// update() once per fixed tick; during Battle each call is exactly one engine
// step, so a run without presence changes replays the headless run exactly.
class LiveMatch {
public:
    LiveMatch(const LiveMatchConfig& cfg, RandomSource& drawSource);

    std::optional<std::uint32_t> place(double x, double y);
    bool move(std::uint32_t id, double x, double y);
    std::vector<LiveEvent> lift(std::uint32_t id);
    bool restore(std::uint32_t id);
    std::optional<std::uint32_t> reclaimNearest(double x, double y);
    std::vector<LiveEvent> update(double dt);
    void reset();

    MatchPhase phase() const { return phase_; }
    const LiveMatchConfig& config() const { return config_; }
    const std::vector<Participant>& participants() const { return roster_; }
    const BattleEngine* engine() const { return engine_.get(); }
    const FallbackCinematic* cinematic() const { return cinematic_.get(); }
    const std::optional<MatchSnapshot>& snapshot() const { return snapshot_; }
    const std::optional<MatchPlan>& plan() const { return plan_; }
    std::optional<std::uint32_t> chosenWinnerId() const;
    std::optional<std::uint32_t> winnerId() const { return winnerId_; }
    std::size_t battleTicks() const { return engine_ ? engine_->tick() : 0; }
    double countdownRemaining() const;

private:
    Participant* findParticipant(std::uint32_t id);
    void refreshPrebattlePhase();
    void beginBattle(std::vector<LiveEvent>& events);
    void startCinematic(std::uint32_t winnerId, std::vector<LiveEvent>& events);
    void reconcilePresence(std::vector<LiveEvent>& events);
    void abortBattle(std::vector<LiveEvent>& events);
    void finish(std::uint32_t winnerId, std::vector<LiveEvent>& events);
    void stepBattle(std::vector<LiveEvent>& events);
    void stepCinematic(double dt, std::vector<LiveEvent>& events);

    LiveMatchConfig config_;
    RandomSource& drawSource_;
    MatchPhase phase_;
    std::vector<Participant> roster_;
    std::uint32_t nextTowerId_;
    double elapsed_;
    double countdownStart_;
    std::optional<MatchSnapshot> snapshot_;
    std::optional<MatchPlan> plan_;
    std::unique_ptr<BattleEngine> engine_;
    std::unique_ptr<FallbackCinematic> cinematic_;
    std::optional<std::uint32_t> winnerId_;
};

} // namespace lf
