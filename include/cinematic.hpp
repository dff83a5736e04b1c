#pragma once

#include <cstdint>
#include <vector>

namespace lf {

enum class CinematicPhase {
    Launch,
    Descent,
    Impact,
    Aftermath,
    Finished
};

enum class CinematicEvent {
    EnemiesEliminated,
    Finished
};

const char* cinematicPhaseName(CinematicPhase phase);

// Scripted ending used when no seed produces the chosen winner. It only knows
// the winner id; the host applies the events to its own towers.
class FallbackCinematic {
public:
    static constexpr double kLaunchSeconds = 1.5;
    static constexpr double kDescentSeconds = 1.2;
    static constexpr double kImpactSeconds = 2.0;
    static constexpr double kAftermathSeconds = 1.5;
    static constexpr double kEliminateAfterImpact = 0.3;

    explicit FallbackCinematic(std::uint32_t winnerId);

    std::vector<CinematicEvent> advance(double dt);

    std::uint32_t winnerId() const { return winnerId_; }
    CinematicPhase phase() const { return phase_; }
    double phaseTime() const { return phaseTime_; }
    // 0..1 through the current phase; 1 once finished.
    double phaseProgress() const;
    bool enemiesEliminated() const { return enemiesEliminated_; }
    bool finished() const { return phase_ == CinematicPhase::Finished; }

    static double durationOf(CinematicPhase phase);
    static double totalDuration();

private:
    std::uint32_t winnerId_;
    CinematicPhase phase_;
    double phaseTime_;
    bool enemiesEliminated_;
};

} // namespace lf
