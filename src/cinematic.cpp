#include "cinematic.hpp"

#include "deterministic_math.hpp"

#include <stdexcept>

namespace lf {

namespace {

CinematicPhase nextPhase(CinematicPhase phase) {
    switch (phase) {
    case CinematicPhase::Launch:
        return CinematicPhase::Descent;
    case CinematicPhase::Descent:
        return CinematicPhase::Impact;
    case CinematicPhase::Impact:
        return CinematicPhase::Aftermath;
    case CinematicPhase::Aftermath:
    case CinematicPhase::Finished:
        return CinematicPhase::Finished;
    }
    return CinematicPhase::Finished;
}

} // namespace

const char* cinematicPhaseName(CinematicPhase phase) {
    switch (phase) {
    case CinematicPhase::Launch:
        return "launch";
    case CinematicPhase::Descent:
        return "descent";
    case CinematicPhase::Impact:
        return "impact";
    case CinematicPhase::Aftermath:
        return "aftermath";
    case CinematicPhase::Finished:
        return "finished";
    }
    return "unknown";
}

FallbackCinematic::FallbackCinematic(std::uint32_t winnerId)
    : winnerId_(winnerId)
    , phase_(CinematicPhase::Launch)
    , phaseTime_(0.0)
    , enemiesEliminated_(false) {}

double FallbackCinematic::durationOf(CinematicPhase phase) {
    switch (phase) {
    case CinematicPhase::Launch:
        return kLaunchSeconds;
    case CinematicPhase::Descent:
        return kDescentSeconds;
    case CinematicPhase::Impact:
        return kImpactSeconds;
    case CinematicPhase::Aftermath:
        return kAftermathSeconds;
    case CinematicPhase::Finished:
        return 0.0;
    }
    return 0.0;
}

double FallbackCinematic::totalDuration() {
    return kLaunchSeconds + kDescentSeconds + kImpactSeconds + kAftermathSeconds;
}

double FallbackCinematic::phaseProgress() const {
    if (finished()) {
        return 1.0;
    }
    return DeterministicMath::clamp01(phaseTime_ / durationOf(phase_));
}

std::vector<CinematicEvent> FallbackCinematic::advance(double dt) {
    if (dt < 0.0) {
        throw std::invalid_argument("cinematic cannot run backwards");
    }

    std::vector<CinematicEvent> events;
    double remaining = dt;
    while (!finished()) {
        const double budget = durationOf(phase_) - phaseTime_;
        const double used = remaining < budget ? remaining : budget;
        phaseTime_ += used;
        remaining -= used;

        if (phase_ == CinematicPhase::Impact && !enemiesEliminated_ && phaseTime_ >= kEliminateAfterImpact) {
            enemiesEliminated_ = true;
            events.push_back(CinematicEvent::EnemiesEliminated);
        }

        if (phaseTime_ < durationOf(phase_)) {
            break;
        }
        phase_ = nextPhase(phase_);
        phaseTime_ = 0.0;
        if (finished()) {
            events.push_back(CinematicEvent::Finished);
        }
    }
    return events;
}

} // namespace lf
