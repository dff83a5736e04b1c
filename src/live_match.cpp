#include "live_match.hpp"

#include "deterministic_math.hpp"

#include <algorithm>
#include <stdexcept>

namespace lf {

const char* matchPhaseName(MatchPhase phase) {
    switch (phase) {
    case MatchPhase::Waiting:
        return "waiting";
    case MatchPhase::Countdown:
        return "countdown";
    case MatchPhase::Battle:
        return "battle";
    case MatchPhase::Cinematic:
        return "cinematic";
    case MatchPhase::Finished:
        return "finished";
    }
    return "unknown";
}

LiveMatch::LiveMatch(const LiveMatchConfig& cfg, RandomSource& drawSource)
    : config_(cfg)
    , drawSource_(drawSource)
    , phase_(MatchPhase::Waiting)
    , nextTowerId_(0)
    , elapsed_(0.0)
    , countdownStart_(0.0) {
    if (!(config_.arenaWidth > 0.0) || !(config_.arenaHeight > 0.0)) {
        throw std::invalid_argument("LiveMatchConfig arena dimensions must be positive");
    }
    if (config_.countdownSeconds < 0.0) {
        throw std::invalid_argument("LiveMatchConfig countdownSeconds must not be negative");
    }
}

void LiveMatch::reset() {
    phase_ = MatchPhase::Waiting;
    roster_.clear();
    nextTowerId_ = 0;
    snapshot_.reset();
    plan_.reset();
    engine_.reset();
    cinematic_.reset();
    winnerId_.reset();
}

Participant* LiveMatch::findParticipant(std::uint32_t id) {
    for (auto& p : roster_) {
        if (p.id == id) {
            return &p;
        }
    }
    return nullptr;
}

std::optional<std::uint32_t> LiveMatch::chosenWinnerId() const {
    if (!plan_) {
        return std::nullopt;
    }
    return plan_->chosenWinnerId;
}

double LiveMatch::countdownRemaining() const {
    if (phase_ != MatchPhase::Countdown) {
        return 0.0;
    }
    double remaining = config_.countdownSeconds - (elapsed_ - countdownStart_);
    return remaining > 0.0 ? remaining : 0.0;
}

void LiveMatch::refreshPrebattlePhase() {
    phase_ = roster_.size() >= 2 ? MatchPhase::Countdown : MatchPhase::Waiting;
}

std::optional<std::uint32_t> LiveMatch::place(double x, double y) {
    if (phase_ == MatchPhase::Finished) {
        reset();
    }
    if (phase_ != MatchPhase::Waiting && phase_ != MatchPhase::Countdown) {
        return std::nullopt;
    }

    const std::uint32_t id = nextTowerId_++;
    roster_.push_back(Participant{ id, x, y, paletteColor(roster_.size()), true });
    countdownStart_ = elapsed_;
    refreshPrebattlePhase();
    return id;
}

bool LiveMatch::move(std::uint32_t id, double x, double y) {
    if (phase_ != MatchPhase::Waiting && phase_ != MatchPhase::Countdown) {
        return false;
    }
    Participant* p = findParticipant(id);
    if (p == nullptr) {
        return false;
    }
    p->x = x;
    p->y = y;
    return true;
}

std::vector<LiveEvent> LiveMatch::lift(std::uint32_t id) {
    std::vector<LiveEvent> events;
    if (phase_ == MatchPhase::Waiting || phase_ == MatchPhase::Countdown) {
        roster_.erase(std::remove_if(roster_.begin(), roster_.end(), [id](const Participant& p) { return p.id == id; }),
                      roster_.end());
        refreshPrebattlePhase();
        return events;
    }

    Participant* p = findParticipant(id);
    if (p == nullptr) {
        return events;
    }
    p->present = false;

    if (phase_ == MatchPhase::Battle && engine_->presenceLost(id)) {
        reconcilePresence(events);
    }
    return events;
}

bool LiveMatch::restore(std::uint32_t id) {
    Participant* p = findParticipant(id);
    if (p == nullptr || p->present) {
        return false;
    }
    if (phase_ != MatchPhase::Battle) {
        p->present = true;
        return true;
    }
    if (!engine_->presenceRestored(id)) {
        return false;
    }
    p->present = true;
    return true;
}

std::optional<std::uint32_t> LiveMatch::reclaimNearest(double x, double y) {
    if (phase_ != MatchPhase::Battle) {
        return std::nullopt;
    }

    std::optional<std::uint32_t> nearest;
    double nearestDist = config_.reclaimRadius;
    for (const auto& tower : engine_->towers()) {
        if (!tower.alive() || tower.hasPresence()) {
            continue;
        }
        double d = DeterministicMath::distance(x, y, tower.x(), tower.y());
        if (d < nearestDist) {
            nearest = tower.id();
            nearestDist = d;
        }
    }
    if (nearest && restore(*nearest)) {
        return nearest;
    }
    return std::nullopt;
}

std::vector<LiveEvent> LiveMatch::update(double dt) {
    std::vector<LiveEvent> events;
    elapsed_ += dt;

    switch (phase_) {
    case MatchPhase::Waiting:
        refreshPrebattlePhase();
        break;
    case MatchPhase::Countdown:
        if (roster_.size() < 2) {
            phase_ = MatchPhase::Waiting;
        } else if (elapsed_ - countdownStart_ >= config_.countdownSeconds) {
            beginBattle(events);
        }
        break;
    case MatchPhase::Battle:
        stepBattle(events);
        break;
    case MatchPhase::Cinematic:
        stepCinematic(dt, events);
        break;
    case MatchPhase::Finished:
        break;
    }
    return events;
}

void LiveMatch::beginBattle(std::vector<LiveEvent>& events) {
    std::vector<SnapshotEntry> entries;
    entries.reserve(roster_.size());
    for (const auto& p : roster_) {
        entries.push_back(SnapshotEntry{ p.id, p.x, p.y, p.color });
    }
    snapshot_.emplace(config_.arenaWidth, config_.arenaHeight, std::move(entries));
    plan_ = planMatch(*snapshot_, drawSource_, config_.search);

    BattleConfig liveCfg = config_.search.battle;
    liveCfg.recordTranscript = config_.recordTranscript;

    if (plan_->seed) {
        engine_ = std::make_unique<BattleEngine>(*snapshot_, *plan_->seed, liveCfg);
        phase_ = MatchPhase::Battle;
        events.push_back(LiveEvent{ LiveEventType::BattleStarted, plan_->chosenWinnerId, plan_->seed });
        return;
    }

    // Towers for the cinematic to act on; this engine is never stepped.
    engine_ = std::make_unique<BattleEngine>(*snapshot_, 0, liveCfg);
    startCinematic(plan_->chosenWinnerId, events);
}

void LiveMatch::startCinematic(std::uint32_t winnerId, std::vector<LiveEvent>& events) {
    cinematic_ = std::make_unique<FallbackCinematic>(winnerId);
    phase_ = MatchPhase::Cinematic;
    events.push_back(LiveEvent{ LiveEventType::FallbackStarted, winnerId, std::nullopt });
}

void LiveMatch::stepBattle(std::vector<LiveEvent>& events) {
    BattleStatus status = engine_->step();
    if (status == BattleStatus::Winner) {
        const Participant* p = findParticipant(*engine_->winnerId());
        if (p != nullptr && !p->present) {
            // Last tower standing has no finger on it.
            abortBattle(events);
        } else {
            finish(*engine_->winnerId(), events);
        }
    } else if (status == BattleStatus::Undecided) {
        // Only reachable after presence changes diverged from the headless run.
        const Tower* chosen = engine_->findTower(plan_->chosenWinnerId);
        if (chosen != nullptr && chosen->alive() && chosen->hasPresence()) {
            startCinematic(plan_->chosenWinnerId, events);
        } else {
            abortBattle(events);
        }
    } else if (engine_->viableCount() < 2) {
        // A kill while another finger is up.
        reconcilePresence(events);
    }
}

void LiveMatch::stepCinematic(double dt, std::vector<LiveEvent>& events) {
    for (CinematicEvent ev : cinematic_->advance(dt)) {
        switch (ev) {
        case CinematicEvent::EnemiesEliminated:
            engine_->concede(cinematic_->winnerId());
            break;
        case CinematicEvent::Finished:
            finish(cinematic_->winnerId(), events);
            break;
        }
    }
}

void LiveMatch::reconcilePresence(std::vector<LiveEvent>& events) {
    if (engine_->viableCount() >= 2) {
        return;
    }

    const std::uint32_t chosen = plan_->chosenWinnerId;
    const Tower* chosenTower = engine_->findTower(chosen);
    if (engine_->viableCount() == 1 && chosenTower != nullptr && chosenTower->alive() &&
        chosenTower->hasPresence()) {
        engine_->concede(chosen);
        finish(chosen, events);
        return;
    }
    abortBattle(events);
}

void LiveMatch::abortBattle(std::vector<LiveEvent>& events) {
    engine_.reset();
    cinematic_.reset();
    snapshot_.reset();
    plan_.reset();
    roster_.erase(std::remove_if(roster_.begin(), roster_.end(), [](const Participant& p) { return !p.present; }),
                  roster_.end());
    countdownStart_ = elapsed_;
    refreshPrebattlePhase();
    events.push_back(LiveEvent{ LiveEventType::BattleAborted, std::nullopt, std::nullopt });
}

void LiveMatch::finish(std::uint32_t winnerId, std::vector<LiveEvent>& events) {
    winnerId_ = winnerId;
    phase_ = MatchPhase::Finished;
    events.push_back(LiveEvent{ LiveEventType::WinnerDecided, winnerId, plan_ ? plan_->seed : std::nullopt });
}

} // namespace lf
