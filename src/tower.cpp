#include "tower.hpp"

#include "deterministic_math.hpp"
#include "rng.hpp"

#include <cassert>
#include <cmath>
#include <stdexcept>

namespace lf {

namespace {

double drawRange(RandomSource& rng, double min, double max) {
    return min + rng.uniform01() * (max - min);
}

double decay(double timer, double dt) {
    timer -= dt;
    return timer > 0.0 ? timer : 0.0;
}

} // namespace

const char* towerStateName(TowerState state) {
    switch (state) {
    case TowerState::Spawning:
        return "spawning";
    case TowerState::Active:
        return "active";
    case TowerState::Withdrawing:
        return "withdrawing";
    case TowerState::Dead:
        return "dead";
    case TowerState::Winner:
        return "winner";
    }
    return "unknown";
}

double Cannon::aimAngle() const {
    return orbitAngle + DeterministicMath::kHalfPi * std::sin(sweepPhase);
}

double Cannon::scale() const {
    return DeterministicMath::easeOutBack(spawnProgress);
}

Tower::Tower(std::uint32_t id, double x, double y, std::uint32_t color, int maxHealth)
    : id_(id)
    , x_(x)
    , y_(y)
    , color_(color)
    , maxHealth_(maxHealth)
    , health_(maxHealth)
    , state_(TowerState::Spawning)
    , spawnProgress_(0.0)
    , presence_(1.0)
    , flashTimer_(0.0)
    , shakeTimer_(0.0)
    , lastCannonAddTime_(0.0)
    , deathOrder_(0) {
    if (maxHealth <= 0) {
        throw std::invalid_argument("Tower max health must be positive");
    }
}

void Tower::finishSpawn() {
    spawnProgress_ = 1.0;
    if (state_ == TowerState::Spawning) {
        state_ = TowerState::Active;
    }
}

void Tower::addCannon(double elapsed, RandomSource& rng) {
    Cannon cannon{};
    if (cannons_.empty()) {
        cannon.orbitAngle = drawRange(rng, 0.0, DeterministicMath::kTwoPi);
    } else {
        const double step = DeterministicMath::kTwoPi / static_cast<double>(cannons_.size() + 1);
        cannon.orbitAngle = cannons_.back().orbitAngle + step;
    }
    const double orbitMagnitude = drawRange(rng, 1.5, 3.0);
    const double orbitSign = rng.uniform01() > 0.5 ? 1.0 : -1.0;
    cannon.orbitSpeed = orbitMagnitude * orbitSign;
    cannon.sweepPhase = drawRange(rng, 0.0, DeterministicMath::kTwoPi);
    cannon.sweepSpeed = drawRange(rng, 1.5, 4.0);
    cannon.fireTimer = drawRange(rng, 0.1, 0.8);
    cannon.fireInterval = drawRange(rng, 0.4, 1.0);
    cannon.spawnProgress = 0.0;

    cannons_.push_back(cannon);
    lastCannonAddTime_ = elapsed;
}

std::vector<FireEvent> Tower::tick(double dt) {
    std::vector<FireEvent> fires;
    if (!alive()) {
        return fires;
    }

    spawnProgress_ = DeterministicMath::clamp01(spawnProgress_ + dt / kSpawnSeconds);
    if (state_ == TowerState::Spawning && spawnProgress_ >= 1.0) {
        state_ = TowerState::Active;
    }

    if (state_ == TowerState::Withdrawing) {
        presence_ -= dt / kWithdrawSeconds;
        if (presence_ <= 0.0) {
            presence_ = 0.0;
            die();
            return fires;
        }
    } else if (presence_ < 1.0) {
        presence_ = DeterministicMath::clamp01(presence_ + dt / kRestoreSeconds);
    }

    flashTimer_ = decay(flashTimer_, dt);
    shakeTimer_ = decay(shakeTimer_, dt);

    const bool fighting = canFight();
    for (auto& c : cannons_) {
        c.spawnProgress = DeterministicMath::clamp01(c.spawnProgress + dt / kCannonSpawnSeconds);
        c.orbitAngle += c.orbitSpeed * dt;
        c.sweepPhase += c.sweepSpeed * dt;

        if (!c.armed() || !fighting) {
            continue;
        }
        c.fireTimer -= dt;
        if (c.fireTimer <= 0.0) {
            c.fireTimer = c.fireInterval;
            fires.push_back(FireEvent{ x_ + std::cos(c.orbitAngle) * kRadius,
                                       y_ + std::sin(c.orbitAngle) * kRadius,
                                       c.aimAngle() });
        }
    }

    return fires;
}

bool Tower::hit() {
    if (!alive() || invincible()) {
        return false;
    }

    health_ -= 1;
    flashTimer_ = kFlashSeconds;
    shakeTimer_ = kShakeSeconds;
    if (health_ <= 0) {
        health_ = 0;
        die();
    }
    assert(health_ >= 0);
    return true;
}

void Tower::presenceLost() {
    if (state_ == TowerState::Spawning || state_ == TowerState::Active) {
        state_ = TowerState::Withdrawing;
    }
}

void Tower::presenceRestored() {
    if (state_ == TowerState::Withdrawing) {
        state_ = spawnProgress_ >= 1.0 ? TowerState::Active : TowerState::Spawning;
    }
}

void Tower::crown() {
    if (!alive()) {
        revive();
    }
    state_ = TowerState::Winner;
    presence_ = 1.0;
}

void Tower::revive() {
    if (alive()) {
        return;
    }
    health_ = 1;
    presence_ = 1.0;
    state_ = spawnProgress_ >= 1.0 ? TowerState::Active : TowerState::Spawning;
}

void Tower::eliminate() {
    if (alive() && !invincible()) {
        die();
    }
}

double Tower::spawnScale() const {
    return DeterministicMath::easeOutBack(spawnProgress_);
}

double Tower::visualRadius() const {
    return kRadius * spawnScale() * presence_;
}

double Tower::cannonX(std::size_t index) const {
    return x_ + std::cos(cannons_.at(index).orbitAngle) * kRadius;
}

double Tower::cannonY(std::size_t index) const {
    return y_ + std::sin(cannons_.at(index).orbitAngle) * kRadius;
}

void Tower::die() {
    state_ = TowerState::Dead;
    health_ = 0;
    cannons_.clear();
}

} // namespace lf
