#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace lf {

class RandomSource;

enum class TowerState {
    Spawning,
    Active,
    Withdrawing,
    Dead,
    Winner
};

const char* towerStateName(TowerState state);

struct Cannon {
    double orbitAngle;  // position on the tower perimeter
    double orbitSpeed;  // signed, radians per second
    double sweepPhase;
    double sweepSpeed;
    double fireTimer;
    double fireInterval;
    double spawnProgress;

    // Within +/-90 degrees of the outward radial.
    double aimAngle() const;
    double scale() const;
    bool armed() const { return spawnProgress >= 1.0; }
};

struct FireEvent {
    double x;
    double y;
    double angle;
};

class Tower {
public:
    static constexpr double kRadius = 40.0;
    static constexpr double kSpawnSeconds = 0.2;
    static constexpr double kCannonSpawnSeconds = 0.4;
    static constexpr double kWithdrawSeconds = 1.5;
    static constexpr double kRestoreSeconds = 0.3;
    static constexpr double kFightPresence = 0.5;
    static constexpr double kTargetPresence = 0.3;
    static constexpr double kFlashSeconds = 0.1;
    static constexpr double kShakeSeconds = 0.2;

    Tower(std::uint32_t id, double x, double y, std::uint32_t color, int maxHealth);

    // Skips the spawn-in animation; towers enter a battle already placed.
    void finishSpawn();
    void addCannon(double elapsed, RandomSource& rng);
    std::vector<FireEvent> tick(double dt);
    bool hit();

    void presenceLost();
    void presenceRestored();
    void crown();
    void revive();
    void eliminate();

    std::uint32_t id() const { return id_; }
    double x() const { return x_; }
    double y() const { return y_; }
    std::uint32_t color() const { return color_; }
    int health() const { return health_; }
    int maxHealth() const { return maxHealth_; }
    TowerState state() const { return state_; }
    double presence() const { return presence_; }
    double spawnScale() const;
    double visualRadius() const;
    double flashTimer() const { return flashTimer_; }
    double shakeTimer() const { return shakeTimer_; }
    double lastCannonAddTime() const { return lastCannonAddTime_; }
    const std::vector<Cannon>& cannons() const { return cannons_; }

    double cannonX(std::size_t index) const;
    double cannonY(std::size_t index) const;

    bool alive() const { return state_ != TowerState::Dead; }
    bool invincible() const { return state_ == TowerState::Winner; }
    bool hasPresence() const { return state_ != TowerState::Withdrawing; }
    bool canFight() const { return alive() && presence_ >= kFightPresence; }
    bool targetable() const { return alive() && !invincible() && presence_ >= kTargetPresence; }

    std::uint32_t deathOrder() const { return deathOrder_; }
    void setDeathOrder(std::uint32_t order) { deathOrder_ = order; }

private:
    void die();

    std::uint32_t id_;
    double x_;
    double y_;
    std::uint32_t color_;
    int maxHealth_;
    int health_;
    TowerState state_;
    double spawnProgress_;
    double presence_;
    double flashTimer_;
    double shakeTimer_;
    double lastCannonAddTime_;
    std::uint32_t deathOrder_;
    std::vector<Cannon> cannons_;
};

} // namespace lf
