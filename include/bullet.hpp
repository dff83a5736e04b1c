#pragma once

#include <cstdint>

namespace lf {

class Tower;

class Bullet {
public:
    static constexpr double kSpeed = 360.0;
    static constexpr double kRadius = 5.0;
    static constexpr double kHomingSpeed = 264.0;
    static constexpr double kHomingRadius = 7.0;
    static constexpr double kTurnRate = 4.0; // radians per second
    static constexpr double kBoundsMargin = 50.0;

    Bullet(double x, double y, double angle, std::uint32_t ownerId, bool homing = false);

    void setTarget(double tx, double ty);
    // Permanent: the bullet keeps its current heading from now on.
    void stopHoming() { homing_ = false; }
    void update(double dt, double arenaWidth, double arenaHeight);
    bool collides(const Tower& tower) const;
    void destroy() { alive_ = false; }

    double x() const { return x_; }
    double y() const { return y_; }
    double vx() const { return vx_; }
    double vy() const { return vy_; }
    double heading() const;
    double radius() const { return radius_; }
    double speed() const { return speed_; }
    std::uint32_t ownerId() const { return ownerId_; }
    bool homing() const { return homing_; }
    bool alive() const { return alive_; }
    double targetX() const { return targetX_; }
    double targetY() const { return targetY_; }

private:
    double x_;
    double y_;
    double vx_;
    double vy_;
    double radius_;
    double speed_;
    std::uint32_t ownerId_;
    bool homing_;
    bool alive_;
    double targetX_;
    double targetY_;
};

} // namespace lf
