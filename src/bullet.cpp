#include "bullet.hpp"

#include "deterministic_math.hpp"
#include "tower.hpp"

#include <algorithm>
#include <cmath>

namespace lf {

Bullet::Bullet(double x, double y, double angle, std::uint32_t ownerId, bool homing)
    : x_(x)
    , y_(y)
    , radius_(homing ? kHomingRadius : kRadius)
    , speed_(homing ? kHomingSpeed : kSpeed)
    , ownerId_(ownerId)
    , homing_(homing)
    , alive_(true)
    , targetX_(x)
    , targetY_(y) {
    vx_ = std::cos(angle) * speed_;
    vy_ = std::sin(angle) * speed_;
}

void Bullet::setTarget(double tx, double ty) {
    targetX_ = tx;
    targetY_ = ty;
}

double Bullet::heading() const {
    return std::atan2(vy_, vx_);
}

void Bullet::update(double dt, double arenaWidth, double arenaHeight) {
    if (homing_) {
        const double desired = DeterministicMath::angleBetween(x_, y_, targetX_, targetY_);
        const double current = heading();
        const double diff = DeterministicMath::wrapAngle(desired - current);
        const double maxTurn = kTurnRate * dt;
        double steer = std::min(std::abs(diff), maxTurn);
        if (diff < 0.0) {
            steer = -steer;
        }
        const double next = current + steer;
        vx_ = std::cos(next) * speed_;
        vy_ = std::sin(next) * speed_;
    }

    x_ += vx_ * dt;
    y_ += vy_ * dt;

    if (x_ < -kBoundsMargin || x_ > arenaWidth + kBoundsMargin || y_ < -kBoundsMargin ||
        y_ > arenaHeight + kBoundsMargin) {
        alive_ = false;
    }
}

bool Bullet::collides(const Tower& tower) const {
    if (!alive_ || tower.id() == ownerId_ || !tower.targetable()) {
        return false;
    }
    const double d = DeterministicMath::distance(x_, y_, tower.x(), tower.y());
    return d < tower.visualRadius() + radius_;
}

} // namespace lf
