#include "deterministic_math.hpp"
#include "rng.hpp"
#include "tower.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr double kDt = 1.0 / 60.0;

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "tower_test failure: " << msg << std::endl;
    std::exit(1);
}

std::size_t runFor(lf::Tower& tower, int ticks) {
    std::size_t fired = 0;
    for (int i = 0; i < ticks; ++i) {
        fired += tower.tick(kDt).size();
    }
    return fired;
}

void checkLifecycle() {
    lf::Tower tower(3, 200.0, 200.0, 0xFF6B6B, 3);
    if (tower.state() != lf::TowerState::Spawning || tower.health() != 3) {
        fail("fresh tower should be spawning with full health");
    }
    runFor(tower, 13);
    if (tower.state() != lf::TowerState::Active) {
        fail("tower did not finish spawning after 0.2 s");
    }
    if (std::abs(tower.visualRadius() - lf::Tower::kRadius) > 1e-9) {
        fail("spawned tower radius mismatch");
    }

    lf::Tower placed(4, 100.0, 100.0, 0xFFEAA7, 3);
    placed.finishSpawn();
    if (placed.state() != lf::TowerState::Active || placed.spawnScale() != 1.0) {
        fail("finishSpawn did not skip the spawn-in");
    }

    if (!tower.hit() || tower.health() != 2 || tower.flashTimer() <= 0.0 || tower.shakeTimer() <= 0.0) {
        fail("hit did not cost one health and start feedback timers");
    }
    tower.hit();
    if (!tower.hit()) {
        fail("lethal hit was not applied");
    }
    if (tower.alive() || tower.health() != 0 || tower.state() != lf::TowerState::Dead) {
        fail("tower at zero health is not dead");
    }
    if (tower.hit()) {
        fail("dead tower took another hit");
    }
    if (!tower.tick(kDt).empty()) {
        fail("dead tower fired");
    }

    tower.crown();
    if (!tower.alive() || !tower.invincible() || tower.health() != 1) {
        fail("crowning a dead tower should revive it with 1 health");
    }
    if (tower.hit() || tower.health() != 1) {
        fail("winner took damage");
    }

    bool threw = false;
    try {
        lf::Tower bad(0, 0.0, 0.0, 0, 0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        fail("non-positive max health was accepted");
    }
}

void checkCannons() {
    lf::SeededRng rng(5);
    lf::SeededRng mirror(5);
    lf::Tower tower(0, 300.0, 300.0, 0x4ECDC4, 3);

    tower.addCannon(0.0, rng);
    for (int i = 0; i < 7; ++i) {
        mirror.next();
    }
    if (rng.next() != mirror.next()) {
        fail("first cannon should consume exactly seven draws");
    }

    tower.addCannon(3.0, rng);
    for (int i = 0; i < 6; ++i) {
        mirror.next();
    }
    if (rng.next() != mirror.next()) {
        fail("later cannons should consume exactly six draws");
    }
    if (tower.cannons().size() != 2 || tower.lastCannonAddTime() != 3.0) {
        fail("cannon bookkeeping mismatch");
    }

    for (const auto& c : tower.cannons()) {
        double speed = std::abs(c.orbitSpeed);
        if (speed < 1.5 || speed > 3.0) {
            fail("orbit speed outside [1.5, 3]");
        }
        if (c.fireInterval < 0.4 || c.fireInterval > 1.0) {
            fail("fire interval outside [0.4, 1]");
        }
    }

    // Not armed until the spawn-in completes.
    if (runFor(tower, 23) != 0) {
        fail("cannon fired before it was armed");
    }

    std::size_t fired = 0;
    for (int i = 0; i < 600; ++i) {
        for (const auto& fire : tower.tick(kDt)) {
            ++fired;
            double r = lf::DeterministicMath::distance(tower.x(), tower.y(), fire.x, fire.y);
            if (std::abs(r - lf::Tower::kRadius) > 1e-9) {
                fail("fire event not on the tower perimeter");
            }
        }
        for (const auto& c : tower.cannons()) {
            if (std::abs(c.aimAngle() - c.orbitAngle) > lf::DeterministicMath::kHalfPi + 1e-12) {
                fail("aim left the outward half-plane");
            }
        }
    }
    if (fired == 0) {
        fail("armed cannons never fired");
    }
}

void checkPresence() {
    lf::SeededRng rng(11);
    lf::Tower tower(1, 400.0, 300.0, 0x45B7D1, 3);
    tower.addCannon(0.0, rng);
    tower.addCannon(0.0, rng);
    runFor(tower, 30);

    tower.presenceLost();
    if (tower.state() != lf::TowerState::Withdrawing || tower.hasPresence()) {
        fail("presence loss did not start withdrawing");
    }

    // 0.8 s in: below the fight threshold, still targetable.
    runFor(tower, 48);
    if (tower.canFight() || !tower.targetable() || !tower.alive()) {
        fail("withdrawing tower at ~0.47 presence should be targetable but not fighting");
    }
    if (runFor(tower, 1) != 0) {
        fail("tower below the fight threshold fired");
    }

    // 1.1 s in: no longer targetable.
    runFor(tower, 17);
    if (tower.targetable() || !tower.alive()) {
        fail("tower at ~0.27 presence should be alive but untargetable");
    }

    tower.presenceRestored();
    if (tower.state() != lf::TowerState::Active) {
        fail("restored tower did not return to active");
    }
    runFor(tower, 20);
    if (tower.presence() != 1.0 || !tower.canFight()) {
        fail("presence did not recover within 0.3 s");
    }
    if (tower.cannons().size() != 2) {
        fail("restored tower lost its cannons");
    }

    tower.presenceLost();
    runFor(tower, 95);
    if (tower.alive() || tower.presence() != 0.0 || !tower.cannons().empty()) {
        fail("tower survived a full 1.5 s withdrawal");
    }
}

} // namespace

int main() {
    checkLifecycle();
    checkCannons();
    checkPresence();
    std::cout << "Tower checks passed.\n";
    return 0;
}
