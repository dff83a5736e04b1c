#include "battle.hpp"
#include "bullet.hpp"
#include "snapshot.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

[[noreturn]] void fail(const std::string& msg) {
    std::cerr << "battle_test failure: " << msg << std::endl;
    std::exit(1);
}

lf::MatchSnapshot duel(std::uint32_t a, std::uint32_t b) {
    return lf::MatchSnapshot(800.0, 600.0,
                             { lf::SnapshotEntry{ a, 100.0, 300.0, lf::paletteColor(0) },
                               lf::SnapshotEntry{ b, 500.0, 300.0, lf::paletteColor(1) } });
}

lf::BattleConfig sturdyConfig(std::size_t maxTicks) {
    lf::BattleConfig cfg;
    cfg.maxHealth = 1000;
    cfg.maxTicks = maxTicks;
    return cfg;
}

void checkDegenerate() {
    lf::MatchSnapshot empty(800.0, 600.0, {});
    lf::BattleEngine none(empty, 1);
    if (none.status() != lf::BattleStatus::NoContest || none.step() != lf::BattleStatus::NoContest ||
        none.tick() != 0) {
        fail("empty snapshot should be a no-contest");
    }

    lf::MatchSnapshot solo(800.0, 600.0, { lf::SnapshotEntry{ 42, 400.0, 300.0, lf::paletteColor(0) } });
    auto outcome = lf::simulateBattle(solo, 1234);
    if (outcome.status != lf::BattleStatus::Winner || outcome.winnerId != 42u || outcome.ticks != 0) {
        fail("single tower should win at tick 0");
    }

    bool threw = false;
    try {
        lf::BattleConfig bad;
        bad.tickSeconds = 0.0;
        lf::BattleEngine engine(duel(0, 1), 1, bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        fail("zero tick length was accepted");
    }
}

// Both towers take a lethal hit in the same bullet pass. The one hit second
// carries the higher death order and is revived as the winner.
void checkDeathOrderTieBreak(bool firstShooterWins) {
    lf::BattleConfig cfg;
    cfg.maxHealth = 1;
    lf::BattleEngine engine(duel(7, 9), 3, cfg);

    lf::Bullet atNine(500.0, 300.0, 0.0, 7);
    lf::Bullet atSeven(100.0, 300.0, 0.0, 9);
    if (firstShooterWins) {
        engine.injectBullet(atNine);
        engine.injectBullet(atSeven);
    } else {
        engine.injectBullet(atSeven);
        engine.injectBullet(atNine);
    }

    if (engine.step() != lf::BattleStatus::Winner || engine.tick() != 1) {
        fail("simultaneous elimination did not end the battle on tick 1");
    }
    const std::uint32_t expected = firstShooterWins ? 7 : 9;
    const std::uint32_t loser = firstShooterWins ? 9 : 7;
    if (engine.winnerId() != expected) {
        fail("tie-break picked the wrong tower");
    }
    const lf::Tower* winner = engine.findTower(expected);
    const lf::Tower* other = engine.findTower(loser);
    if (winner->deathOrder() != 2 || other->deathOrder() != 1) {
        fail("death order not recorded in hit order");
    }
    if (!winner->invincible() || winner->health() != 1 || other->alive()) {
        fail("revived winner state mismatch");
    }
}

void checkTickBudget() {
    auto outcome = lf::simulateBattle(duel(0, 1), 5, sturdyConfig(120));
    if (outcome.status != lf::BattleStatus::Undecided || outcome.ticks != 120 || outcome.winnerId) {
        fail("battle did not stop undecided at the tick budget");
    }

    lf::BattleEngine engine(duel(0, 1), 5, sturdyConfig(120));
    while (engine.running()) {
        engine.step();
    }
    engine.step();
    if (engine.tick() != 120) {
        fail("finished engine kept ticking");
    }

    for (std::uint32_t seed = 0; seed < 20; ++seed) {
        auto bounded = lf::simulateBattle(lf::ringSnapshot(4), seed);
        if (bounded.ticks > lf::BattleConfig{}.maxTicks) {
            fail("battle exceeded the default tick budget");
        }
        if (bounded.status == lf::BattleStatus::Winner && !bounded.winnerId) {
            fail("winner status without a winner id");
        }
    }
}

void checkEscalationAndHoming() {
    lf::BattleEngine engine(duel(0, 1), 8, sturdyConfig(400));
    for (int i = 0; i < 179; ++i) {
        engine.step();
    }
    for (const auto& tower : engine.towers()) {
        if (tower.cannons().size() != 1) {
            fail("cannon added before the first escalation");
        }
    }
    engine.step();
    for (const auto& tower : engine.towers()) {
        if (tower.cannons().size() != 2) {
            fail("escalation at 3 s did not add a cannon");
        }
    }

    lf::BattleConfig early = sturdyConfig(100);
    early.homingStartSeconds = 0.5;
    lf::BattleEngine homing(duel(0, 1), 8, early);
    for (int i = 0; i < 29; ++i) {
        homing.step();
    }
    if (homing.homingActive()) {
        fail("homing started early");
    }
    homing.step();
    std::size_t missiles = 0;
    for (const auto& bullet : homing.bullets()) {
        if (bullet.homing()) {
            ++missiles;
        }
    }
    if (!homing.homingActive() || missiles != 2) {
        fail("first volley should launch one missile per tower");
    }
}

void checkPresenceInEngine() {
    lf::BattleEngine engine(duel(0, 1), 21);
    if (!engine.presenceLost(0)) {
        fail("presence loss rejected for a live tower");
    }
    if (engine.viableCount() != 1 || engine.aliveCount() != 2) {
        fail("withdrawing tower still counted as viable");
    }
    while (engine.running()) {
        engine.step();
    }
    if (engine.winnerId() != 1u || engine.findTower(0)->deathOrder() != 1) {
        fail("withdrawn tower was not the one removed");
    }
    if (engine.tick() < 89 || engine.tick() > 92) {
        fail("withdrawal took " + std::to_string(engine.tick()) + " ticks instead of ~90");
    }
    if (engine.presenceRestored(0)) {
        fail("presence restored on a finished battle");
    }
}

// Fingers were down through the countdown, so every tower starts at full size.
void checkTowersStartSpawned() {
    lf::BattleEngine engine(lf::ringSnapshot(4), 12);
    for (const auto& tower : engine.towers()) {
        if (tower.state() != lf::TowerState::Active || tower.visualRadius() != lf::Tower::kRadius) {
            fail("tower entered the battle still spawning");
        }
        if (tower.cannons().size() != 1 || tower.cannons().front().armed()) {
            fail("starting cannon should still be spawning in");
        }
    }
}

void checkConcede() {
    lf::BattleEngine engine(lf::ringSnapshot(3), 4);
    engine.step();
    engine.concede(1);
    if (engine.status() != lf::BattleStatus::Winner || engine.winnerId() != 1u || engine.aliveCount() != 1) {
        fail("concede did not leave the winner alone");
    }
    if (!engine.findTower(1)->invincible() || !engine.bullets().empty()) {
        fail("concede state mismatch");
    }

    bool threw = false;
    try {
        lf::BattleEngine other(lf::ringSnapshot(3), 4);
        other.concede(99);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        fail("concede accepted an unknown tower");
    }
}

} // namespace

int main() {
    checkDegenerate();
    checkDeathOrderTieBreak(true);
    checkDeathOrderTieBreak(false);
    checkTickBudget();
    checkEscalationAndHoming();
    checkPresenceInEngine();
    checkTowersStartSpawned();
    checkConcede();
    std::cout << "Battle checks passed.\n";
    return 0;
}
