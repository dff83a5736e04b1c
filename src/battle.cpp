#include "battle.hpp"

#include "deterministic_math.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace lf {

namespace {

std::size_t ticksFor(double seconds, double tickSeconds) {
    double ticks = std::round(seconds / tickSeconds);
    if (ticks < 1.0) {
        return 1;
    }
    return static_cast<std::size_t>(ticks);
}

std::size_t pickIndex(RandomSource& rng, std::size_t count) {
    auto idx = static_cast<std::size_t>(rng.uniform01() * static_cast<double>(count));
    return idx < count ? idx : count - 1;
}

void validateConfig(const BattleConfig& cfg) {
    if (!(cfg.tickSeconds > 0.0)) {
        throw std::invalid_argument("BattleConfig tickSeconds must be positive");
    }
    if (cfg.maxTicks == 0) {
        throw std::invalid_argument("BattleConfig maxTicks must be positive");
    }
    if (cfg.maxHealth <= 0) {
        throw std::invalid_argument("BattleConfig maxHealth must be positive");
    }
    if (cfg.recordTranscript && cfg.transcriptInterval == 0) {
        throw std::invalid_argument("BattleConfig transcriptInterval must be positive");
    }
}

} // namespace

const char* battleStatusName(BattleStatus status) {
    switch (status) {
    case BattleStatus::Running:
        return "running";
    case BattleStatus::Winner:
        return "winner";
    case BattleStatus::Undecided:
        return "undecided";
    case BattleStatus::NoContest:
        return "no-contest";
    }
    return "unknown";
}

BattleEngine::BattleEngine(const MatchSnapshot& snapshot, std::uint32_t seed, const BattleConfig& cfg)
    : arenaWidth_(snapshot.arenaWidth())
    , arenaHeight_(snapshot.arenaHeight())
    , config_(cfg)
    , seed_(seed)
    , rng_(seed)
    , status_(BattleStatus::Running)
    , tick_(0)
    , escalationTicks_(0)
    , homingStartTicks_(0)
    , volleyTicks_(0)
    , lastEscalationTick_(0)
    , nextVolleyTick_(0)
    , homingActive_(false)
    , deathCounter_(0) {
    validateConfig(config_);
    escalationTicks_ = ticksFor(config_.escalationSeconds, config_.tickSeconds);
    homingStartTicks_ = ticksFor(config_.homingStartSeconds, config_.tickSeconds);
    volleyTicks_ = ticksFor(config_.volleySeconds, config_.tickSeconds);

    towers_.reserve(snapshot.size());
    for (const auto& entry : snapshot.entries()) {
        towers_.emplace_back(entry.id, entry.x, entry.y, entry.color, config_.maxHealth);
        towers_.back().finishSpawn();
    }

    if (towers_.empty()) {
        status_ = BattleStatus::NoContest;
        return;
    }
    if (towers_.size() == 1) {
        declareWinner(towers_.front());
        return;
    }

    for (auto& tower : towers_) {
        tower.addCannon(0.0, rng_);
    }
}

const Tower* BattleEngine::findTower(std::uint32_t towerId) const {
    for (const auto& tower : towers_) {
        if (tower.id() == towerId) {
            return &tower;
        }
    }
    return nullptr;
}

Tower* BattleEngine::findTowerMutable(std::uint32_t towerId) {
    for (auto& tower : towers_) {
        if (tower.id() == towerId) {
            return &tower;
        }
    }
    return nullptr;
}

std::size_t BattleEngine::aliveCount() const {
    return static_cast<std::size_t>(
        std::count_if(towers_.begin(), towers_.end(), [](const Tower& t) { return t.alive(); }));
}

std::size_t BattleEngine::viableCount() const {
    return static_cast<std::size_t>(std::count_if(
        towers_.begin(), towers_.end(), [](const Tower& t) { return t.alive() && t.hasPresence(); }));
}

bool BattleEngine::presenceLost(std::uint32_t towerId) {
    Tower* tower = findTowerMutable(towerId);
    if (!running() || tower == nullptr || !tower->alive()) {
        return false;
    }
    tower->presenceLost();
    return true;
}

bool BattleEngine::presenceRestored(std::uint32_t towerId) {
    Tower* tower = findTowerMutable(towerId);
    if (!running() || tower == nullptr || !tower->alive()) {
        return false;
    }
    tower->presenceRestored();
    return true;
}

void BattleEngine::injectBullet(const Bullet& bullet) {
    bullets_.push_back(bullet);
}

void BattleEngine::concede(std::uint32_t winnerId) {
    Tower* winner = findTowerMutable(winnerId);
    if (winner == nullptr) {
        throw std::invalid_argument("concede: unknown tower id " + std::to_string(winnerId));
    }
    for (auto& tower : towers_) {
        if (tower.id() == winnerId || !tower.alive()) {
            continue;
        }
        tower.eliminate();
        recordDeath(tower);
    }
    bullets_.clear();
    declareWinner(*winner);
}

BattleStatus BattleEngine::step() {
    if (!running()) {
        return status_;
    }

    ++tick_;
    escalate();
    fireVolley();
    advanceTowers();
    advanceBullets();
    checkTermination();

    if (config_.recordTranscript && (!running() || tick_ % config_.transcriptInterval == 0)) {
        appendCheckpoint();
    }
    return status_;
}

void BattleEngine::escalate() {
    if (tick_ - lastEscalationTick_ < escalationTicks_) {
        return;
    }
    lastEscalationTick_ = tick_;
    const double now = elapsed();
    for (auto& tower : towers_) {
        if (tower.canFight()) {
            tower.addCannon(now, rng_);
        }
    }
}

void BattleEngine::fireVolley() {
    if (!homingActive_ && tick_ >= homingStartTicks_) {
        homingActive_ = true;
        nextVolleyTick_ = tick_;
    }
    if (!homingActive_ || tick_ < nextVolleyTick_) {
        return;
    }
    nextVolleyTick_ = tick_ + volleyTicks_;
    for (const auto& tower : towers_) {
        if (tower.canFight()) {
            fireHoming(tower);
        }
    }
}

void BattleEngine::fireHoming(const Tower& shooter) {
    std::vector<std::size_t> enemies;
    for (std::size_t i = 0; i < towers_.size(); ++i) {
        const Tower& t = towers_[i];
        if (t.alive() && t.id() != shooter.id() && !t.invincible()) {
            enemies.push_back(i);
        }
    }
    if (enemies.empty()) {
        return;
    }

    const Tower& target = towers_[enemies[pickIndex(rng_, enemies.size())]];
    double fireX = shooter.x();
    double fireY = shooter.y();
    if (!shooter.cannons().empty()) {
        std::size_t cannonIdx = pickIndex(rng_, shooter.cannons().size());
        fireX = shooter.cannonX(cannonIdx);
        fireY = shooter.cannonY(cannonIdx);
    }

    const double aim = DeterministicMath::angleBetween(fireX, fireY, target.x(), target.y());
    Bullet missile(fireX, fireY, aim, shooter.id(), true);
    missile.setTarget(target.x(), target.y());
    bullets_.push_back(missile);
}

void BattleEngine::advanceTowers() {
    for (auto& tower : towers_) {
        if (!tower.alive()) {
            continue;
        }
        auto fires = tower.tick(config_.tickSeconds);
        if (!tower.alive()) {
            // Presence ran out.
            recordDeath(tower);
            continue;
        }
        for (const auto& fire : fires) {
            bullets_.emplace_back(fire.x, fire.y, fire.angle, tower.id());
        }
    }
}

void BattleEngine::advanceBullets() {
    for (auto& bullet : bullets_) {
        if (bullet.homing()) {
            const Tower* nearest = nullptr;
            double nearestDist = std::numeric_limits<double>::infinity();
            for (const auto& tower : towers_) {
                if (!tower.alive() || tower.id() == bullet.ownerId() || tower.invincible()) {
                    continue;
                }
                double d = DeterministicMath::distance(bullet.x(), bullet.y(), tower.x(), tower.y());
                if (d < nearestDist) {
                    nearest = &tower;
                    nearestDist = d;
                }
            }
            if (nearest != nullptr) {
                bullet.setTarget(nearest->x(), nearest->y());
            } else {
                bullet.stopHoming();
            }
        }

        bullet.update(config_.tickSeconds, arenaWidth_, arenaHeight_);
        if (!bullet.alive()) {
            continue;
        }

        for (auto& tower : towers_) {
            if (!tower.targetable() || tower.id() == bullet.ownerId()) {
                continue;
            }
            if (!bullet.collides(tower)) {
                continue;
            }
            if (tower.hit()) {
                bullet.destroy();
                if (!tower.alive()) {
                    recordDeath(tower);
                }
            }
            break;
        }
    }

    bullets_.erase(std::remove_if(bullets_.begin(), bullets_.end(), [](const Bullet& b) { return !b.alive(); }),
                   bullets_.end());
}

void BattleEngine::checkTermination() {
    Tower* survivor = nullptr;
    std::size_t alive = 0;
    for (auto& tower : towers_) {
        if (tower.alive()) {
            ++alive;
            survivor = &tower;
        }
    }

    if (alive == 1) {
        declareWinner(*survivor);
        return;
    }
    if (alive == 0) {
        // Simultaneous elimination: the last one to die takes it.
        Tower* last = &towers_.front();
        for (auto& tower : towers_) {
            if (tower.deathOrder() > last->deathOrder()) {
                last = &tower;
            }
        }
        declareWinner(*last);
        return;
    }
    if (tick_ >= config_.maxTicks) {
        status_ = BattleStatus::Undecided;
    }
}

void BattleEngine::declareWinner(Tower& winner) {
    winner.crown();
    winnerId_ = winner.id();
    status_ = BattleStatus::Winner;
}

void BattleEngine::recordDeath(Tower& tower) {
    assert(!tower.alive());
    tower.setDeathOrder(++deathCounter_);
}

void BattleEngine::appendCheckpoint() {
    std::ostringstream oss;
    oss << "tick=" << tick_ << ";status=" << battleStatusName(status_) << ";";
    for (const auto& tower : towers_) {
        oss << tower.id() << ":" << towerStateName(tower.state()) << ":" << tower.health() << ":"
            << DeterministicMath::toMicros(tower.presence()) << ":" << tower.cannons().size() << ":"
            << tower.deathOrder() << "|";
    }
    oss << "bullets=" << bullets_.size() << ";";
    for (const auto& bullet : bullets_) {
        oss << bullet.ownerId() << "@" << DeterministicMath::toMicros(bullet.x()) << ","
            << DeterministicMath::toMicros(bullet.y()) << (bullet.homing() ? "h" : "") << "|";
    }
    transcript_.append(oss.str());
}

BattleOutcome BattleEngine::outcome() const {
    BattleOutcome out;
    out.status = status_;
    out.winnerId = winnerId_;
    out.ticks = tick_;
    out.transcriptRoot = transcript_.merkleRoot();
    return out;
}

BattleOutcome simulateBattle(const MatchSnapshot& snapshot,
                             std::uint32_t seed,
                             const BattleConfig& cfg,
                             const BattleTickCallback& onTick) {
    BattleEngine engine(snapshot, seed, cfg);
    while (engine.running()) {
        engine.step();
        if (onTick) {
            onTick(engine);
        }
    }
    return engine.outcome();
}

} // namespace lf
