#include "Simulation.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

#include "../../engine/core/Logger.h"
#include "../../engine/ecs/components/Health.h"
#include "../../engine/ecs/components/Transform.h"
#include "../components/CollectibleState.h"
#include "../components/EnemyState.h"
#include "../components/PathFollower.h"
#include "../components/PlayerState.h"
#include "../components/ProjectileState.h"
#include "../components/TowerState.h"
#include "../economy/UpgradeCurves.h"
#include "../systems/CombatResolver.h"
#include "../systems/MovementSystem.h"
#include "../systems/PickupSystem.h"
#include "../systems/PlayerSystem.h"
#include "../systems/WaveScheduler.h"
#include "../world/EntityFactory.h"

namespace Rampart {

namespace {
// Clears the in-tick flag on every exit path, exceptions included.
class TickGuard {
public:
    explicit TickGuard(bool& flag) : flag_(flag) { flag_ = true; }
    ~TickGuard() { flag_ = false; }
    TickGuard(const TickGuard&) = delete;
    TickGuard& operator=(const TickGuard&) = delete;

private:
    bool& flag_;
};

std::string cellString(const Cell& c) {
    std::ostringstream ss;
    ss << "(" << c.x << "," << c.y << ")";
    return ss.str();
}
}  // namespace

Simulation::Simulation(GameConfig config) : config_(std::move(config)) {
    const auto problems = validateConfig(config_);
    if (!problems.empty()) {
        std::string joined;
        for (const auto& p : problems) {
            Engine::logError("Config: " + p);
            if (!joined.empty()) joined += "; ";
            joined += p;
        }
        throw std::invalid_argument("invalid config: " + joined);
    }

    journal_.setCapacity(config_.simulation.journalCapacity);
    pickupSystem_ = std::make_unique<PickupSystem>();
    movementSystem_ = std::make_unique<MovementSystem>();
    combatResolver_ = std::make_unique<CombatResolver>(*pickupSystem_);
    playerSystem_ = std::make_unique<PlayerSystem>();
    waveScheduler_ = std::make_unique<WaveScheduler>();
    stateMachine_.setListener([this](GameState before, GameState after) { onStateChanged(before, after); });

    rebuildWorld();
    for (const Cell& s : grid_.spawns()) {
        if (!planner_.reachable(s)) {
            throw std::invalid_argument("invalid config: spawn " + cellString(s) + " has no route to the goal");
        }
    }
}

Simulation::~Simulation() = default;

SimContext Simulation::makeContext() {
    return SimContext{config_, grid_, planner_, registry_, ledger_, journal_, rng_,
                      Engine::TimeStep{0.0, elapsed_, tickIndex_}, TickOutcome{}};
}

void Simulation::rebuildWorld() {
    registry_.clear();
    grid_ = SpatialGrid(config_.grid);
    planner_.recompute(grid_);
    grid_.clearDirty();
    ledger_.reset(config_.economy.startingCurrency);
    rng_.seed(config_.simulation.seed);
    waveScheduler_->reset();
    lives_ = config_.economy.startingLives;
    score_ = 0;
    selectedTower_.reset();
    selectedTowerType_.reset();
    elapsed_ = 0.0;
    tickIndex_ = 0;
    faulted_ = false;
    journal_.setTick(0);
    if (config_.player.enabled) {
        SimContext ctx = makeContext();
        EntityFactory::createPlayer(ctx);
    }
}

void Simulation::onStateChanged(GameState before, GameState after) {
    journal_.record(GameStateChanged{before, after});
    Engine::logInfo("Game state " + std::string(toString(before)) + " -> " + std::string(toString(after)));
}

CommandError Simulation::commandGate() const {
    if (inTick_) return CommandError::InvalidState;
    if (stateMachine_.state() != GameState::Playing) return CommandError::InvalidState;
    return CommandError::None;
}

CommandResult Simulation::reject(const char* command, CommandError err) const {
    Engine::logDebug(std::string(command) + " rejected: " + std::string(toString(err)));
    return CommandResult::fail(err);
}

std::vector<Cell> Simulation::enemyCells() const {
    std::vector<Cell> cells;
    for (auto e : registry_.enemies()) {
        if (const auto* tf = registry_.get<Engine::ECS::Transform>(e)) {
            const Cell c = grid_.cellAt(tf->position);
            if (std::find(cells.begin(), cells.end(), c) == cells.end()) cells.push_back(c);
        }
    }
    return cells;
}

void Simulation::tick(double deltaSeconds) {
    if (inTick_) throw std::logic_error("Simulation::tick called re-entrantly");
    if (faulted_) {
        Engine::logWarn("Tick refused: simulation is faulted until reset");
        return;
    }
    if (!std::isfinite(deltaSeconds) || deltaSeconds <= 0.0) return;
    if (!stateMachine_.advancesGameplay()) return;

    const double dt = std::min(deltaSeconds, config_.simulation.maxTickSeconds);
    TickGuard guard(inTick_);
    ++tickIndex_;
    elapsed_ += dt;
    journal_.setTick(tickIndex_);

    SimContext ctx = makeContext();
    ctx.step = Engine::TimeStep{dt, elapsed_, tickIndex_};
    try {
        // 1. Paths
        if (planner_.refreshIfDirty(grid_)) movementSystem_->reroute(ctx);
        // 2. Motion, after power-ups that ran out this tick are gone
        pickupSystem_->expireEffects(ctx);
        movementSystem_->update(ctx);
        // 3. Combat, contact damage, drops and pickups
        combatResolver_->update(ctx);
        pickupSystem_->update(ctx);
        playerSystem_->update(ctx);
        // 4. Deferred destruction
        combatResolver_->resolveLostTargets(ctx);
        registry_.flushDestroyed();
        // 5. Waves
        waveScheduler_->update(ctx);
        // 6. Economy
        applyOutcome(ctx.outcome);
        // 7. Terminal conditions
        evaluateTerminal();
    } catch (const InvariantViolation& e) {
        faulted_ = true;
        Engine::logError(std::string("Invariant violated on tick ") + std::to_string(tickIndex_) + ": " + e.what());
        throw;
    }
}

void Simulation::applyOutcome(const TickOutcome& outcome) {
    ledger_.credit(outcome.rewards);
    ledger_.credit(outcome.waveBonus);
    ledger_.credit(outcome.pickupCurrency);
    score_ += outcome.score;
    if (outcome.livesLost > 0) lives_ = std::max(0, lives_ - outcome.livesLost);
    ledger_.verify();
}

void Simulation::evaluateTerminal() {
    if (lives_ <= 0) {
        if (stateMachine_.lose()) {
            journal_.record(GameOver{false, score_, waveScheduler_->currentWave()});
        }
        return;
    }
    if (waveScheduler_->finalWaveCleared(config_)) {
        if (stateMachine_.win()) {
            journal_.record(GameOver{true, score_, waveScheduler_->currentWave()});
        }
    }
}

CommandResult Simulation::start() {
    if (inTick_) return reject("start", CommandError::InvalidState);
    if (!stateMachine_.start()) return reject("start", CommandError::InvalidState);
    return CommandResult::ok();
}

CommandResult Simulation::pause() {
    if (inTick_) return reject("pause", CommandError::InvalidState);
    if (!stateMachine_.pause()) return reject("pause", CommandError::InvalidState);
    return CommandResult::ok();
}

CommandResult Simulation::resume() {
    if (inTick_) return reject("resume", CommandError::InvalidState);
    if (!stateMachine_.resume()) return reject("resume", CommandError::InvalidState);
    return CommandResult::ok();
}

CommandResult Simulation::reset() {
    if (inTick_) return reject("reset", CommandError::InvalidState);
    rebuildWorld();
    stateMachine_.reset();
    Engine::logInfo("Session reset");
    return CommandResult::ok();
}

CommandResult Simulation::placeTower(const Cell& cell, TowerType type) {
    if (const auto gate = commandGate(); gate != CommandError::None) return reject("placeTower", gate);

    const std::vector<Cell> occupied = enemyCells();
    const CommandError err = grid_.validatePlacement(cell, planner_, occupied);
    if (err != CommandError::None) return reject("placeTower", err);
    const std::int64_t cost = config_.tower(type).cost;
    if (!ledger_.canAfford(cost)) return reject("placeTower", CommandError::InsufficientFunds);

    SimContext ctx = makeContext();
    const auto id = EntityFactory::createTower(ctx, type, cell);
    const CommandResult placed = grid_.placeTower(cell, id, planner_, occupied);
    if (!placed) {
        registry_.destroyNow(id);
        return reject("placeTower", placed.error);
    }
    if (const CommandResult paid = ledger_.spend(cost); !paid) {
        grid_.removeTower(cell);
        registry_.destroyNow(id);
        return reject("placeTower", paid.error);
    }
    journal_.record(TowerPlaced{id, type, cell, cost});
    Engine::logDebug("Placed " + std::string(toString(type)) + " tower " + std::to_string(id) + " at " +
                     cellString(cell));
    return CommandResult::ok(static_cast<std::int64_t>(id));
}

CommandResult Simulation::placeSelectedTower(const Cell& cell) {
    if (!selectedTowerType_) return reject("placeSelectedTower", CommandError::NoTargetSelected);
    return placeTower(cell, *selectedTowerType_);
}

CommandResult Simulation::sellTower(Engine::ECS::Entity tower) {
    if (const auto gate = commandGate(); gate != CommandError::None) return reject("sellTower", gate);
    if (!registry_.isKind(tower, EntityKind::Tower)) return reject("sellTower", CommandError::UnknownEntity);

    const TowerState state = *registry_.get<TowerState>(tower);
    const std::int64_t refund = EconomyLedger::refundFor(state.cumulativeSpend, config_.economy.sellRefundRate);
    grid_.removeTower(state.cell);
    registry_.destroyNow(tower);
    if (selectedTower_ && *selectedTower_ == tower) {
        selectedTower_.reset();
        journal_.record(TowerSelected{tower, std::nullopt});
    }
    ledger_.credit(refund);
    journal_.record(TowerSold{tower, state.type, state.cell, refund});
    return CommandResult::ok(refund);
}

CommandResult Simulation::sellSelectedTower() {
    if (!selectedTower_) return reject("sellSelectedTower", CommandError::NoTargetSelected);
    return sellTower(*selectedTower_);
}

CommandResult Simulation::upgradeTower(Engine::ECS::Entity tower, TowerAttribute attr) {
    if (const auto gate = commandGate(); gate != CommandError::None) return reject("upgradeTower", gate);
    auto* state = registry_.isKind(tower, EntityKind::Tower) ? registry_.get<TowerState>(tower) : nullptr;
    if (!state) return reject("upgradeTower", CommandError::UnknownEntity);

    const int maxLevel = std::min(state->maxLevel, towerMaxLevel(config_, state->type, attr));
    const int level = state->level(attr);
    const auto cost = costForNext(config_.towerUpgrade(attr), level, maxLevel,
                                  config_.tower(state->type).upgradeCostModifier);
    if (!cost) return reject("upgradeTower", CommandError::MaxLevelReached);
    if (!ledger_.spend(*cost)) return reject("upgradeTower", CommandError::InsufficientFunds);

    state->levels[index(attr)] = level + 1;
    state->cumulativeSpend += *cost;
    applyTowerUpgrades(*state, config_);
    journal_.record(TowerUpgraded{tower, attr, level, level + 1, *cost});
    return CommandResult::ok(level + 1);
}

CommandResult Simulation::upgradeSelectedTower(TowerAttribute attr) {
    if (!selectedTower_) return reject("upgradeSelectedTower", CommandError::NoTargetSelected);
    return upgradeTower(*selectedTower_, attr);
}

CommandResult Simulation::upgradePlayer(PlayerAttribute attr) {
    if (const auto gate = commandGate(); gate != CommandError::None) return reject("upgradePlayer", gate);
    const auto id = registry_.player();
    auto* player = registry_.get<PlayerState>(id);
    auto* hp = registry_.get<Engine::ECS::Health>(id);
    if (!player || !hp) return reject("upgradePlayer", CommandError::UnknownEntity);

    const int level = player->level(attr);
    const auto cost = costForNext(config_.playerUpgrade(attr), level, playerMaxLevel(config_, attr));
    if (!cost) return reject("upgradePlayer", CommandError::MaxLevelReached);
    if (!ledger_.spend(*cost)) return reject("upgradePlayer", CommandError::InsufficientFunds);

    player->levels[index(attr)] = level + 1;
    applyPlayerUpgrades(*player, *hp, config_);
    journal_.record(PlayerUpgraded{attr, level, level + 1, *cost});
    return CommandResult::ok(level + 1);
}

CommandResult Simulation::startNextWave() {
    if (const auto gate = commandGate(); gate != CommandError::None) return reject("startNextWave", gate);
    SimContext ctx = makeContext();
    const CommandResult result = waveScheduler_->startNext(ctx);
    if (!result) return reject("startNextWave", result.error);
    return result;
}

CommandResult Simulation::setSelectedTowerType(std::optional<TowerType> type) {
    if (inTick_) return reject("setSelectedTowerType", CommandError::InvalidState);
    if (type != selectedTowerType_) {
        journal_.record(SelectedTowerTypeChanged{selectedTowerType_, type});
        selectedTowerType_ = type;
    }
    return CommandResult::ok();
}

CommandResult Simulation::selectTower(std::optional<Engine::ECS::Entity> tower) {
    if (inTick_) return reject("selectTower", CommandError::InvalidState);
    if (tower && !registry_.isKind(*tower, EntityKind::Tower)) {
        return reject("selectTower", CommandError::UnknownEntity);
    }
    if (tower != selectedTower_) {
        journal_.record(TowerSelected{selectedTower_, tower});
        selectedTower_ = tower;
    }
    return CommandResult::ok();
}

CommandResult Simulation::setPlayerMovement(const Engine::Vec2& direction) {
    if (inTick_) return reject("setPlayerMovement", CommandError::InvalidState);
    auto* player = registry_.get<PlayerState>(registry_.player());
    if (!player) return reject("setPlayerMovement", CommandError::UnknownEntity);
    if (!std::isfinite(direction.x) || !std::isfinite(direction.y)) {
        player->moveDirection = Engine::Vec2{};
    } else {
        player->moveDirection = direction;
    }
    return CommandResult::ok();
}

CommandResult Simulation::setPlayerFiring(bool firing) {
    if (inTick_) return reject("setPlayerFiring", CommandError::InvalidState);
    auto* player = registry_.get<PlayerState>(registry_.player());
    if (!player) return reject("setPlayerFiring", CommandError::UnknownEntity);
    player->firing = firing;
    return CommandResult::ok();
}

int Simulation::getCurrentWave() const { return waveScheduler_->currentWave(); }

WaveState Simulation::getWaveState() const { return waveScheduler_->state(); }

bool Simulation::hasMoreWaves() const { return waveScheduler_->hasMoreWaves(config_); }

std::vector<EnemyView> Simulation::getEnemies() const {
    std::vector<EnemyView> out;
    for (auto e : registry_.enemies()) {
        const auto* tf = registry_.get<Engine::ECS::Transform>(e);
        const auto* hp = registry_.get<Engine::ECS::Health>(e);
        const auto* state = registry_.get<EnemyState>(e);
        const auto* follower = registry_.get<PathFollower>(e);
        if (!tf || !hp || !state) continue;
        EnemyView v{};
        v.id = e;
        v.type = state->type;
        v.position = tf->position;
        v.health = hp->current;
        v.maxHealth = hp->max;
        v.armor = hp->armor;
        v.speed = state->speed;
        v.progress = follower ? follower->progress : 0.0f;
        v.routeLength = (follower && follower->route) ? follower->route->length() : 0.0f;
        v.reward = state->reward;
        v.boss = state->boss;
        v.wave = state->waveIndex;
        out.push_back(v);
    }
    return out;
}

std::optional<TowerView> Simulation::getTower(Engine::ECS::Entity tower) const {
    if (!registry_.isKind(tower, EntityKind::Tower)) return std::nullopt;
    const auto* tf = registry_.get<Engine::ECS::Transform>(tower);
    const auto* state = registry_.get<TowerState>(tower);
    if (!tf || !state) return std::nullopt;
    TowerView v{};
    v.id = tower;
    v.type = state->type;
    v.cell = state->cell;
    v.position = tf->position;
    v.damage = state->damage;
    v.range = state->range;
    v.fireRate = state->fireRate;
    v.levels = state->levels;
    v.maxLevel = state->maxLevel;
    v.cumulativeSpend = state->cumulativeSpend;
    return v;
}

std::vector<TowerView> Simulation::getTowers() const {
    std::vector<TowerView> out;
    for (auto e : registry_.towers()) {
        if (auto v = getTower(e)) out.push_back(*v);
    }
    return out;
}

std::vector<ProjectileView> Simulation::getProjectiles() const {
    std::vector<ProjectileView> out;
    for (auto e : registry_.projectiles()) {
        const auto* tf = registry_.get<Engine::ECS::Transform>(e);
        const auto* p = registry_.get<ProjectileState>(e);
        if (!tf || !p) continue;
        out.push_back(ProjectileView{e, p->owner, p->guidance, p->target, tf->position, p->heading, p->damage,
                                     p->travelled});
    }
    return out;
}

std::vector<CollectibleView> Simulation::getCollectibles() const {
    std::vector<CollectibleView> out;
    for (auto e : registry_.collectibles()) {
        const auto* tf = registry_.get<Engine::ECS::Transform>(e);
        const auto* c = registry_.get<CollectibleState>(e);
        if (!tf || !c) continue;
        out.push_back(CollectibleView{e, c->type, tf->position, c->remaining});
    }
    return out;
}

std::optional<PlayerView> Simulation::getPlayer() const {
    const auto id = registry_.player();
    const auto* tf = registry_.get<Engine::ECS::Transform>(id);
    const auto* hp = registry_.get<Engine::ECS::Health>(id);
    const auto* p = registry_.get<PlayerState>(id);
    if (!tf || !hp || !p) return std::nullopt;
    PlayerView v{};
    v.id = id;
    v.position = tf->position;
    v.health = hp->current;
    v.maxHealth = hp->max;
    v.damage = p->damage;
    v.speed = p->speed;
    v.fireRate = p->fireRate;
    v.regenPerSecond = p->regenPerSecond;
    v.levels = p->levels;
    v.downed = p->downed;
    v.firing = p->firing;
    v.effects = p->effects;
    return v;
}

std::optional<std::int64_t> Simulation::towerUpgradeCost(Engine::ECS::Entity tower, TowerAttribute attr) const {
    const auto* state = registry_.isKind(tower, EntityKind::Tower) ? registry_.get<TowerState>(tower) : nullptr;
    if (!state) return std::nullopt;
    const int maxLevel = std::min(state->maxLevel, towerMaxLevel(config_, state->type, attr));
    return costForNext(config_.towerUpgrade(attr), state->level(attr), maxLevel,
                       config_.tower(state->type).upgradeCostModifier);
}

std::optional<std::int64_t> Simulation::playerUpgradeCost(PlayerAttribute attr) const {
    const auto* player = registry_.get<PlayerState>(registry_.player());
    if (!player) return std::nullopt;
    return costForNext(config_.playerUpgrade(attr), player->level(attr), playerMaxLevel(config_, attr));
}

std::optional<std::int64_t> Simulation::sellValue(Engine::ECS::Entity tower) const {
    const auto* state = registry_.isKind(tower, EntityKind::Tower) ? registry_.get<TowerState>(tower) : nullptr;
    if (!state) return std::nullopt;
    return EconomyLedger::refundFor(state->cumulativeSpend, config_.economy.sellRefundRate);
}

}  // namespace Rampart
