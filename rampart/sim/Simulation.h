// Owns one tower-defense session: command validation, the fixed-order tick and state queries.
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <vector>

#include "../../engine/ecs/Entity.h"
#include "../../engine/math/Vec2.h"
#include "../CommandResult.h"
#include "../Types.h"
#include "../config/GameConfig.h"
#include "../ecs/EntityRegistry.h"
#include "../economy/EconomyLedger.h"
#include "../state/GameStateMachine.h"
#include "../world/PathPlanner.h"
#include "../world/SpatialGrid.h"
#include "SimContext.h"
#include "SimJournal.h"
#include "Snapshots.h"

namespace Rampart {

class MovementSystem;
class CombatResolver;
class PickupSystem;
class PlayerSystem;
class WaveScheduler;

class Simulation {
public:
    // Throws std::invalid_argument when the config fails validateConfig or a spawn has no route.
    explicit Simulation(GameConfig config);
    ~Simulation();

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    // Advances one step. Ignored unless PLAYING; non-positive or non-finite deltas are ignored and
    // large ones clamped. Throws std::logic_error if called re-entrantly and InvariantViolation
    // (after marking the session faulted) when internal state is inconsistent.
    void tick(double deltaSeconds);

    // Lifecycle
    CommandResult start();
    CommandResult pause();
    CommandResult resume();
    // Rebuilds the session from the config and returns to MENU.
    CommandResult reset();

    // Building and economy
    CommandResult placeTower(const Cell& cell, TowerType type);
    CommandResult placeSelectedTower(const Cell& cell);
    CommandResult sellTower(Engine::ECS::Entity tower);
    CommandResult sellSelectedTower();
    CommandResult upgradeTower(Engine::ECS::Entity tower, TowerAttribute attr);
    CommandResult upgradeSelectedTower(TowerAttribute attr);
    CommandResult upgradePlayer(PlayerAttribute attr);
    CommandResult startNextWave();

    // Selection and player input
    CommandResult setSelectedTowerType(std::optional<TowerType> type);
    CommandResult selectTower(std::optional<Engine::ECS::Entity> tower);
    CommandResult setPlayerMovement(const Engine::Vec2& direction);
    CommandResult setPlayerFiring(bool firing);

    // Queries
    std::int64_t getCurrency() const { return ledger_.balance(); }
    int getLives() const { return lives_; }
    std::int64_t getScore() const { return score_; }
    int getCurrentWave() const;
    WaveState getWaveState() const;
    bool hasMoreWaves() const;
    std::optional<Engine::ECS::Entity> getSelectedTower() const { return selectedTower_; }
    std::optional<TowerType> getSelectedTowerType() const { return selectedTowerType_; }
    std::vector<EnemyView> getEnemies() const;
    std::vector<TowerView> getTowers() const;
    std::vector<ProjectileView> getProjectiles() const;
    std::vector<CollectibleView> getCollectibles() const;
    std::optional<PlayerView> getPlayer() const;
    std::optional<TowerView> getTower(Engine::ECS::Entity tower) const;
    GameState getState() const { return stateMachine_.state(); }

    std::int64_t towerCost(TowerType type) const { return config_.tower(type).cost; }
    std::optional<std::int64_t> towerUpgradeCost(Engine::ECS::Entity tower, TowerAttribute attr) const;
    std::optional<std::int64_t> playerUpgradeCost(PlayerAttribute attr) const;
    std::optional<std::int64_t> sellValue(Engine::ECS::Entity tower) const;
    bool canAfford(std::int64_t cost) const { return ledger_.canAfford(cost); }

    double elapsedSeconds() const { return elapsed_; }
    std::uint64_t tickCount() const { return tickIndex_; }
    bool faulted() const { return faulted_; }
    bool ticking() const { return inTick_; }

    const GameConfig& config() const { return config_; }
    const SpatialGrid& grid() const { return grid_; }
    const PathPlanner& planner() const { return planner_; }
    const EntityRegistry& registry() const { return registry_; }

    // Facts recorded since the last drain, in order. Attach a ChangeObserver or call this
    // regularly; past simulation.journalCapacity undrained facts the oldest are dropped.
    std::vector<GameEvent> drainFacts() { return journal_.drain(); }
    std::size_t droppedFacts() const { return journal_.dropped(); }

private:
    // Lets tests reach internal state that no command can put into an inconsistent shape.
    friend struct SimulationTestAccess;

    SimContext makeContext();
    void rebuildWorld();
    CommandError commandGate() const;
    CommandResult reject(const char* command, CommandError err) const;
    std::vector<Cell> enemyCells() const;
    void applyOutcome(const TickOutcome& outcome);
    void evaluateTerminal();
    void onStateChanged(GameState before, GameState after);

    GameConfig config_;
    SpatialGrid grid_;
    PathPlanner planner_;
    EntityRegistry registry_;
    EconomyLedger ledger_;
    SimJournal journal_;
    GameStateMachine stateMachine_;
    std::mt19937 rng_;

    std::unique_ptr<PickupSystem> pickupSystem_;
    std::unique_ptr<MovementSystem> movementSystem_;
    std::unique_ptr<CombatResolver> combatResolver_;
    std::unique_ptr<PlayerSystem> playerSystem_;
    std::unique_ptr<WaveScheduler> waveScheduler_;

    int lives_{0};
    std::int64_t score_{0};
    std::optional<Engine::ECS::Entity> selectedTower_;
    std::optional<TowerType> selectedTowerType_;

    double elapsed_{0.0};
    std::uint64_t tickIndex_{0};
    bool inTick_{false};
    bool faulted_{false};
};

}  // namespace Rampart
