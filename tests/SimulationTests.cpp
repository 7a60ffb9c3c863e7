// Whole-session behaviour: commands, economy, waves to victory or defeat, tick guards and reset.
#include <cassert>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

#include "../rampart/CommandResult.h"
#include "../rampart/config/GameConfig.h"
#include "../rampart/sim/Simulation.h"
#include "../rampart/world/EntityFactory.h"

namespace Rampart {
// Reaches into the session to build states no command can produce.
struct SimulationTestAccess {
    static EntityRegistry& registry(Simulation& sim) { return sim.registry_; }
    static SimContext context(Simulation& sim) { return sim.makeContext(); }
};
}  // namespace Rampart

using namespace Rampart;

namespace {
// 20x3 corridor, one spawn on the left, goal on the right, no player unit.
GameConfig laneConfig() {
    GameConfig cfg = defaultConfig();
    cfg.grid = GridConfig{};
    cfg.grid.width = 20;
    cfg.grid.height = 3;
    cfg.grid.cellSize = 10.0f;
    cfg.grid.spawns = {Cell{0, 1}};
    cfg.grid.goal = Cell{19, 1};
    cfg.player.enabled = false;
    cfg.towers[index(TowerType::Basic)].cost = 20;
    cfg.waves = {WaveDefinition{{SpawnEntry{EnemyType::Basic, 5, 1.0f, false, std::nullopt}}, 0.0f}};
    return cfg;
}

struct Tally {
    int kills{0};
    int completed{0};
    int reachedGoal{0};
    int gameOver{0};
    bool won{false};

    void absorb(const std::vector<GameEvent>& facts) {
        for (const auto& ev : facts) {
            if (ev.as<EnemyKilled>()) ++kills;
            if (ev.as<WaveCompleted>()) ++completed;
            if (ev.as<EnemyReachedGoal>()) ++reachedGoal;
            if (const auto* over = ev.as<GameOver>()) {
                ++gameOver;
                won = over->won;
            }
        }
    }
};

Tally runUntilSettled(Simulation& sim, double dt, int maxTicks) {
    Tally tally;
    for (int i = 0; i < maxTicks && sim.getState() == GameState::Playing; ++i) {
        sim.tick(dt);
        tally.absorb(sim.drainFacts());
    }
    return tally;
}
}  // namespace

int main() {
    {
        // Spending down to zero then being refused.
        GameConfig cfg = laneConfig();
        cfg.economy.startingCurrency = 20;
        Simulation sim(cfg);
        assert(sim.start());
        const auto placed = sim.placeTower(Cell{5, 0}, TowerType::Basic);
        assert(placed);
        assert(sim.getCurrency() == 0);
        assert(!sim.canAfford(1));
        const auto refused = sim.placeTower(Cell{6, 0}, TowerType::Basic);
        assert(refused.error == CommandError::InsufficientFunds);
        assert(sim.getCurrency() == 0);
        assert(sim.getTowers().size() == 1);
        assert(sim.getTowers()[0].id == static_cast<Engine::ECS::Entity>(placed.value));
    }
    {
        // Placement errors leave the session untouched.
        Simulation sim(laneConfig());
        assert(sim.placeTower(Cell{3, 0}, TowerType::Basic).error == CommandError::InvalidState);
        assert(sim.start());
        assert(sim.placeTower(Cell{-1, 0}, TowerType::Basic).error == CommandError::OutOfBounds);
        assert(sim.placeTower(Cell{0, 1}, TowerType::Basic).error == CommandError::NotBuildable);
        assert(sim.placeTower(Cell{19, 1}, TowerType::Basic).error == CommandError::NotBuildable);
        assert(sim.placeTower(Cell{5, 0}, TowerType::Basic));
        assert(sim.placeTower(Cell{5, 0}, TowerType::Sniper).error == CommandError::OccupiedCell);
        assert(sim.placeTower(Cell{5, 1}, TowerType::Wall));
        assert(sim.placeTower(Cell{5, 2}, TowerType::Wall).error == CommandError::WouldBlockPath);
        assert(sim.getCurrency() == 100 - 20 - 15);
        assert(sim.getTowers().size() == 2);
    }
    {
        // Selling refunds a share of everything spent on the tower and frees the cell.
        Simulation sim(laneConfig());
        sim.start();
        const auto placed = sim.placeTower(Cell{4, 2}, TowerType::Basic);
        const auto tower = static_cast<Engine::ECS::Entity>(placed.value);
        assert(sim.sellValue(tower) == 14);
        const auto sold = sim.sellTower(tower);
        assert(sold && sold.value == 14);
        assert(sim.getCurrency() == 94);
        assert(sim.getTowers().empty());
        assert(sim.grid().towerAt(Cell{4, 2}) == Engine::ECS::kInvalidEntity);
        assert(sim.sellTower(tower).error == CommandError::UnknownEntity);
        assert(sim.placeTower(Cell{4, 2}, TowerType::Basic));
    }
    {
        // Upgrades charge the curve cost until the cap; walls cannot be upgraded.
        GameConfig cfg = laneConfig();
        cfg.economy.startingCurrency = 10000;
        Simulation sim(cfg);
        sim.start();
        const auto tower = static_cast<Engine::ECS::Entity>(sim.placeTower(Cell{8, 0}, TowerType::Basic).value);
        std::int64_t spent = 20;
        for (int level = 1; level <= 5; ++level) {
            const auto cost = sim.towerUpgradeCost(tower, TowerAttribute::Damage);
            assert(cost);
            const std::int64_t before = sim.getCurrency();
            const auto up = sim.upgradeTower(tower, TowerAttribute::Damage);
            assert(up && up.value == level);
            assert(sim.getCurrency() == before - *cost);
            spent += *cost;
        }
        assert(!sim.towerUpgradeCost(tower, TowerAttribute::Damage));
        const std::int64_t capped = sim.getCurrency();
        assert(sim.upgradeTower(tower, TowerAttribute::Damage).error == CommandError::MaxLevelReached);
        assert(sim.getCurrency() == capped);
        const auto view = sim.getTower(tower);
        assert(view && view->levels[index(TowerAttribute::Damage)] == 5);
        assert(view->cumulativeSpend == spent);
        assert(std::fabs(view->damage - 25.0f) < 1e-3f);
        assert(sim.sellValue(tower) == EconomyLedger::refundFor(spent, 0.7));

        const auto wall = static_cast<Engine::ECS::Entity>(sim.placeTower(Cell{8, 2}, TowerType::Wall).value);
        assert(sim.upgradeTower(wall, TowerAttribute::Range).error == CommandError::MaxLevelReached);
        assert(sim.upgradeTower(9999, TowerAttribute::Range).error == CommandError::UnknownEntity);
    }
    {
        // One tower clears a five-enemy wave: rewards, clear bonus and victory.
        GameConfig cfg = laneConfig();
        cfg.enemies[index(EnemyType::Basic)].health = 10.0f;
        cfg.enemies[index(EnemyType::Basic)].speed = 10.0f;
        cfg.towers[index(TowerType::Basic)].damage = 5.0f;
        cfg.towers[index(TowerType::Basic)].fireRate = 20.0f;
        cfg.towers[index(TowerType::Basic)].range = 200.0f;
        Simulation sim(cfg);
        assert(sim.start());
        assert(sim.placeTower(Cell{10, 0}, TowerType::Basic));
        assert(sim.getCurrency() == 80);
        const auto started = sim.startNextWave();
        assert(started && started.value == 1);
        assert(sim.startNextWave().error == CommandError::InvalidState);

        Tally tally;
        tally.absorb(sim.drainFacts());
        const Tally rest = runUntilSettled(sim, 0.05, 4000);
        tally.kills += rest.kills;
        tally.completed += rest.completed;
        tally.gameOver += rest.gameOver;
        tally.won = rest.won;

        assert(sim.getState() == GameState::Victory);
        assert(tally.kills == 5);
        assert(tally.completed == 1);
        assert(tally.gameOver == 1 && tally.won);
        assert(sim.getCurrency() == 135);
        assert(sim.getScore() == 250);
        assert(sim.getLives() == 10);
        assert(sim.getEnemies().empty());

        // Terminal: ticks and commands are refused.
        const auto ticks = sim.tickCount();
        sim.tick(0.05);
        assert(sim.tickCount() == ticks);
        assert(sim.placeTower(Cell{12, 0}, TowerType::Basic).error == CommandError::InvalidState);
    }
    {
        // Leaking enemies cost lives; running out ends the game with lives clamped at zero.
        GameConfig cfg = laneConfig();
        cfg.economy.startingLives = 2;
        cfg.enemies[index(EnemyType::Basic)].speed = 100.0f;
        cfg.waves = {WaveDefinition{{SpawnEntry{EnemyType::Basic, 3, 0.2f, false, std::nullopt}}, 0.0f}};
        Simulation sim(cfg);
        sim.start();
        sim.startNextWave();
        const Tally tally = runUntilSettled(sim, 0.05, 2000);
        assert(sim.getState() == GameState::GameOver);
        assert(sim.getLives() == 0);
        assert(tally.reachedGoal >= 2);
        assert(tally.gameOver == 1 && !tally.won);
    }
    {
        // Tick guards: not playing, paused, bad deltas, oversized deltas.
        Simulation sim(laneConfig());
        sim.tick(0.05);
        assert(sim.tickCount() == 0);
        sim.start();
        sim.tick(std::numeric_limits<double>::quiet_NaN());
        sim.tick(std::numeric_limits<double>::infinity());
        sim.tick(-1.0);
        sim.tick(0.0);
        assert(sim.tickCount() == 0);
        sim.tick(5.0);
        assert(sim.tickCount() == 1);
        assert(std::fabs(sim.elapsedSeconds() - 0.1) < 1e-9);

        assert(sim.pause());
        assert(sim.pause().error == CommandError::InvalidState);
        sim.tick(0.05);
        assert(sim.tickCount() == 1);
        assert(sim.placeTower(Cell{3, 0}, TowerType::Basic).error == CommandError::InvalidState);
        assert(sim.startNextWave().error == CommandError::InvalidState);
        assert(sim.resume());
        assert(sim.start().error == CommandError::InvalidState);
        sim.tick(0.05);
        assert(sim.tickCount() == 2);
        assert(!sim.faulted());
        assert(!sim.ticking());
    }
    {
        // Reset rebuilds the session from the config.
        Simulation sim(laneConfig());
        sim.start();
        sim.placeTower(Cell{4, 0}, TowerType::Basic);
        sim.startNextWave();
        for (int i = 0; i < 30; ++i) sim.tick(0.05);
        assert(!sim.getEnemies().empty());
        assert(sim.reset());
        assert(sim.getState() == GameState::Menu);
        assert(sim.getCurrency() == 100);
        assert(sim.getLives() == 10);
        assert(sim.getScore() == 0);
        assert(sim.getTowers().empty());
        assert(sim.getEnemies().empty());
        assert(sim.getCurrentWave() == 0);
        assert(sim.getWaveState() == WaveState::Idle);
        assert(sim.tickCount() == 0);
        assert(sim.grid().towerAt(Cell{4, 0}) == Engine::ECS::kInvalidEntity);
        assert(sim.reset());
        assert(sim.start());
        assert(sim.startNextWave().value == 1);
    }
    {
        // Endless mode keeps generating waves and never declares victory.
        GameConfig cfg = laneConfig();
        cfg.waves.clear();
        cfg.endless.enabled = true;
        for (auto& enemy : cfg.enemies) enemy.health = 5.0f;
        cfg.towers[index(TowerType::Basic)].damage = 10.0f;
        cfg.towers[index(TowerType::Basic)].fireRate = 20.0f;
        cfg.towers[index(TowerType::Basic)].range = 250.0f;
        cfg.economy.startingLives = 1000;
        Simulation sim(cfg);
        sim.start();
        sim.placeTower(Cell{10, 0}, TowerType::Basic);
        for (int wave = 1; wave <= 2; ++wave) {
            assert(sim.hasMoreWaves());
            assert(sim.startNextWave().value == wave);
            for (int i = 0; i < 20000 && sim.getWaveState() != WaveState::Complete; ++i) sim.tick(0.1);
            assert(sim.getWaveState() == WaveState::Complete);
            assert(sim.getState() == GameState::Playing);
        }
        assert(sim.hasMoreWaves());
    }
    {
        // Configs that cannot produce a playable session are rejected up front.
        GameConfig walled = laneConfig();
        walled.grid.blocked = {Cell{5, 0}, Cell{5, 1}, Cell{5, 2}};
        bool threw = false;
        try {
            Simulation sim(walled);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);

        GameConfig broken = laneConfig();
        broken.economy.startingLives = 0;
        threw = false;
        try {
            Simulation sim(broken);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }
    {
        // Tower type and tower selection drive the *Selected* commands.
        Simulation sim(laneConfig());
        sim.start();
        assert(sim.placeSelectedTower(Cell{3, 0}).error == CommandError::NoTargetSelected);
        assert(sim.setSelectedTowerType(TowerType::Wall));
        assert(sim.setSelectedTowerType(TowerType::Wall));
        const auto placed = sim.placeSelectedTower(Cell{3, 0});
        assert(placed);
        const auto tower = static_cast<Engine::ECS::Entity>(placed.value);
        assert(sim.getTower(tower)->type == TowerType::Wall);

        assert(sim.upgradeSelectedTower(TowerAttribute::Damage).error == CommandError::NoTargetSelected);
        assert(sim.selectTower(Engine::ECS::Entity{4242}).error == CommandError::UnknownEntity);
        assert(sim.selectTower(tower));
        assert(sim.getSelectedTower() == tower);
        assert(sim.sellSelectedTower().value == 10);
        assert(!sim.getSelectedTower());
        assert(sim.sellSelectedTower().error == CommandError::NoTargetSelected);

        int typeChanges = 0;
        int selections = 0;
        for (const auto& ev : sim.drainFacts()) {
            if (ev.as<SelectedTowerTypeChanged>()) ++typeChanges;
            if (const auto* sel = ev.as<TowerSelected>()) {
                ++selections;
                if (selections == 2) assert(sel->before == tower && !sel->after);
            }
        }
        assert(typeChanges == 1);
        assert(selections == 2);
    }
    {
        // Player movement, firing and upgrades.
        GameConfig cfg = laneConfig();
        cfg.player.enabled = true;
        cfg.player.startCell = Cell{10, 1};
        Simulation sim(cfg);
        assert(sim.getPlayer());
        const auto home = sim.getPlayer()->position;
        sim.start();
        assert(sim.setPlayerMovement(Engine::Vec2{1.0f, 0.0f}));
        sim.tick(0.05);
        assert(sim.getPlayer()->position.x > home.x);
        assert(sim.getPlayer()->position.y == home.y);

        const auto moved = sim.getPlayer()->position;
        assert(sim.setPlayerMovement(Engine::Vec2{std::numeric_limits<float>::quiet_NaN(), 1.0f}));
        sim.tick(0.05);
        assert(sim.getPlayer()->position == moved);

        assert(sim.setPlayerFiring(true));
        assert(sim.getPlayer()->firing);

        assert(sim.playerUpgradeCost(PlayerAttribute::Health) == 35);
        const auto up = sim.upgradePlayer(PlayerAttribute::Health);
        assert(up && up.value == 1);
        assert(sim.getCurrency() == 65);
        assert(std::fabs(sim.getPlayer()->maxHealth - 90.0f) < 1e-3f);
        assert(std::fabs(sim.getPlayer()->health - 90.0f) < 1e-3f);
        assert(sim.playerUpgradeCost(PlayerAttribute::Health) == 52);
        assert(sim.upgradePlayer(PlayerAttribute::Health).value == 2);
        assert(sim.getCurrency() == 13);
        assert(sim.upgradePlayer(PlayerAttribute::Regeneration).error == CommandError::InsufficientFunds);
        assert(sim.getPlayer()->levels[index(PlayerAttribute::Regeneration)] == 0);

        Simulation noPlayer(laneConfig());
        assert(!noPlayer.getPlayer());
        assert(noPlayer.setPlayerFiring(true).error == CommandError::UnknownEntity);
        noPlayer.start();
        assert(noPlayer.upgradePlayer(PlayerAttribute::Speed).error == CommandError::UnknownEntity);
    }
    {
        // A broken world faults the session: the tick throws, later ticks do nothing, reset recovers.
        Simulation sim(laneConfig());
        assert(sim.start());
        auto ctx = SimulationTestAccess::context(sim);
        EntityRegistry& registry = SimulationTestAccess::registry(sim);
        const auto target = registry.create(EntityKind::Enemy);
        ProjectileLaunch launch{};
        launch.origin = Engine::Vec2{5.0f, 15.0f};
        launch.guidance = ProjectileGuidance::Homing;
        launch.target = target;
        launch.heading = Engine::Vec2{1.0f, 0.0f};
        launch.speed = 10.0f;
        launch.maxRange = 100.0f;
        EntityFactory::launchProjectile(ctx, launch);
        registry.destroyNow(target);

        bool threw = false;
        try {
            sim.tick(0.05);
        } catch (const InvariantViolation&) {
            threw = true;
        }
        assert(threw);
        assert(sim.faulted());
        assert(!sim.ticking());
        const auto ticks = sim.tickCount();
        const double elapsed = sim.elapsedSeconds();
        sim.tick(0.05);
        sim.tick(0.05);
        assert(sim.tickCount() == ticks);
        assert(sim.elapsedSeconds() == elapsed);
        assert(sim.getState() == GameState::Playing);

        assert(sim.reset());
        assert(!sim.faulted());
        assert(sim.getProjectiles().empty());
        assert(sim.start());
        sim.tick(0.05);
        assert(sim.tickCount() == 1);
    }
    {
        // Undrained facts are capped; the oldest go first and the loss is counted.
        GameConfig cfg = laneConfig();
        cfg.simulation.journalCapacity = 3;
        Simulation sim(cfg);
        assert(sim.start());
        sim.setSelectedTowerType(TowerType::Basic);
        sim.setSelectedTowerType(TowerType::Sniper);
        sim.setSelectedTowerType(std::nullopt);
        sim.setSelectedTowerType(TowerType::Rapid);
        assert(sim.droppedFacts() == 2);
        const auto facts = sim.drainFacts();
        assert(facts.size() == 3);
        const auto* first = facts.front().as<SelectedTowerTypeChanged>();
        assert(first && first->after == TowerType::Sniper);
        const auto* last = facts.back().as<SelectedTowerTypeChanged>();
        assert(last && last->after == TowerType::Rapid);
        assert(sim.droppedFacts() == 0);

        cfg.simulation.journalCapacity = 0;
        bool threw = false;
        try {
            Simulation invalid(cfg);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }
    return 0;
}
