// Damage rules, targeting, projectile flight and impacts, target loss and contact attacks.
#include <cassert>
#include <cmath>
#include <memory>
#include <random>

#include "../engine/ecs/components/Health.h"
#include "../engine/ecs/components/Transform.h"
#include "../engine/gameplay/Combat.h"
#include "../rampart/CommandResult.h"
#include "../rampart/components/EnemyState.h"
#include "../rampart/components/PathFollower.h"
#include "../rampart/components/PlayerState.h"
#include "../rampart/components/ProjectileState.h"
#include "../rampart/components/TowerState.h"
#include "../rampart/config/GameConfig.h"
#include "../rampart/sim/SimContext.h"
#include "../rampart/systems/CombatResolver.h"
#include "../rampart/systems/MovementSystem.h"
#include "../rampart/systems/PickupSystem.h"
#include "../rampart/world/EntityFactory.h"

using namespace Engine::Gameplay;
using namespace Rampart;

namespace {
bool near(float a, float b) { return std::fabs(a - b) < 1e-3f; }

// 20x3 lane of 10-unit cells, spawn on the left, goal on the right.
GameConfig laneConfig() {
    GameConfig cfg = defaultConfig();
    cfg.grid = GridConfig{};
    cfg.grid.width = 20;
    cfg.grid.height = 3;
    cfg.grid.cellSize = 10.0f;
    cfg.grid.spawns = {Cell{0, 1}};
    cfg.grid.goal = Cell{19, 1};
    cfg.player.enabled = false;
    return cfg;
}

struct World {
    GameConfig config;
    SpatialGrid grid;
    PathPlanner planner;
    EntityRegistry registry;
    EconomyLedger ledger{100};
    SimJournal journal;
    std::mt19937 rng{7};

    explicit World(GameConfig cfg) : config(std::move(cfg)), grid(config.grid) {
        planner.recompute(grid);
        grid.clearDirty();
    }

    SimContext context(double dt, double now = 1.0) {
        return SimContext{config, grid, planner, registry, ledger, journal, rng, Engine::TimeStep{dt, now, 1},
                          TickOutcome{}};
    }
};

Engine::ECS::Entity addEnemy(EntityRegistry& registry, Engine::Vec2 pos, float health, float remaining) {
    const auto e = registry.create(EntityKind::Enemy);
    registry.emplace(e, Engine::ECS::Transform{pos, 5.0f});
    registry.emplace(e, Engine::ECS::Health{health, health, 0.0f});
    registry.emplace(e, EnemyState{});
    PathFollower follower{};
    follower.route = std::make_shared<const Route>(
        std::vector<Cell>{Cell{0, 0}, Cell{1, 0}},
        std::vector<Engine::Vec2>{Engine::Vec2{0.0f, 0.0f}, Engine::Vec2{100.0f, 0.0f}});
    follower.progress = 100.0f - remaining;
    registry.emplace(e, follower);
    return e;
}
}  // namespace

int main() {
    {
        // Clamped to min damage per hit.
        Engine::ECS::Health target{20.0f, 20.0f, 5.0f};
        DamageEvent hit{};
        hit.baseDamage = 3.0f;
        assert(applyDamage(target, hit) == 0.5f);
        assert(target.current == 19.5f);
    }
    {
        // True damage ignores armor; damage never drops health below zero.
        Engine::ECS::Health target{20.0f, 20.0f, 5.0f};
        assert(applyDamage(target, DamageEvent{8.0f, DamageType::True}) == 8.0f);
        assert(target.current == 12.0f);
        assert(applyDamage(target, DamageEvent{100.0f, DamageType::Normal}) == 12.0f);
        assert(target.current == 0.0f);
        assert(!target.alive());
        assert(applyDamage(target, DamageEvent{5.0f, DamageType::Normal}) == 0.0f);
    }
    {
        // Heals are capped at max health; cooldowns count down to ready.
        Engine::ECS::Health target{5.0f, 10.0f, 0.0f};
        assert(applyHeal(target, 3.0f) == 3.0f);
        assert(applyHeal(target, 10.0f) == 2.0f);
        assert(target.current == 10.0f);
        assert(applyHeal(target, 1.0f) == 0.0f);
        float cooldown = 1.0f;
        assert(!tickCooldown(cooldown, 0.4f));
        assert(tickCooldown(cooldown, 0.6f));
        assert(cooldown == 0.0f);
    }
    {
        // Target selection rules; ties go to the lowest id.
        EntityRegistry registry;
        const auto a = addEnemy(registry, Engine::Vec2{10.0f, 0.0f}, 30.0f, 80.0f);
        const auto b = addEnemy(registry, Engine::Vec2{-10.0f, 0.0f}, 20.0f, 20.0f);
        const auto c = addEnemy(registry, Engine::Vec2{0.0f, 50.0f}, 5.0f, 90.0f);
        const Engine::Vec2 origin{0.0f, 0.0f};
        assert(selectTarget(registry, origin, 20.0f, TargetingRule::Nearest) == a);
        assert(selectTarget(registry, origin, 20.0f, TargetingRule::FurthestAlongPath) == b);
        assert(selectTarget(registry, origin, 100.0f, TargetingRule::LowestHealth) == c);
        assert(selectTarget(registry, origin, 20.0f, TargetingRule::LowestHealth) == b);
        assert(selectTarget(registry, Engine::Vec2{500.0f, 0.0f}, 20.0f, TargetingRule::Nearest) ==
               Engine::ECS::kInvalidEntity);
        // Dead or dying enemies are never targeted.
        registry.destroyLater(a);
        assert(selectTarget(registry, origin, 20.0f, TargetingRule::Nearest) == b);
        registry.get<Engine::ECS::Health>(b)->current = 0.0f;
        assert(selectTarget(registry, origin, 20.0f, TargetingRule::Nearest) == Engine::ECS::kInvalidEntity);
    }
    {
        // A tower off cooldown fires one homing shot at the nearest enemy and starts its cooldown.
        World world(laneConfig());
        auto ctx = world.context(0.1);
        const auto enemy = EntityFactory::spawnEnemy(ctx, EnemyType::Basic, 0, 1, false, EnemyScaling{});
        const auto tower = EntityFactory::createTower(ctx, TowerType::Basic, Cell{3, 0});
        PickupSystem pickups;
        CombatResolver resolver(pickups);
        resolver.update(ctx);
        const auto shots = world.registry.projectiles();
        assert(shots.size() == 1);
        const auto* p = world.registry.get<ProjectileState>(shots.front());
        assert(p->owner == tower);
        assert(p->target == enemy);
        assert(p->guidance == ProjectileGuidance::Homing);
        assert(near(world.registry.get<TowerState>(tower)->cooldown, 1.0f));
        resolver.update(ctx);
        assert(world.registry.projectiles().size() == 1);
    }
    {
        // Homing shots close in and hit once; a kill pays out and records the killer.
        World world(laneConfig());
        auto ctx = world.context(0.1);
        const auto enemy = EntityFactory::spawnEnemy(ctx, EnemyType::Basic, 0, 1, false, EnemyScaling{});
        const Engine::Vec2 at = world.registry.get<Engine::ECS::Transform>(enemy)->position;
        ProjectileLaunch launch{};
        launch.owner = 99;
        launch.origin = at + Engine::Vec2{50.0f, 0.0f};
        launch.guidance = ProjectileGuidance::Homing;
        launch.target = enemy;
        launch.heading = Engine::Vec2{-1.0f, 0.0f};
        launch.speed = 1000.0f;
        launch.damage = 100.0f;
        launch.maxRange = 300.0f;
        const auto shot = EntityFactory::launchProjectile(ctx, launch);

        MovementSystem movement;
        PickupSystem pickups;
        CombatResolver resolver(pickups);
        world.registry.get<PathFollower>(enemy)->route = nullptr;
        movement.update(ctx);
        const auto landed = world.registry.get<Engine::ECS::Transform>(shot)->position;
        assert(near(landed.x, at.x) && near(landed.y, at.y));
        resolver.update(ctx);
        assert(world.registry.pendingDestroy(shot));
        assert(world.registry.pendingDestroy(enemy));
        assert(ctx.outcome.rewards == 10);
        assert(ctx.outcome.score == 50);
        const auto& facts = world.journal.facts();
        assert(!facts.empty());
        const auto* kill = facts.back().as<EnemyKilled>();
        assert(kill && kill->enemy == enemy && kill->killer == 99 && kill->reward == 10);
        // Drops only roll when there is a player to collect them.
        assert(world.registry.collectibles().empty());
    }
    {
        // Ballistic shots use a swept test so fast projectiles cannot tunnel through.
        World world(laneConfig());
        auto ctx = world.context(0.2);
        const auto enemy = EntityFactory::spawnEnemy(ctx, EnemyType::Basic, 0, 1, false, EnemyScaling{});
        world.registry.get<PathFollower>(enemy)->route = nullptr;
        const Engine::Vec2 at = world.registry.get<Engine::ECS::Transform>(enemy)->position;
        ProjectileLaunch launch{};
        launch.origin = at - Engine::Vec2{0.0f, 100.0f};
        launch.guidance = ProjectileGuidance::Ballistic;
        launch.heading = Engine::Vec2{0.0f, 1.0f};
        launch.speed = 1000.0f;
        launch.damage = 20.0f;
        launch.maxRange = 1000.0f;
        const auto shot = EntityFactory::launchProjectile(ctx, launch);

        MovementSystem movement;
        PickupSystem pickups;
        CombatResolver resolver(pickups);
        movement.update(ctx);
        assert(world.registry.get<Engine::ECS::Transform>(shot)->position.y > at.y + 50.0f);
        resolver.update(ctx);
        assert(world.registry.pendingDestroy(shot));
        assert(near(world.registry.get<Engine::ECS::Health>(enemy)->current, 30.0f));
        assert(!world.registry.pendingDestroy(enemy));
    }
    {
        // Ballistic shots that miss expire at their travel range without dealing damage.
        World world(laneConfig());
        auto ctx = world.context(0.1);
        const auto enemy = EntityFactory::spawnEnemy(ctx, EnemyType::Basic, 0, 1, false, EnemyScaling{});
        world.registry.get<PathFollower>(enemy)->route = nullptr;
        ProjectileLaunch launch{};
        launch.origin = Engine::Vec2{500.0f, 500.0f};
        launch.guidance = ProjectileGuidance::Ballistic;
        launch.heading = Engine::Vec2{1.0f, 0.0f};
        launch.speed = 1000.0f;
        launch.damage = 20.0f;
        launch.maxRange = 50.0f;
        const auto shot = EntityFactory::launchProjectile(ctx, launch);
        MovementSystem movement;
        PickupSystem pickups;
        CombatResolver resolver(pickups);
        movement.update(ctx);
        resolver.update(ctx);
        assert(world.registry.pendingDestroy(shot));
        assert(near(world.registry.get<Engine::ECS::Health>(enemy)->current, 50.0f));
    }
    {
        // Target loss: Discard removes the shot, ContinueBallistic keeps flying along the last heading.
        for (TargetLossPolicy policy : {TargetLossPolicy::Discard, TargetLossPolicy::ContinueBallistic}) {
            World world(laneConfig());
            auto ctx = world.context(0.1);
            const auto enemy = EntityFactory::spawnEnemy(ctx, EnemyType::Basic, 0, 1, false, EnemyScaling{});
            const Engine::Vec2 at = world.registry.get<Engine::ECS::Transform>(enemy)->position;
            ProjectileLaunch launch{};
            launch.origin = at + Engine::Vec2{150.0f, 0.0f};
            launch.guidance = ProjectileGuidance::Homing;
            launch.target = enemy;
            launch.heading = at - launch.origin;
            launch.onTargetLost = policy;
            launch.speed = 100.0f;
            launch.damage = 5.0f;
            launch.maxRange = 1000.0f;
            const auto shot = EntityFactory::launchProjectile(ctx, launch);

            world.registry.get<Engine::ECS::Health>(enemy)->current = 0.0f;
            PickupSystem pickups;
            CombatResolver resolver(pickups);
            resolver.resolveLostTargets(ctx);
            auto* p = world.registry.get<ProjectileState>(shot);
            if (policy == TargetLossPolicy::Discard) {
                assert(world.registry.pendingDestroy(shot));
                continue;
            }
            assert(!world.registry.pendingDestroy(shot));
            assert(p->guidance == ProjectileGuidance::Ballistic);
            assert(p->target == Engine::ECS::kInvalidEntity);
            world.registry.flushDestroyed();
            world.registry.destroyNow(enemy);
            MovementSystem movement;
            movement.update(ctx);
            const auto pos = world.registry.get<Engine::ECS::Transform>(shot)->position;
            assert(near(pos.x, launch.origin.x - 10.0f));
            assert(near(pos.y, launch.origin.y));
        }
    }
    {
        // A homing shot that references an entity no longer in the registry is an invariant violation.
        World world(laneConfig());
        auto ctx = world.context(0.1);
        const auto enemy = EntityFactory::spawnEnemy(ctx, EnemyType::Basic, 0, 1, false, EnemyScaling{});
        ProjectileLaunch launch{};
        launch.guidance = ProjectileGuidance::Homing;
        launch.target = enemy;
        launch.heading = Engine::Vec2{1.0f, 0.0f};
        launch.speed = 10.0f;
        launch.maxRange = 100.0f;
        EntityFactory::launchProjectile(ctx, launch);
        world.registry.destroyNow(enemy);
        MovementSystem movement;
        bool threw = false;
        try {
            movement.update(ctx);
        } catch (const InvariantViolation&) {
            threw = true;
        }
        assert(threw);
    }
    {
        // Enemies in reach hit the player on their own cooldown; a shield absorbs the hit.
        GameConfig cfg = laneConfig();
        cfg.player.enabled = true;
        cfg.player.startCell = Cell{1, 1};
        for (bool shielded : {false, true}) {
            World world(cfg);
            auto ctx = world.context(0.1);
            const auto player = EntityFactory::createPlayer(ctx);
            const auto enemy = EntityFactory::spawnEnemy(ctx, EnemyType::Basic, 0, 1, false, EnemyScaling{});
            if (shielded) world.registry.get<PlayerState>(player)->effects[CollectibleType::Shield] = 100.0;
            PickupSystem pickups;
            CombatResolver resolver(pickups);
            resolver.update(ctx);
            const auto* hp = world.registry.get<Engine::ECS::Health>(player);
            if (shielded) {
                assert(hp->current == 75.0f);
            } else {
                assert(hp->current == 65.0f);
                const auto* hurt = world.journal.facts().back().as<PlayerDamaged>();
                assert(hurt && hurt->source == enemy && hurt->before == 75.0f && hurt->after == 65.0f);
                assert(world.registry.get<PlayerState>(player)->regenDelay > 0.0f);
            }
            assert(world.registry.get<EnemyState>(enemy)->attackTimer > 0.0f);
            resolver.update(ctx);
            assert(hp->current == (shielded ? 75.0f : 65.0f));
        }
    }
    {
        // Enemies slow down on rough ground and speed up on a path, judged by the cell they stand in.
        for (Terrain ground : {Terrain::Open, Terrain::Rough, Terrain::Path}) {
            GameConfig cfg = laneConfig();
            if (ground != Terrain::Open) cfg.grid.terrain = {TerrainPatch{ground, {Cell{0, 1}}}};
            World world(cfg);
            auto ctx = world.context(0.1);
            const auto enemy = EntityFactory::spawnEnemy(ctx, EnemyType::Basic, 0, 1, false, EnemyScaling{});
            MovementSystem movement;
            movement.update(ctx);
            const float expected = 50.0f * 0.1f * cfg.grid.speedFor(ground);
            assert(near(world.registry.get<PathFollower>(enemy)->progress, expected));
            assert(near(world.registry.get<PathFollower>(enemy)->travelled, expected));
        }
    }
    {
        // A shield expiring on this tick no longer absorbs contact damage, even before expiry cleanup runs.
        GameConfig cfg = laneConfig();
        cfg.player.enabled = true;
        cfg.player.startCell = Cell{1, 1};
        World world(cfg);
        auto ctx = world.context(0.1, 1.0);
        const auto player = EntityFactory::createPlayer(ctx);
        EntityFactory::spawnEnemy(ctx, EnemyType::Basic, 0, 1, false, EnemyScaling{});
        world.registry.get<PlayerState>(player)->effects[CollectibleType::Shield] = 1.0;
        PickupSystem pickups;
        CombatResolver resolver(pickups);
        resolver.update(ctx);
        assert(world.registry.get<Engine::ECS::Health>(player)->current == 65.0f);
    }
    return 0;
}
