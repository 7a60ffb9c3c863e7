#include "EntityFactory.h"

#include <algorithm>
#include <cmath>
#include <string>

#include "../../engine/ecs/components/Health.h"
#include "../../engine/ecs/components/Transform.h"
#include "../CommandResult.h"
#include "../components/CollectibleState.h"
#include "../components/EnemyState.h"
#include "../components/PathFollower.h"
#include "../components/PlayerState.h"
#include "../components/ProjectileState.h"
#include "../components/TowerState.h"
#include "../economy/UpgradeCurves.h"

namespace Rampart {

namespace {
constexpr float kCollectibleRadius = 8.0f;
}  // namespace

Engine::ECS::Entity EntityFactory::createTower(SimContext& ctx, TowerType type, const Cell& cell) {
    const TowerDefinition& def = ctx.config.tower(type);
    const auto e = ctx.registry.create(EntityKind::Tower);
    ctx.registry.emplace(e, Engine::ECS::Transform{ctx.grid.cellCenter(cell), ctx.grid.cellSize() * 0.5f});

    TowerState tower{};
    tower.type = type;
    tower.cell = cell;
    tower.maxLevel = std::max(0, def.maxUpgradeLevel);
    tower.cumulativeSpend = def.cost;
    applyTowerUpgrades(tower, ctx.config);
    ctx.registry.emplace(e, tower);
    return e;
}

Engine::ECS::Entity EntityFactory::spawnEnemy(SimContext& ctx, EnemyType type, int spawnIndex, int wave, bool boss,
                                              const EnemyScaling& scaling) {
    const auto& spawns = ctx.grid.spawns();
    if (spawns.empty()) throw InvariantViolation("no spawn points configured");
    const int count = static_cast<int>(spawns.size());
    const int idx = ((spawnIndex % count) + count) % count;
    const Cell spawn = spawns[static_cast<std::size_t>(idx)];

    auto route = ctx.planner.routeFrom(ctx.grid, spawn);
    if (!route) {
        throw InvariantViolation("spawn (" + std::to_string(spawn.x) + "," + std::to_string(spawn.y) +
                                 ") has no route to the goal");
    }

    const EnemyDefinition& def = ctx.config.enemy(type);
    const DifficultyConfig& diff = ctx.config.difficulty;
    float healthMul = scaling.health;
    float speedMul = scaling.speed;
    std::int64_t reward = def.reward;
    int livesCost = def.livesCost;
    if (boss) {
        healthMul *= diff.bossHealthMultiplier;
        speedMul *= diff.bossSpeedMultiplier;
        reward = static_cast<std::int64_t>(std::floor(static_cast<double>(reward) * diff.bossRewardMultiplier));
        livesCost = std::max(livesCost, diff.bossLivesCost);
    }

    const auto e = ctx.registry.create(EntityKind::Enemy);
    const float radius = boss ? def.radius * 1.5f : def.radius;
    ctx.registry.emplace(e, Engine::ECS::Transform{route->positionAt(0.0f), radius});
    const float hp = def.health * healthMul;
    ctx.registry.emplace(e, Engine::ECS::Health{hp, hp, def.armor});

    EnemyState state{};
    state.type = type;
    state.speed = def.speed * speedMul;
    state.healthMultiplier = healthMul;
    state.speedMultiplier = speedMul;
    state.reward = reward;
    state.livesCost = livesCost;
    state.contactDamage = def.contactDamage;
    state.attackRange = def.attackRange;
    state.attackCooldown = def.attackCooldown;
    state.boss = boss;
    state.waveIndex = wave;
    ctx.registry.emplace(e, state);

    PathFollower follower{};
    follower.route = std::move(route);
    follower.spawnIndex = idx;
    ctx.registry.emplace(e, follower);

    ctx.journal.record(EnemySpawned{e, type, wave, boss});
    return e;
}

Engine::ECS::Entity EntityFactory::createPlayer(SimContext& ctx) {
    const PlayerConfig& cfg = ctx.config.player;
    const auto e = ctx.registry.create(EntityKind::Player);
    ctx.registry.emplace(e, Engine::ECS::Transform{ctx.grid.cellCenter(cfg.startCell), cfg.radius});
    auto& health = ctx.registry.emplace(e, Engine::ECS::Health{cfg.health, cfg.health, 0.0f});
    auto& player = ctx.registry.emplace(e, PlayerState{});
    applyPlayerUpgrades(player, health, ctx.config);
    return e;
}

Engine::ECS::Entity EntityFactory::launchProjectile(SimContext& ctx, const ProjectileLaunch& launch) {
    const auto e = ctx.registry.create(EntityKind::Projectile);
    ctx.registry.emplace(e, Engine::ECS::Transform{launch.origin, ctx.config.combat.projectileHitRadius});

    ProjectileState p{};
    p.owner = launch.owner;
    p.guidance = launch.guidance;
    p.target = launch.guidance == ProjectileGuidance::Homing ? launch.target : Engine::ECS::kInvalidEntity;
    p.onTargetLost = launch.onTargetLost;
    p.origin = launch.origin;
    p.previous = launch.origin;
    p.heading = launch.heading.normalized();
    p.speed = launch.speed;
    p.damage = launch.damage;
    p.maxRange = launch.maxRange;
    p.hitRadius = ctx.config.combat.projectileHitRadius;
    ctx.registry.emplace(e, p);
    return e;
}

Engine::ECS::Entity EntityFactory::dropCollectible(SimContext& ctx, CollectibleType type,
                                                   const Engine::Vec2& position) {
    const auto e = ctx.registry.create(EntityKind::Collectible);
    ctx.registry.emplace(e, Engine::ECS::Transform{position, kCollectibleRadius});
    ctx.registry.emplace(e, CollectibleState{type, ctx.config.drops.lifetimeSeconds});
    return e;
}

}  // namespace Rampart
