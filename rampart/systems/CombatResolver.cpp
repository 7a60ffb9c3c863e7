#include "CombatResolver.h"

#include <algorithm>
#include <limits>
#include <string>

#include "../../engine/ecs/components/Health.h"
#include "../../engine/ecs/components/Transform.h"
#include "../../engine/gameplay/Combat.h"
#include "../CommandResult.h"
#include "../components/EnemyState.h"
#include "../components/PathFollower.h"
#include "../components/PlayerState.h"
#include "../components/ProjectileState.h"
#include "../components/TowerState.h"
#include "../world/EntityFactory.h"
#include "PickupSystem.h"

namespace Rampart {

namespace {
bool targetable(const EntityRegistry& registry, Engine::ECS::Entity e) {
    if (!registry.isKind(e, EntityKind::Enemy) || registry.pendingDestroy(e)) return false;
    const auto* hp = registry.get<Engine::ECS::Health>(e);
    return hp && hp->alive();
}

// Parameter in [0,1] of the closest approach of `p` to segment ab, and the squared distance there.
float closestOnSegment(const Engine::Vec2& a, const Engine::Vec2& b, const Engine::Vec2& p, float& distSq) {
    const Engine::Vec2 ab = b - a;
    const float lenSq = ab.lengthSquared();
    float t = 0.0f;
    if (lenSq > 0.0f) {
        const Engine::Vec2 ap = p - a;
        t = std::clamp((ap.x * ab.x + ap.y * ab.y) / lenSq, 0.0f, 1.0f);
    }
    distSq = Engine::distanceSquared(a + ab * t, p);
    return t;
}
}  // namespace

Engine::ECS::Entity selectTarget(const EntityRegistry& registry, const Engine::Vec2& origin, float range,
                                 TargetingRule rule) {
    const float rangeSq = range * range;
    Engine::ECS::Entity best = Engine::ECS::kInvalidEntity;
    float bestScore = std::numeric_limits<float>::max();
    for (auto e : registry.enemies()) {
        if (!targetable(registry, e)) continue;
        const auto* tf = registry.get<Engine::ECS::Transform>(e);
        if (!tf) continue;
        const float distSq = Engine::distanceSquared(origin, tf->position);
        if (distSq > rangeSq) continue;

        float score = distSq;
        switch (rule) {
            case TargetingRule::Nearest:
                score = distSq;
                break;
            case TargetingRule::FurthestAlongPath: {
                // Least distance left to the goal.
                const auto* follower = registry.get<PathFollower>(e);
                score = (follower && follower->route) ? follower->route->length() - follower->progress : 0.0f;
                break;
            }
            case TargetingRule::LowestHealth:
                score = registry.get<Engine::ECS::Health>(e)->current;
                break;
        }
        // Enemies come in ascending id order, so strict < keeps the lowest id on ties.
        if (score < bestScore) {
            bestScore = score;
            best = e;
        }
    }
    return best;
}

void CombatResolver::update(SimContext& ctx) {
    fireTowers(ctx);
    firePlayer(ctx);
    resolveImpacts(ctx);
    enemyAttacks(ctx);
}

void CombatResolver::fireTowers(SimContext& ctx) {
    const float dt = static_cast<float>(ctx.step.deltaSeconds);
    const CombatConfig& combat = ctx.config.combat;
    for (auto e : ctx.registry.towers()) {
        auto* tower = ctx.registry.get<TowerState>(e);
        const auto* tf = ctx.registry.get<Engine::ECS::Transform>(e);
        if (!tower || !tf || !tower->attacks()) continue;
        if (!Engine::Gameplay::tickCooldown(tower->cooldown, dt)) continue;

        const auto target = selectTarget(ctx.registry, tf->position, tower->range, combat.targeting);
        if (target == Engine::ECS::kInvalidEntity) continue;
        const auto* targetTf = ctx.registry.get<Engine::ECS::Transform>(target);

        ProjectileLaunch launch{};
        launch.owner = e;
        launch.origin = tf->position;
        launch.guidance = ProjectileGuidance::Homing;
        launch.target = target;
        launch.heading = targetTf->position - tf->position;
        launch.onTargetLost = combat.towerTargetLoss;
        launch.speed = combat.towerProjectileSpeed;
        launch.damage = tower->damage;
        launch.maxRange = tower->range * combat.homingRangeFactor;
        EntityFactory::launchProjectile(ctx, launch);

        tower->lastTarget = target;
        tower->cooldown = 1.0f / tower->fireRate;
    }
}

void CombatResolver::firePlayer(SimContext& ctx) {
    const auto e = ctx.registry.player();
    if (e == Engine::ECS::kInvalidEntity) return;
    auto* player = ctx.registry.get<PlayerState>(e);
    const auto* tf = ctx.registry.get<Engine::ECS::Transform>(e);
    if (!player || !tf) return;

    const float dt = static_cast<float>(ctx.step.deltaSeconds);
    const bool ready = Engine::Gameplay::tickCooldown(player->fireCooldown, dt);
    if (!ready || !player->firing || player->downed || player->fireRate <= 0.0f) return;

    const CombatConfig& combat = ctx.config.combat;
    const DropConfig& drops = ctx.config.drops;
    const float range = ctx.config.player.projectileRange;
    const auto target = selectTarget(ctx.registry, tf->position, range, TargetingRule::Nearest);
    if (target == Engine::ECS::kInvalidEntity) return;
    const auto* targetTf = ctx.registry.get<Engine::ECS::Transform>(target);

    float damage = player->damage;
    if (player->hasEffect(CollectibleType::ExtraDamage, ctx.step.elapsedSeconds)) damage *= drops.extraDamageMultiplier;
    float fireRate = player->fireRate;
    if (player->hasEffect(CollectibleType::FasterShooting, ctx.step.elapsedSeconds)) fireRate *= drops.fasterShootingMultiplier;

    ProjectileLaunch launch{};
    launch.owner = e;
    launch.origin = tf->position;
    launch.guidance = combat.playerGuidance;
    launch.target = target;
    launch.heading = targetTf->position - tf->position;
    launch.onTargetLost = combat.playerTargetLoss;
    launch.speed = combat.playerProjectileSpeed;
    launch.damage = damage;
    launch.maxRange = combat.playerGuidance == ProjectileGuidance::Homing ? range * combat.homingRangeFactor : range;
    EntityFactory::launchProjectile(ctx, launch);

    player->fireCooldown = 1.0f / fireRate;
}

void CombatResolver::resolveImpacts(SimContext& ctx) {
    for (auto e : ctx.registry.projectiles()) {
        auto* p = ctx.registry.get<ProjectileState>(e);
        const auto* tf = ctx.registry.get<Engine::ECS::Transform>(e);
        if (!p || !tf) continue;

        if (p->guidance == ProjectileGuidance::Homing) {
            if (!ctx.registry.valid(p->target)) {
                throw InvariantViolation("projectile " + std::to_string(e) + " references missing entity " +
                                         std::to_string(p->target));
            }
            if (!targetable(ctx.registry, p->target)) continue;
            const auto* targetTf = ctx.registry.get<Engine::ECS::Transform>(p->target);
            const float reach = p->hitRadius + targetTf->radius;
            if (Engine::distanceSquared(tf->position, targetTf->position) <= reach * reach) {
                hitEnemy(ctx, p->target, p->owner, p->damage);
                ctx.registry.destroyLater(e);
            } else if (p->travelled >= p->maxRange) {
                ctx.registry.destroyLater(e);
            }
            continue;
        }

        // Ballistic: first enemy touched along this tick's segment.
        Engine::ECS::Entity hit = Engine::ECS::kInvalidEntity;
        float hitT = std::numeric_limits<float>::max();
        for (auto enemy : ctx.registry.enemies()) {
            if (!targetable(ctx.registry, enemy)) continue;
            const auto* etf = ctx.registry.get<Engine::ECS::Transform>(enemy);
            if (!etf) continue;
            float distSq = 0.0f;
            const float t = closestOnSegment(p->previous, tf->position, etf->position, distSq);
            const float reach = p->hitRadius + etf->radius;
            if (distSq <= reach * reach && t < hitT) {
                hitT = t;
                hit = enemy;
            }
        }
        if (hit != Engine::ECS::kInvalidEntity) {
            hitEnemy(ctx, hit, p->owner, p->damage);
            ctx.registry.destroyLater(e);
        } else if (p->travelled >= p->maxRange) {
            ctx.registry.destroyLater(e);
        }
    }
}

bool CombatResolver::hitEnemy(SimContext& ctx, Engine::ECS::Entity enemy, Engine::ECS::Entity killer, float damage) {
    auto* hp = ctx.registry.get<Engine::ECS::Health>(enemy);
    const auto* state = ctx.registry.get<EnemyState>(enemy);
    if (!hp || !state || !hp->alive()) return false;
    Engine::Gameplay::applyDamage(*hp, Engine::Gameplay::DamageEvent{damage, Engine::Gameplay::DamageType::Normal});
    if (hp->alive()) return false;

    ctx.outcome.rewards += state->reward;
    ctx.outcome.score += state->reward * ctx.config.economy.scorePerReward;
    ctx.journal.record(EnemyKilled{enemy, killer, state->type, state->reward});
    if (const auto* tf = ctx.registry.get<Engine::ECS::Transform>(enemy)) {
        pickups_.rollDrop(ctx, tf->position);
    }
    ctx.registry.destroyLater(enemy);
    return true;
}

void CombatResolver::enemyAttacks(SimContext& ctx) {
    const float dt = static_cast<float>(ctx.step.deltaSeconds);
    const auto playerId = ctx.registry.player();
    auto* player = ctx.registry.get<PlayerState>(playerId);
    auto* playerHp = ctx.registry.get<Engine::ECS::Health>(playerId);
    const auto* playerTf = ctx.registry.get<Engine::ECS::Transform>(playerId);

    for (auto e : ctx.registry.enemies()) {
        auto* state = ctx.registry.get<EnemyState>(e);
        const auto* tf = ctx.registry.get<Engine::ECS::Transform>(e);
        if (!state || !tf || !targetable(ctx.registry, e)) continue;
        const bool ready = Engine::Gameplay::tickCooldown(state->attackTimer, dt);
        if (!ready || state->contactDamage <= 0.0f) continue;
        if (!player || !playerHp || !playerTf || player->downed || !playerHp->alive()) continue;

        const float reach = state->attackRange + playerTf->radius;
        if (Engine::distanceSquared(tf->position, playerTf->position) > reach * reach) continue;

        state->attackTimer = state->attackCooldown;
        if (player->hasEffect(CollectibleType::Shield, ctx.step.elapsedSeconds)) continue;

        const float before = playerHp->current;
        Engine::Gameplay::applyDamage(*playerHp,
                                      Engine::Gameplay::DamageEvent{state->contactDamage,
                                                                    Engine::Gameplay::DamageType::Normal});
        ctx.journal.record(PlayerDamaged{e, before, playerHp->current});
        player->regenDelay = ctx.config.player.regenDelaySeconds;
        if (!playerHp->alive()) {
            player->downed = true;
            player->respawnTimer = ctx.config.player.respawnSeconds;
            player->effects.clear();
        }
    }
}

void CombatResolver::resolveLostTargets(SimContext& ctx) {
    for (auto e : ctx.registry.projectiles()) {
        auto* p = ctx.registry.get<ProjectileState>(e);
        if (!p || p->guidance != ProjectileGuidance::Homing) continue;
        if (targetable(ctx.registry, p->target)) continue;

        switch (p->onTargetLost) {
            case TargetLossPolicy::Discard:
                ctx.registry.destroyLater(e);
                break;
            case TargetLossPolicy::ContinueBallistic:
                p->guidance = ProjectileGuidance::Ballistic;
                p->target = Engine::ECS::kInvalidEntity;
                if (p->heading.lengthSquared() <= 0.0f) ctx.registry.destroyLater(e);
                break;
        }
    }
}

}  // namespace Rampart
