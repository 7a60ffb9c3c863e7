#include "MovementSystem.h"

#include <algorithm>
#include <string>

#include "../../engine/ecs/components/Health.h"
#include "../../engine/ecs/components/Transform.h"
#include "../CommandResult.h"
#include "../components/EnemyState.h"
#include "../components/PathFollower.h"
#include "../components/PlayerState.h"
#include "../components/ProjectileState.h"

namespace Rampart {

void MovementSystem::reroute(SimContext& ctx) {
    for (auto e : ctx.registry.enemies()) {
        auto* tf = ctx.registry.get<Engine::ECS::Transform>(e);
        auto* follower = ctx.registry.get<PathFollower>(e);
        if (!tf || !follower) continue;
        auto route = ctx.planner.routeFrom(ctx.grid, tf->position);
        if (!route) {
            throw InvariantViolation("enemy " + std::to_string(e) + " lost its route to the goal");
        }
        if (!PathPlanner::routeIsWalkable(ctx.grid, *route)) {
            throw InvariantViolation("route for enemy " + std::to_string(e) + " crosses a non-walkable cell");
        }
        follower->route = std::move(route);
        follower->progress = 0.0f;
    }
}

void MovementSystem::update(SimContext& ctx) {
    moveEnemies(ctx);
    moveProjectiles(ctx);
    movePlayer(ctx);
}

void MovementSystem::moveEnemies(SimContext& ctx) {
    const float dt = static_cast<float>(ctx.step.deltaSeconds);
    for (auto e : ctx.registry.enemies()) {
        auto* tf = ctx.registry.get<Engine::ECS::Transform>(e);
        auto* follower = ctx.registry.get<PathFollower>(e);
        const auto* state = ctx.registry.get<EnemyState>(e);
        if (!tf || !follower || !state || !follower->route) continue;

        const float step = state->speed * ctx.grid.speedFactor(ctx.grid.cellAt(tf->position)) * dt;
        follower->progress = std::min(follower->progress + step, follower->route->length());
        follower->travelled += step;
        tf->position = follower->route->positionAt(follower->progress);

        if (follower->arrived()) {
            ctx.outcome.livesLost += state->livesCost;
            ctx.journal.record(EnemyReachedGoal{e, state->livesCost});
            ctx.registry.destroyLater(e);
        }
    }
}

void MovementSystem::moveProjectiles(SimContext& ctx) {
    const float dt = static_cast<float>(ctx.step.deltaSeconds);
    for (auto e : ctx.registry.projectiles()) {
        auto* tf = ctx.registry.get<Engine::ECS::Transform>(e);
        auto* p = ctx.registry.get<ProjectileState>(e);
        if (!tf || !p) continue;
        p->previous = tf->position;

        if (p->guidance == ProjectileGuidance::Homing) {
            if (!ctx.registry.valid(p->target)) {
                throw InvariantViolation("projectile " + std::to_string(e) + " references missing entity " +
                                         std::to_string(p->target));
            }
            // Dead or dying targets are settled by the target-loss policy at the end of the tick.
            const auto* hp = ctx.registry.get<Engine::ECS::Health>(p->target);
            if (ctx.registry.pendingDestroy(p->target) || !hp || !hp->alive()) continue;
            const auto* targetTf = ctx.registry.get<Engine::ECS::Transform>(p->target);
            if (!targetTf) continue;
            const Engine::Vec2 toTarget = targetTf->position - tf->position;
            const float dist = toTarget.length();
            if (dist > 0.0f) p->heading = toTarget * (1.0f / dist);
            const float step = std::min(p->speed * dt, dist);
            tf->position += p->heading * step;
            p->travelled += step;
        } else {
            const float step = p->speed * dt;
            tf->position += p->heading * step;
            p->travelled += step;
        }
    }
}

void MovementSystem::movePlayer(SimContext& ctx) {
    const auto e = ctx.registry.player();
    if (e == Engine::ECS::kInvalidEntity) return;
    auto* tf = ctx.registry.get<Engine::ECS::Transform>(e);
    auto* player = ctx.registry.get<PlayerState>(e);
    if (!tf || !player || player->downed) return;
    const Engine::Vec2 dir = player->moveDirection.normalized();
    if (dir.lengthSquared() <= 0.0f) return;

    float speed = player->speed;
    if (player->hasEffect(CollectibleType::SpeedBoost, ctx.step.elapsedSeconds)) speed *= ctx.config.drops.speedBoostMultiplier;
    tf->position += dir * (speed * static_cast<float>(ctx.step.deltaSeconds));

    const float maxX = static_cast<float>(ctx.grid.width()) * ctx.grid.cellSize();
    const float maxY = static_cast<float>(ctx.grid.height()) * ctx.grid.cellSize();
    tf->position.x = std::clamp(tf->position.x, tf->radius, std::max(tf->radius, maxX - tf->radius));
    tf->position.y = std::clamp(tf->position.y, tf->radius, std::max(tf->radius, maxY - tf->radius));
}

}  // namespace Rampart
