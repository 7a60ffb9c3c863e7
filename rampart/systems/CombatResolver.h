// Targeting, firing, projectile impacts, kills and enemy contact attacks.
#pragma once

#include "../../engine/ecs/Entity.h"
#include "../../engine/math/Vec2.h"
#include "../Types.h"
#include "../sim/SimContext.h"

namespace Rampart {

class PickupSystem;

// Live enemy within `range` of `origin` chosen by `rule`; ties go to the lowest id.
// kInvalidEntity when nothing is in range.
Engine::ECS::Entity selectTarget(const EntityRegistry& registry, const Engine::Vec2& origin, float range,
                                 TargetingRule rule);

class CombatResolver {
public:
    explicit CombatResolver(PickupSystem& pickups) : pickups_(pickups) {}

    void update(SimContext& ctx);

    // Settles homing projectiles whose target died or is being removed. Runs before the flush.
    void resolveLostTargets(SimContext& ctx);

private:
    void fireTowers(SimContext& ctx);
    void firePlayer(SimContext& ctx);
    void resolveImpacts(SimContext& ctx);
    void enemyAttacks(SimContext& ctx);

    // Applies one hit; returns true if it killed the enemy.
    bool hitEnemy(SimContext& ctx, Engine::ECS::Entity enemy, Engine::ECS::Entity killer, float damage);

    PickupSystem& pickups_;
};

}  // namespace Rampart
