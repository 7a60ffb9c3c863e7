// Validated construction of every entity kind with its full component set.
#pragma once

#include "../../engine/ecs/Entity.h"
#include "../../engine/math/Vec2.h"
#include "../Types.h"
#include "../sim/SimContext.h"

namespace Rampart {

struct EnemyScaling {
    float health{1.0f};
    float speed{1.0f};
};

struct ProjectileLaunch {
    Engine::ECS::Entity owner{Engine::ECS::kInvalidEntity};
    Engine::Vec2 origin{};
    ProjectileGuidance guidance{ProjectileGuidance::Homing};
    Engine::ECS::Entity target{Engine::ECS::kInvalidEntity};
    Engine::Vec2 heading{};
    TargetLossPolicy onTargetLost{TargetLossPolicy::Discard};
    float speed{0.0f};
    float damage{0.0f};
    float maxRange{0.0f};
};

class EntityFactory {
public:
    // The cell must already have passed SpatialGrid::validatePlacement.
    static Engine::ECS::Entity createTower(SimContext& ctx, TowerType type, const Cell& cell);

    // Throws InvariantViolation if the spawn has no route to the goal.
    static Engine::ECS::Entity spawnEnemy(SimContext& ctx, EnemyType type, int spawnIndex, int wave, bool boss,
                                          const EnemyScaling& scaling);

    static Engine::ECS::Entity createPlayer(SimContext& ctx);

    static Engine::ECS::Entity launchProjectile(SimContext& ctx, const ProjectileLaunch& launch);

    static Engine::ECS::Entity dropCollectible(SimContext& ctx, CollectibleType type, const Engine::Vec2& position);
};

}  // namespace Rampart
