// In-flight shot fired by a tower or the player.
#pragma once

#include "../../engine/ecs/Entity.h"
#include "../../engine/math/Vec2.h"
#include "../Types.h"

namespace Rampart {

struct ProjectileState {
    Engine::ECS::Entity owner{Engine::ECS::kInvalidEntity};
    ProjectileGuidance guidance{ProjectileGuidance::Homing};
    Engine::ECS::Entity target{Engine::ECS::kInvalidEntity};  // homing only
    TargetLossPolicy onTargetLost{TargetLossPolicy::Discard};
    Engine::Vec2 origin{};
    Engine::Vec2 previous{};  // position before the last move, for swept hits
    Engine::Vec2 heading{};  // unit vector; last known for homing
    float speed{0.0f};
    float damage{0.0f};
    float travelled{0.0f};
    float maxRange{0.0f};
    float hitRadius{0.0f};
};

}  // namespace Rampart
