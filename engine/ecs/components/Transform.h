// World-space position component.
#pragma once

#include "../../math/Vec2.h"

namespace Engine::ECS {

struct Transform {
    Vec2 position{};
    float radius{0.0f};  // collision / pickup circle
};

}  // namespace Engine::ECS
