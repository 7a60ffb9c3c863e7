// Entity handle. Ids are issued monotonically and never recycled.
#pragma once

#include <cstdint>
#include <vector>

namespace Engine::ECS {

using Entity = std::uint32_t;
constexpr Entity kInvalidEntity = 0;

using EntityList = std::vector<Entity>;

}  // namespace Engine::ECS
