// Placed tower: type, cell, upgrade levels and fire cooldown.
#pragma once

#include <array>
#include <cstdint>

#include "../../engine/ecs/Entity.h"
#include "../Types.h"
#include "../world/Cell.h"

namespace Rampart {

struct TowerState {
    TowerType type{TowerType::Basic};
    Cell cell{};
    // Effective stats after upgrades.
    float damage{0.0f};
    float range{0.0f};
    float fireRate{0.0f};
    std::array<int, kTowerAttributeCount> levels{};
    int maxLevel{0};
    std::int64_t cumulativeSpend{0};
    float cooldown{0.0f};
    Engine::ECS::Entity lastTarget{Engine::ECS::kInvalidEntity};

    int level(TowerAttribute attr) const { return levels[index(attr)]; }
    bool attacks() const { return damage > 0.0f && fireRate > 0.0f && range > 0.0f; }
};

}  // namespace Rampart
