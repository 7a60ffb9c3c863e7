// Read-only copies of entity state returned by Simulation queries.
#pragma once

#include <array>
#include <cstdint>
#include <map>

#include "../../engine/ecs/Entity.h"
#include "../../engine/math/Vec2.h"
#include "../Types.h"
#include "../world/Cell.h"

namespace Rampart {

struct TowerView {
    Engine::ECS::Entity id{Engine::ECS::kInvalidEntity};
    TowerType type{TowerType::Basic};
    Cell cell{};
    Engine::Vec2 position{};
    float damage{0.0f};
    float range{0.0f};
    float fireRate{0.0f};
    std::array<int, kTowerAttributeCount> levels{};
    int maxLevel{0};
    std::int64_t cumulativeSpend{0};
};

struct EnemyView {
    Engine::ECS::Entity id{Engine::ECS::kInvalidEntity};
    EnemyType type{EnemyType::Basic};
    Engine::Vec2 position{};
    float health{0.0f};
    float maxHealth{0.0f};
    float armor{0.0f};
    float speed{0.0f};
    float progress{0.0f};
    float routeLength{0.0f};
    std::int64_t reward{0};
    bool boss{false};
    int wave{0};
};

struct ProjectileView {
    Engine::ECS::Entity id{Engine::ECS::kInvalidEntity};
    Engine::ECS::Entity owner{Engine::ECS::kInvalidEntity};
    ProjectileGuidance guidance{ProjectileGuidance::Homing};
    Engine::ECS::Entity target{Engine::ECS::kInvalidEntity};
    Engine::Vec2 position{};
    Engine::Vec2 heading{};
    float damage{0.0f};
    float travelled{0.0f};
};

struct CollectibleView {
    Engine::ECS::Entity id{Engine::ECS::kInvalidEntity};
    CollectibleType type{CollectibleType::Health};
    Engine::Vec2 position{};
    float remaining{0.0f};
};

struct PlayerView {
    Engine::ECS::Entity id{Engine::ECS::kInvalidEntity};
    Engine::Vec2 position{};
    float health{0.0f};
    float maxHealth{0.0f};
    float damage{0.0f};
    float speed{0.0f};
    float fireRate{0.0f};
    float regenPerSecond{0.0f};
    std::array<int, kPlayerAttributeCount> levels{};
    bool downed{false};
    bool firing{false};
    std::map<CollectibleType, double> effects;
};

}  // namespace Rampart
