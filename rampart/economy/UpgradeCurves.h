// Upgrade pricing and the stat effects of upgrade levels.
#pragma once

#include <cstdint>
#include <optional>

#include "../../engine/ecs/components/Health.h"
#include "../components/PlayerState.h"
#include "../components/TowerState.h"
#include "../config/GameConfig.h"

namespace Rampart {

// Price of buying level `level + 1` while at `level`:
// max(floor(base * modifier * growth^level), price(level - 1) + 1), so strictly increasing.
std::int64_t upgradeCost(const UpgradeCurve& curve, int level, float costModifier = 1.0f);

// nullopt once `currentLevel` has reached `maxLevel`.
std::optional<std::int64_t> costForNext(const UpgradeCurve& curve, int currentLevel, int maxLevel,
                                        float costModifier = 1.0f);

int clampLevel(int maxLevel, int level);

// Lowest of the tower type's cap and the attribute curve's cap.
int towerMaxLevel(const GameConfig& config, TowerType type, TowerAttribute attr);
int playerMaxLevel(const GameConfig& config, PlayerAttribute attr);

// 1 + effectPerLevel * level.
float effectMultiplier(const UpgradeCurve& curve, int level);

// Recomputes effective tower stats from its base definition and levels.
void applyTowerUpgrades(TowerState& tower, const GameConfig& config);

// Recomputes player stats. Raising max health raises current health by the same amount.
void applyPlayerUpgrades(PlayerState& player, Engine::ECS::Health& health, const GameConfig& config);

}  // namespace Rampart
