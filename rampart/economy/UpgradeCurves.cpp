#include "UpgradeCurves.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace Rampart {

std::int64_t upgradeCost(const UpgradeCurve& curve, int level, float costModifier) {
    const double maxInt = static_cast<double>(std::numeric_limits<std::int64_t>::max());
    const double base = static_cast<double>(curve.baseCost) * static_cast<double>(costModifier);
    std::int64_t prev = 0;
    std::int64_t cost = 0;
    for (int l = 0; l <= std::max(0, level); ++l) {
        double raw = base * std::pow(curve.growth, static_cast<double>(l));
        raw = std::max(raw, 1.0);
        if (raw >= maxInt) return std::numeric_limits<std::int64_t>::max();
        cost = static_cast<std::int64_t>(std::floor(raw));
        if (l > 0) cost = std::max(cost, prev + 1);
        prev = cost;
    }
    return cost;
}

std::optional<std::int64_t> costForNext(const UpgradeCurve& curve, int currentLevel, int maxLevel,
                                        float costModifier) {
    const int clamped = clampLevel(maxLevel, currentLevel);
    if (clamped >= maxLevel) return std::nullopt;
    return upgradeCost(curve, clamped, costModifier);
}

int clampLevel(int maxLevel, int level) { return std::clamp(level, 0, std::max(0, maxLevel)); }

int towerMaxLevel(const GameConfig& config, TowerType type, TowerAttribute attr) {
    return std::max(0, std::min(config.tower(type).maxUpgradeLevel, config.towerUpgrade(attr).maxLevel));
}

int playerMaxLevel(const GameConfig& config, PlayerAttribute attr) {
    return std::max(0, config.playerUpgrade(attr).maxLevel);
}

float effectMultiplier(const UpgradeCurve& curve, int level) {
    return 1.0f + curve.effectPerLevel * static_cast<float>(std::max(0, level));
}

void applyTowerUpgrades(TowerState& tower, const GameConfig& config) {
    const TowerDefinition& base = config.tower(tower.type);
    tower.damage = base.damage * effectMultiplier(config.towerUpgrade(TowerAttribute::Damage),
                                                  tower.level(TowerAttribute::Damage));
    tower.range = base.range * effectMultiplier(config.towerUpgrade(TowerAttribute::Range),
                                                tower.level(TowerAttribute::Range));
    tower.fireRate = base.fireRate * effectMultiplier(config.towerUpgrade(TowerAttribute::FireRate),
                                                      tower.level(TowerAttribute::FireRate));
}

void applyPlayerUpgrades(PlayerState& player, Engine::ECS::Health& health, const GameConfig& config) {
    const PlayerConfig& base = config.player;
    player.damage = base.damage * effectMultiplier(config.playerUpgrade(PlayerAttribute::Damage),
                                                   player.level(PlayerAttribute::Damage));
    player.speed = base.speed * effectMultiplier(config.playerUpgrade(PlayerAttribute::Speed),
                                                 player.level(PlayerAttribute::Speed));
    player.fireRate = base.fireRate * effectMultiplier(config.playerUpgrade(PlayerAttribute::FireRate),
                                                       player.level(PlayerAttribute::FireRate));
    // Regeneration is additive HP/s per level.
    player.regenPerSecond = config.playerUpgrade(PlayerAttribute::Regeneration).effectPerLevel *
                            static_cast<float>(player.level(PlayerAttribute::Regeneration));

    const float oldMax = health.max;
    health.max = base.health * effectMultiplier(config.playerUpgrade(PlayerAttribute::Health),
                                                player.level(PlayerAttribute::Health));
    if (health.current > 0.0f) {
        health.current = std::clamp(health.current + (health.max - oldMax), 0.0f, health.max);
    }
}

}  // namespace Rampart
