// Tuning for a simulation session. Defaults reproduce the stock map and waves.
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../Types.h"
#include "../world/Cell.h"

namespace Rampart {

struct TerrainPatch {
    Terrain type{Terrain::Open};
    std::vector<Cell> cells;
};

struct GridConfig {
    int width{25};
    int height{19};
    float cellSize{40.0f};
    bool diagonalMoves{false};
    std::vector<Cell> blocked;
    std::vector<Cell> spawns;
    Cell goal{24, 9};
    // Cells not listed are open ground. Routing ignores terrain; only enemy speed changes.
    std::vector<TerrainPatch> terrain;
    std::array<float, kTerrainCount> terrainSpeed{1.0f, 1.2f, 0.5f, 1.0f};

    float speedFor(Terrain t) const { return terrainSpeed[index(t)]; }
};

struct TowerDefinition {
    std::int64_t cost{0};
    float damage{0.0f};
    float range{0.0f};
    float fireRate{0.0f};  // shots per second; 0 = never fires
    float upgradeCostModifier{1.0f};
    int maxUpgradeLevel{5};
};

struct EnemyDefinition {
    float health{50.0f};
    float speed{50.0f};  // world units per second
    float armor{0.0f};
    std::int64_t reward{10};
    int livesCost{1};
    float radius{10.0f};
    float contactDamage{10.0f};
    float attackRange{30.0f};
    float attackCooldown{1.0f};
};

// One level curve; effectPerLevel is interpreted by the attribute it belongs to.
struct UpgradeCurve {
    std::int64_t baseCost{50};
    double growth{1.25};
    int maxLevel{5};
    float effectPerLevel{0.0f};
};

struct PlayerConfig {
    bool enabled{true};
    Cell startCell{2, 9};
    float damage{11.0f};
    float speed{120.0f};
    float fireRate{1.5f};
    float health{75.0f};
    float radius{12.0f};
    float projectileRange{400.0f};
    float respawnSeconds{3.0f};
    float regenDelaySeconds{3.0f};
};

struct CombatConfig {
    TargetingRule targeting{TargetingRule::Nearest};
    TargetLossPolicy towerTargetLoss{TargetLossPolicy::Discard};
    TargetLossPolicy playerTargetLoss{TargetLossPolicy::Discard};
    ProjectileGuidance playerGuidance{ProjectileGuidance::Ballistic};
    float towerProjectileSpeed{300.0f};
    float playerProjectileSpeed{400.0f};
    float projectileHitRadius{4.0f};
    // Homing projectiles may travel this multiple of the firing range.
    float homingRangeFactor{3.0f};
};

struct DifficultyConfig {
    double healthGrowth{1.1};
    double speedGrowth{1.05};
    double speedCap{2.0};
    float bossHealthMultiplier{5.0f};
    float bossSpeedMultiplier{0.5f};
    float bossRewardMultiplier{10.0f};
    int bossLivesCost{5};
};

struct SpawnEntry {
    EnemyType type{EnemyType::Basic};
    int count{1};
    float delaySeconds{1.0f};
    bool boss{false};
    std::optional<int> spawnIndex;  // round-robin over spawns when unset
};

struct WaveDefinition {
    std::vector<SpawnEntry> entries;
    float startDelaySeconds{0.0f};
};

struct EndlessConfig {
    bool enabled{false};
    int baseEnemyCount{5};
    int maxEnemyCount{80};
    float baseSpawnDelay{2.0f};
    float minSpawnDelay{0.5f};
    int bossInterval{10};
    EnemyType bossType{EnemyType::Tank};
    float startDelaySeconds{2.0f};
};

struct EconomyConfig {
    std::int64_t startingCurrency{100};
    int startingLives{10};
    double sellRefundRate{0.7};
    std::int64_t scorePerReward{5};
    std::int64_t waveClearBonus{5};  // multiplied by the wave number
};

struct DropConfig {
    float healthChance{0.1f};
    float powerUpChance{0.15f};
    float extraCurrencyChance{0.05f};
    float lifetimeSeconds{15.0f};
    float pickupRadius{30.0f};
    float healAmount{25.0f};
    std::int64_t currencyAmount{50};
    float extraDamageMultiplier{1.5f};
    float extraDamageSeconds{10.0f};
    float fasterShootingMultiplier{2.0f};
    float fasterShootingSeconds{8.0f};
    float shieldSeconds{15.0f};
    float speedBoostMultiplier{1.5f};
    float speedBoostSeconds{12.0f};
};

struct SimulationConfig {
    double maxTickSeconds{0.1};
    std::uint32_t seed{1337};
    // Undrained facts kept before the oldest are dropped.
    std::uint32_t journalCapacity{4096};
};

struct GameConfig {
    GridConfig grid;
    EconomyConfig economy;
    std::array<TowerDefinition, kTowerTypeCount> towers{};
    std::array<EnemyDefinition, kEnemyTypeCount> enemies{};
    std::array<UpgradeCurve, kTowerAttributeCount> towerUpgrades{};
    std::array<UpgradeCurve, kPlayerAttributeCount> playerUpgrades{};
    PlayerConfig player;
    CombatConfig combat;
    DifficultyConfig difficulty;
    EndlessConfig endless;
    DropConfig drops;
    SimulationConfig simulation;
    std::vector<WaveDefinition> waves;

    const TowerDefinition& tower(TowerType t) const { return towers[index(t)]; }
    const EnemyDefinition& enemy(EnemyType t) const { return enemies[index(t)]; }
    const UpgradeCurve& towerUpgrade(TowerAttribute a) const { return towerUpgrades[index(a)]; }
    const UpgradeCurve& playerUpgrade(PlayerAttribute a) const { return playerUpgrades[index(a)]; }
};

// Built-in tuning: a 25x19 map split by a ridge, two spawns and five scripted waves.
GameConfig defaultConfig();

std::vector<WaveDefinition> defaultWaves();

// Returns human-readable problems; empty when the config is usable.
std::vector<std::string> validateConfig(const GameConfig& config);

}  // namespace Rampart
