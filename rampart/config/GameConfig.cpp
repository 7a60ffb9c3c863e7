#include "GameConfig.h"

#include <cmath>
#include <set>
#include <sstream>
#include <string>

namespace Rampart {

namespace {
bool inBounds(const GridConfig& g, const Cell& c) { return c.x >= 0 && c.y >= 0 && c.x < g.width && c.y < g.height; }

std::string cellString(const Cell& c) {
    std::ostringstream ss;
    ss << "(" << c.x << "," << c.y << ")";
    return ss.str();
}

void checkCurve(const UpgradeCurve& curve, const std::string& name, std::vector<std::string>& out) {
    if (curve.baseCost <= 0) out.push_back(name + ": base cost must be positive");
    if (!(curve.growth >= 1.0)) out.push_back(name + ": growth must be >= 1");
    if (curve.maxLevel < 0) out.push_back(name + ": max level must not be negative");
}
}  // namespace

std::vector<WaveDefinition> defaultWaves() {
    std::vector<WaveDefinition> waves;
    waves.push_back({{{EnemyType::Basic, 5, 1.0f, false, std::nullopt}}, 2.0f});
    waves.push_back({{{EnemyType::Basic, 8, 0.8f, false, std::nullopt}}, 3.0f});
    waves.push_back({{{EnemyType::Basic, 5, 1.0f, false, std::nullopt},
                      {EnemyType::Fast, 3, 0.6f, false, std::nullopt}},
                     2.0f});
    waves.push_back({{{EnemyType::Basic, 10, 0.6f, false, std::nullopt},
                      {EnemyType::Fast, 5, 0.8f, false, std::nullopt}},
                     2.0f});
    waves.push_back({{{EnemyType::Tank, 3, 2.0f, false, std::nullopt},
                      {EnemyType::Fast, 8, 0.4f, false, std::nullopt}},
                     3.0f});
    return waves;
}

GameConfig defaultConfig() {
    GameConfig cfg;

    cfg.grid.width = 25;
    cfg.grid.height = 19;
    cfg.grid.cellSize = 40.0f;
    cfg.grid.spawns = {Cell{0, 9}, Cell{0, 3}};
    cfg.grid.goal = Cell{24, 9};
    // Rock ridge down the middle with a gap the route has to squeeze through.
    for (int y = 0; y < cfg.grid.height; ++y) {
        if (y >= 7 && y <= 11) continue;
        cfg.grid.blocked.push_back(Cell{12, y});
    }
    TerrainPatch gap{Terrain::Rough, {}};
    for (int y = 7; y <= 11; ++y) gap.cells.push_back(Cell{12, y});
    cfg.grid.terrain.push_back(gap);

    cfg.towers[index(TowerType::Basic)] = TowerDefinition{30, 10.0f, 100.0f, 1.0f, 1.0f, 5};
    cfg.towers[index(TowerType::Sniper)] = TowerDefinition{75, 50.0f, 200.0f, 0.5f, 1.2f, 5};
    cfg.towers[index(TowerType::Rapid)] = TowerDefinition{45, 5.0f, 80.0f, 4.0f, 0.9f, 5};
    cfg.towers[index(TowerType::Wall)] = TowerDefinition{15, 0.0f, 0.0f, 0.0f, 0.5f, 0};

    cfg.enemies[index(EnemyType::Basic)] = EnemyDefinition{50.0f, 50.0f, 0.0f, 10, 1, 10.0f, 10.0f, 30.0f, 1.0f};
    cfg.enemies[index(EnemyType::Fast)] = EnemyDefinition{30.0f, 100.0f, 0.0f, 15, 1, 8.0f, 6.0f, 30.0f, 0.8f};
    cfg.enemies[index(EnemyType::Tank)] = EnemyDefinition{200.0f, 30.0f, 2.0f, 25, 2, 14.0f, 20.0f, 30.0f, 1.5f};

    cfg.towerUpgrades[index(TowerAttribute::Damage)] = UpgradeCurve{50, 1.25, 5, 0.3f};
    cfg.towerUpgrades[index(TowerAttribute::Range)] = UpgradeCurve{60, 1.25, 5, 0.25f};
    cfg.towerUpgrades[index(TowerAttribute::FireRate)] = UpgradeCurve{70, 1.25, 5, 0.2f};

    cfg.playerUpgrades[index(PlayerAttribute::Damage)] = UpgradeCurve{25, 1.5, 5, 0.2f};
    cfg.playerUpgrades[index(PlayerAttribute::Speed)] = UpgradeCurve{20, 1.5, 5, 0.15f};
    cfg.playerUpgrades[index(PlayerAttribute::FireRate)] = UpgradeCurve{30, 1.5, 5, 0.15f};
    cfg.playerUpgrades[index(PlayerAttribute::Health)] = UpgradeCurve{35, 1.5, 5, 0.2f};
    cfg.playerUpgrades[index(PlayerAttribute::Regeneration)] = UpgradeCurve{40, 1.5, 5, 1.0f};

    cfg.waves = defaultWaves();
    return cfg;
}

std::vector<std::string> validateConfig(const GameConfig& cfg) {
    std::vector<std::string> problems;
    const GridConfig& g = cfg.grid;

    if (g.width <= 0 || g.height <= 0) {
        problems.push_back("grid: width and height must be positive");
        return problems;
    }
    if (!(g.cellSize > 0.0f)) problems.push_back("grid: cell size must be positive");
    if (g.spawns.empty()) problems.push_back("grid: at least one spawn is required");
    if (!inBounds(g, g.goal)) problems.push_back("grid: goal " + cellString(g.goal) + " is out of bounds");

    std::set<Cell> blocked(g.blocked.begin(), g.blocked.end());
    for (const Cell& c : g.blocked) {
        if (!inBounds(g, c)) problems.push_back("grid: blocked cell " + cellString(c) + " is out of bounds");
    }
    if (blocked.count(g.goal)) problems.push_back("grid: goal is blocked");
    for (const Cell& s : g.spawns) {
        if (!inBounds(g, s)) problems.push_back("grid: spawn " + cellString(s) + " is out of bounds");
        if (blocked.count(s)) problems.push_back("grid: spawn " + cellString(s) + " is blocked");
        if (s == g.goal) problems.push_back("grid: spawn " + cellString(s) + " is the goal");
    }
    for (const TerrainPatch& patch : g.terrain) {
        for (const Cell& c : patch.cells) {
            if (!inBounds(g, c)) {
                problems.push_back("grid: " + std::string(toString(patch.type)) + " cell " + cellString(c) +
                                   " is out of bounds");
            }
        }
    }
    for (std::size_t i = 0; i < kTerrainCount; ++i) {
        if (!(g.terrainSpeed[i] > 0.0f)) {
            problems.push_back("grid: " + std::string(toString(static_cast<Terrain>(i))) +
                               " speed must be positive");
        }
    }

    if (cfg.economy.startingCurrency < 0) problems.push_back("economy: starting currency must not be negative");
    if (cfg.economy.startingLives <= 0) problems.push_back("economy: starting lives must be positive");
    if (!(cfg.economy.sellRefundRate >= 0.0 && cfg.economy.sellRefundRate <= 1.0)) {
        problems.push_back("economy: sell refund rate must be within [0,1]");
    }
    if (cfg.economy.scorePerReward < 0) problems.push_back("economy: score per reward must not be negative");
    if (cfg.economy.waveClearBonus < 0) problems.push_back("economy: wave clear bonus must not be negative");

    for (std::size_t i = 0; i < kTowerTypeCount; ++i) {
        const TowerDefinition& t = cfg.towers[i];
        const std::string name = "towers." + std::string(toString(static_cast<TowerType>(i)));
        if (t.cost < 0) problems.push_back(name + ": cost must not be negative");
        if (t.damage < 0.0f || t.range < 0.0f || t.fireRate < 0.0f) {
            problems.push_back(name + ": damage, range and fire rate must not be negative");
        }
        if (t.maxUpgradeLevel < 0) problems.push_back(name + ": max upgrade level must not be negative");
        if (!(t.upgradeCostModifier > 0.0f)) problems.push_back(name + ": upgrade cost modifier must be positive");
    }
    for (std::size_t i = 0; i < kEnemyTypeCount; ++i) {
        const EnemyDefinition& e = cfg.enemies[i];
        const std::string name = "enemies." + std::string(toString(static_cast<EnemyType>(i)));
        if (!(e.health > 0.0f)) problems.push_back(name + ": health must be positive");
        if (!(e.speed > 0.0f)) problems.push_back(name + ": speed must be positive");
        if (e.reward < 0) problems.push_back(name + ": reward must not be negative");
        if (e.livesCost < 0) problems.push_back(name + ": lives cost must not be negative");
        if (e.armor < 0.0f) problems.push_back(name + ": armor must not be negative");
    }
    for (std::size_t i = 0; i < kTowerAttributeCount; ++i) {
        checkCurve(cfg.towerUpgrades[i], "tower_upgrades." + std::string(toString(static_cast<TowerAttribute>(i))),
                   problems);
    }
    for (std::size_t i = 0; i < kPlayerAttributeCount; ++i) {
        checkCurve(cfg.playerUpgrades[i],
                   "player_upgrades." + std::string(toString(static_cast<PlayerAttribute>(i))), problems);
    }

    if (cfg.player.enabled) {
        if (!inBounds(g, cfg.player.startCell)) problems.push_back("player: start cell is out of bounds");
        if (!(cfg.player.health > 0.0f)) problems.push_back("player: health must be positive");
        if (cfg.player.fireRate < 0.0f) problems.push_back("player: fire rate must not be negative");
    }

    const DifficultyConfig& d = cfg.difficulty;
    if (!(d.healthGrowth >= 1.0) || !(d.speedGrowth >= 1.0)) {
        problems.push_back("difficulty: growth factors must be >= 1");
    }
    if (!(d.speedCap >= 1.0)) problems.push_back("difficulty: speed cap must be >= 1");
    if (!(d.bossHealthMultiplier > 0.0f) || !(d.bossSpeedMultiplier > 0.0f)) {
        problems.push_back("difficulty: boss multipliers must be positive");
    }

    const DropConfig& drops = cfg.drops;
    for (float chance : {drops.healthChance, drops.powerUpChance, drops.extraCurrencyChance}) {
        if (!(chance >= 0.0f && chance <= 1.0f)) {
            problems.push_back("drops: chances must be within [0,1]");
            break;
        }
    }
    if (drops.healthChance + drops.powerUpChance + drops.extraCurrencyChance > 1.0f + 1e-6f) {
        problems.push_back("drops: combined chance must not exceed 1");
    }

    if (!(cfg.combat.towerProjectileSpeed > 0.0f) || !(cfg.combat.playerProjectileSpeed > 0.0f)) {
        problems.push_back("combat: projectile speeds must be positive");
    }

    if (!(cfg.simulation.maxTickSeconds > 0.0) || !std::isfinite(cfg.simulation.maxTickSeconds)) {
        problems.push_back("simulation: max tick must be positive");
    }
    if (cfg.simulation.journalCapacity == 0) problems.push_back("simulation: journal capacity must be positive");

    if (cfg.waves.empty() && !cfg.endless.enabled) problems.push_back("waves: no waves and endless mode disabled");
    for (std::size_t w = 0; w < cfg.waves.size(); ++w) {
        const WaveDefinition& wave = cfg.waves[w];
        const std::string name = "waves[" + std::to_string(w) + "]";
        if (wave.entries.empty()) problems.push_back(name + ": no spawn entries");
        if (wave.startDelaySeconds < 0.0f) problems.push_back(name + ": start delay must not be negative");
        for (const SpawnEntry& entry : wave.entries) {
            if (entry.count <= 0) problems.push_back(name + ": spawn count must be positive");
            if (entry.delaySeconds < 0.0f) problems.push_back(name + ": spawn delay must not be negative");
            if (entry.spawnIndex &&
                (*entry.spawnIndex < 0 || *entry.spawnIndex >= static_cast<int>(g.spawns.size()))) {
                problems.push_back(name + ": spawn index out of range");
            }
        }
    }
    if (cfg.endless.enabled) {
        if (cfg.endless.baseEnemyCount <= 0 || cfg.endless.maxEnemyCount < cfg.endless.baseEnemyCount) {
            problems.push_back("endless: enemy counts are inconsistent");
        }
        if (cfg.endless.minSpawnDelay < 0.0f || cfg.endless.baseSpawnDelay < cfg.endless.minSpawnDelay) {
            problems.push_back("endless: spawn delays are inconsistent");
        }
        if (cfg.endless.bossInterval <= 0) problems.push_back("endless: boss interval must be positive");
    }
    return problems;
}

}  // namespace Rampart
