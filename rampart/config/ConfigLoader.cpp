#include "ConfigLoader.h"

#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

#include "../../engine/core/Logger.h"

namespace Rampart {

namespace {
using nlohmann::json;

// Reads [x, y] or {"x":..,"y":..}. Returns false on a malformed value.
bool readCell(const json& v, Cell& out) {
    if (v.is_array() && v.size() == 2 && v[0].is_number_integer() && v[1].is_number_integer()) {
        out = Cell{v[0].get<int>(), v[1].get<int>()};
        return true;
    }
    if (v.is_object() && v.contains("x") && v.contains("y")) {
        out = Cell{v["x"].get<int>(), v["y"].get<int>()};
        return true;
    }
    return false;
}

bool readCells(const json& arr, std::vector<Cell>& out) {
    if (!arr.is_array()) return false;
    std::vector<Cell> cells;
    for (const auto& v : arr) {
        Cell c;
        if (!readCell(v, c)) return false;
        cells.push_back(c);
    }
    out = std::move(cells);
    return true;
}

template <typename T>
void readValue(const json& obj, const char* key, T& dst) {
    if (obj.contains(key)) dst = obj[key].get<T>();
}

// Every section is an object whose keys all come from a fixed set; anything else is a typo.
void expectKeys(const json& src, const std::string& where, std::initializer_list<const char*> known) {
    if (!src.is_object()) throw std::runtime_error(where + " must be an object");
    for (auto it = src.begin(); it != src.end(); ++it) {
        const bool found = std::any_of(known.begin(), known.end(), [&](const char* k) { return it.key() == k; });
        if (!found) throw std::runtime_error("unknown key '" + it.key() + "' in " + where);
    }
}

template <typename Def, std::size_t N, typename Parser, typename Reader>
void readKeyed(const json& src, const std::string& section, std::array<Def, N>& dst, Parser parse, Reader read) {
    if (!src.is_object()) throw std::runtime_error(section + " must be an object");
    for (auto it = src.begin(); it != src.end(); ++it) {
        auto key = parse(it.key());
        if (!key) throw std::runtime_error("unknown key '" + it.key() + "' in " + section);
        read(it.value(), section + "." + it.key(), dst[index(*key)]);
    }
}

void readTerrain(const json& src, std::vector<TerrainPatch>& out) {
    if (!src.is_object()) throw std::runtime_error("grid.terrain must be an object");
    std::vector<TerrainPatch> patches;
    for (auto it = src.begin(); it != src.end(); ++it) {
        auto type = parseTerrain(it.key());
        if (!type) throw std::runtime_error("unknown terrain '" + it.key() + "' in grid.terrain");
        TerrainPatch patch{*type, {}};
        if (!readCells(it.value(), patch.cells)) {
            throw std::runtime_error("grid.terrain." + it.key() + " must be a list of cells");
        }
        patches.push_back(std::move(patch));
    }
    out = std::move(patches);
}

void readGrid(const json& src, GridConfig& g) {
    expectKeys(src, "grid",
               {"width", "height", "cellSize", "diagonalMoves", "blocked", "spawns", "goal", "terrain",
                "terrainSpeed"});
    readValue(src, "width", g.width);
    readValue(src, "height", g.height);
    readValue(src, "cellSize", g.cellSize);
    readValue(src, "diagonalMoves", g.diagonalMoves);
    if (src.contains("blocked") && !readCells(src["blocked"], g.blocked)) {
        throw std::runtime_error("grid.blocked must be a list of cells");
    }
    if (src.contains("spawns") && !readCells(src["spawns"], g.spawns)) {
        throw std::runtime_error("grid.spawns must be a list of cells");
    }
    if (src.contains("goal") && !readCell(src["goal"], g.goal)) {
        throw std::runtime_error("grid.goal must be a cell");
    }
    if (src.contains("terrain")) readTerrain(src["terrain"], g.terrain);
    if (src.contains("terrainSpeed")) {
        readKeyed(src["terrainSpeed"], "grid.terrainSpeed", g.terrainSpeed, parseTerrain,
                  [](const json& v, const std::string&, float& dst) { dst = v.get<float>(); });
    }
}

void readEconomy(const json& src, EconomyConfig& e) {
    expectKeys(src, "economy",
               {"startingCurrency", "startingLives", "sellRefundRate", "scorePerReward", "waveClearBonus"});
    readValue(src, "startingCurrency", e.startingCurrency);
    readValue(src, "startingLives", e.startingLives);
    readValue(src, "sellRefundRate", e.sellRefundRate);
    readValue(src, "scorePerReward", e.scorePerReward);
    readValue(src, "waveClearBonus", e.waveClearBonus);
}

void readTower(const json& src, const std::string& where, TowerDefinition& t) {
    expectKeys(src, where, {"cost", "damage", "range", "fireRate", "upgradeCostModifier", "maxUpgradeLevel"});
    readValue(src, "cost", t.cost);
    readValue(src, "damage", t.damage);
    readValue(src, "range", t.range);
    readValue(src, "fireRate", t.fireRate);
    readValue(src, "upgradeCostModifier", t.upgradeCostModifier);
    readValue(src, "maxUpgradeLevel", t.maxUpgradeLevel);
}

void readEnemy(const json& src, const std::string& where, EnemyDefinition& e) {
    expectKeys(src, where,
               {"health", "speed", "armor", "reward", "livesCost", "radius", "contactDamage", "attackRange",
                "attackCooldown"});
    readValue(src, "health", e.health);
    readValue(src, "speed", e.speed);
    readValue(src, "armor", e.armor);
    readValue(src, "reward", e.reward);
    readValue(src, "livesCost", e.livesCost);
    readValue(src, "radius", e.radius);
    readValue(src, "contactDamage", e.contactDamage);
    readValue(src, "attackRange", e.attackRange);
    readValue(src, "attackCooldown", e.attackCooldown);
}

void readCurve(const json& src, const std::string& where, UpgradeCurve& c) {
    expectKeys(src, where, {"baseCost", "growth", "maxLevel", "effectPerLevel"});
    readValue(src, "baseCost", c.baseCost);
    readValue(src, "growth", c.growth);
    readValue(src, "maxLevel", c.maxLevel);
    readValue(src, "effectPerLevel", c.effectPerLevel);
}

void readPlayer(const json& src, PlayerConfig& p) {
    expectKeys(src, "player",
               {"enabled", "startCell", "damage", "speed", "fireRate", "health", "radius", "projectileRange",
                "respawnSeconds", "regenDelaySeconds"});
    readValue(src, "enabled", p.enabled);
    if (src.contains("startCell") && !readCell(src["startCell"], p.startCell)) {
        throw std::runtime_error("player.startCell must be a cell");
    }
    readValue(src, "damage", p.damage);
    readValue(src, "speed", p.speed);
    readValue(src, "fireRate", p.fireRate);
    readValue(src, "health", p.health);
    readValue(src, "radius", p.radius);
    readValue(src, "projectileRange", p.projectileRange);
    readValue(src, "respawnSeconds", p.respawnSeconds);
    readValue(src, "regenDelaySeconds", p.regenDelaySeconds);
}

template <typename Enum, typename Parser>
void readEnum(const json& src, const char* key, Enum& dst, Parser parse) {
    if (!src.contains(key)) return;
    const auto name = src[key].get<std::string>();
    auto parsed = parse(name);
    if (!parsed) throw std::runtime_error(std::string("unknown value '") + name + "' for " + key);
    dst = *parsed;
}

void readCombat(const json& src, CombatConfig& c) {
    expectKeys(src, "combat",
               {"targeting", "towerTargetLoss", "playerTargetLoss", "playerGuidance", "towerProjectileSpeed",
                "playerProjectileSpeed", "projectileHitRadius", "homingRangeFactor"});
    readEnum(src, "targeting", c.targeting, parseTargetingRule);
    readEnum(src, "towerTargetLoss", c.towerTargetLoss, parseTargetLossPolicy);
    readEnum(src, "playerTargetLoss", c.playerTargetLoss, parseTargetLossPolicy);
    readEnum(src, "playerGuidance", c.playerGuidance, parseProjectileGuidance);
    readValue(src, "towerProjectileSpeed", c.towerProjectileSpeed);
    readValue(src, "playerProjectileSpeed", c.playerProjectileSpeed);
    readValue(src, "projectileHitRadius", c.projectileHitRadius);
    readValue(src, "homingRangeFactor", c.homingRangeFactor);
}

void readDifficulty(const json& src, DifficultyConfig& d) {
    expectKeys(src, "difficulty",
               {"healthGrowth", "speedGrowth", "speedCap", "bossHealthMultiplier", "bossSpeedMultiplier",
                "bossRewardMultiplier", "bossLivesCost"});
    readValue(src, "healthGrowth", d.healthGrowth);
    readValue(src, "speedGrowth", d.speedGrowth);
    readValue(src, "speedCap", d.speedCap);
    readValue(src, "bossHealthMultiplier", d.bossHealthMultiplier);
    readValue(src, "bossSpeedMultiplier", d.bossSpeedMultiplier);
    readValue(src, "bossRewardMultiplier", d.bossRewardMultiplier);
    readValue(src, "bossLivesCost", d.bossLivesCost);
}

void readEndless(const json& src, EndlessConfig& e) {
    expectKeys(src, "endless",
               {"enabled", "baseEnemyCount", "maxEnemyCount", "baseSpawnDelay", "minSpawnDelay", "bossInterval",
                "bossType", "startDelay"});
    readValue(src, "enabled", e.enabled);
    readValue(src, "baseEnemyCount", e.baseEnemyCount);
    readValue(src, "maxEnemyCount", e.maxEnemyCount);
    readValue(src, "baseSpawnDelay", e.baseSpawnDelay);
    readValue(src, "minSpawnDelay", e.minSpawnDelay);
    readValue(src, "bossInterval", e.bossInterval);
    readEnum(src, "bossType", e.bossType, parseEnemyType);
    readValue(src, "startDelay", e.startDelaySeconds);
}

void readDrops(const json& src, DropConfig& d) {
    expectKeys(src, "drops",
               {"healthChance", "powerUpChance", "extraCurrencyChance", "lifetime", "pickupRadius", "healAmount",
                "currencyAmount", "extraDamageMultiplier", "extraDamageDuration", "fasterShootingMultiplier",
                "fasterShootingDuration", "shieldDuration", "speedBoostMultiplier", "speedBoostDuration"});
    readValue(src, "healthChance", d.healthChance);
    readValue(src, "powerUpChance", d.powerUpChance);
    readValue(src, "extraCurrencyChance", d.extraCurrencyChance);
    readValue(src, "lifetime", d.lifetimeSeconds);
    readValue(src, "pickupRadius", d.pickupRadius);
    readValue(src, "healAmount", d.healAmount);
    readValue(src, "currencyAmount", d.currencyAmount);
    readValue(src, "extraDamageMultiplier", d.extraDamageMultiplier);
    readValue(src, "extraDamageDuration", d.extraDamageSeconds);
    readValue(src, "fasterShootingMultiplier", d.fasterShootingMultiplier);
    readValue(src, "fasterShootingDuration", d.fasterShootingSeconds);
    readValue(src, "shieldDuration", d.shieldSeconds);
    readValue(src, "speedBoostMultiplier", d.speedBoostMultiplier);
    readValue(src, "speedBoostDuration", d.speedBoostSeconds);
}

void readSimulation(const json& src, SimulationConfig& s) {
    expectKeys(src, "simulation", {"maxTickSeconds", "seed", "journalCapacity"});
    readValue(src, "maxTickSeconds", s.maxTickSeconds);
    readValue(src, "seed", s.seed);
    readValue(src, "journalCapacity", s.journalCapacity);
}

std::vector<WaveDefinition> readWaves(const json& arr) {
    if (!arr.is_array()) throw std::runtime_error("waves must be a list");
    std::vector<WaveDefinition> waves;
    for (std::size_t i = 0; i < arr.size(); ++i) {
        const json& w = arr[i];
        const std::string where = "waves[" + std::to_string(i) + "]";
        expectKeys(w, where, {"startDelay", "entries"});
        WaveDefinition wave;
        readValue(w, "startDelay", wave.startDelaySeconds);
        if (!w.contains("entries") || !w["entries"].is_array()) {
            throw std::runtime_error("each wave needs an entries list");
        }
        for (const auto& e : w["entries"]) {
            expectKeys(e, where + ".entries", {"type", "count", "delay", "boss", "spawn"});
            SpawnEntry entry;
            readEnum(e, "type", entry.type, parseEnemyType);
            readValue(e, "count", entry.count);
            readValue(e, "delay", entry.delaySeconds);
            readValue(e, "boss", entry.boss);
            if (e.contains("spawn")) entry.spawnIndex = e["spawn"].get<int>();
            wave.entries.push_back(entry);
        }
        waves.push_back(std::move(wave));
    }
    return waves;
}
}  // namespace

std::optional<GameConfig> ConfigLoader::fromJson(const nlohmann::json& j, GameConfig cfg) {
    if (!j.is_object()) {
        Engine::logError("Config root must be a JSON object");
        return std::nullopt;
    }
    try {
        expectKeys(j, "config",
                   {"grid", "economy", "towers", "enemies", "towerUpgrades", "playerUpgrades", "player", "combat",
                    "difficulty", "endless", "drops", "simulation", "waves"});
        if (j.contains("grid")) readGrid(j["grid"], cfg.grid);
        if (j.contains("economy")) readEconomy(j["economy"], cfg.economy);
        if (j.contains("towers")) readKeyed(j["towers"], "towers", cfg.towers, parseTowerType, readTower);
        if (j.contains("enemies")) readKeyed(j["enemies"], "enemies", cfg.enemies, parseEnemyType, readEnemy);
        if (j.contains("towerUpgrades")) {
            readKeyed(j["towerUpgrades"], "towerUpgrades", cfg.towerUpgrades, parseTowerAttribute, readCurve);
        }
        if (j.contains("playerUpgrades")) {
            readKeyed(j["playerUpgrades"], "playerUpgrades", cfg.playerUpgrades, parsePlayerAttribute, readCurve);
        }
        if (j.contains("player")) readPlayer(j["player"], cfg.player);
        if (j.contains("combat")) readCombat(j["combat"], cfg.combat);
        if (j.contains("difficulty")) readDifficulty(j["difficulty"], cfg.difficulty);
        if (j.contains("endless")) readEndless(j["endless"], cfg.endless);
        if (j.contains("drops")) readDrops(j["drops"], cfg.drops);
        if (j.contains("simulation")) readSimulation(j["simulation"], cfg.simulation);
        if (j.contains("waves")) cfg.waves = readWaves(j["waves"]);
    } catch (const nlohmann::json::exception& e) {
        Engine::logError(std::string("Config has a value of the wrong type: ") + e.what());
        return std::nullopt;
    } catch (const std::runtime_error& e) {
        Engine::logError(std::string("Config is malformed: ") + e.what());
        return std::nullopt;
    }
    return cfg;
}

std::optional<GameConfig> ConfigLoader::loadFromString(const std::string& text) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        Engine::logError("Config text is not valid JSON");
        return std::nullopt;
    }
    return fromJson(j, defaultConfig());
}

std::optional<GameConfig> ConfigLoader::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        Engine::logError("Failed to open config: " + path);
        return std::nullopt;
    }

    nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        Engine::logError("Failed to parse config: " + path);
        return std::nullopt;
    }
    auto cfg = fromJson(j, defaultConfig());
    if (cfg) Engine::logInfo("Loaded config " + path);
    return cfg;
}

}  // namespace Rampart
