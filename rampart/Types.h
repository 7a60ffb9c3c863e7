// Enumerations shared by the simulation, its configuration and its observers.
#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace Rampart {

// Discriminant stored by the EntityRegistry for every live entity.
enum class EntityKind { Tower, Enemy, Player, Projectile, Collectible };

enum class TowerType { Basic, Sniper, Rapid, Wall };
constexpr std::size_t kTowerTypeCount = 4;

enum class EnemyType { Basic, Fast, Tank };
constexpr std::size_t kEnemyTypeCount = 3;

enum class TowerAttribute { Damage, Range, FireRate };
constexpr std::size_t kTowerAttributeCount = 3;

enum class PlayerAttribute { Damage, Speed, FireRate, Health, Regeneration };
constexpr std::size_t kPlayerAttributeCount = 5;

enum class CollectibleType { Health, ExtraCurrency, ExtraDamage, FasterShooting, Shield, SpeedBoost };
constexpr std::size_t kCollectibleTypeCount = 6;

enum class ProjectileGuidance { Homing, Ballistic };

// What a homing projectile does when its target disappears before impact.
enum class TargetLossPolicy { Discard, ContinueBallistic };

enum class TargetingRule { Nearest, FurthestAlongPath, LowestHealth };

// Ground type of a walkable cell. Scales the speed of enemies crossing it.
enum class Terrain { Open, Path, Rough, Bridge };
constexpr std::size_t kTerrainCount = 4;

enum class WaveState { Idle, Spawning, Active, Complete };

enum class GameState { Menu, Playing, Paused, GameOver, Victory };

constexpr std::size_t index(TowerType t) { return static_cast<std::size_t>(t); }
constexpr std::size_t index(EnemyType t) { return static_cast<std::size_t>(t); }
constexpr std::size_t index(TowerAttribute a) { return static_cast<std::size_t>(a); }
constexpr std::size_t index(PlayerAttribute a) { return static_cast<std::size_t>(a); }
constexpr std::size_t index(CollectibleType t) { return static_cast<std::size_t>(t); }
constexpr std::size_t index(Terrain t) { return static_cast<std::size_t>(t); }

std::string_view toString(EntityKind kind);
std::string_view toString(TowerType type);
std::string_view toString(EnemyType type);
std::string_view toString(TowerAttribute attr);
std::string_view toString(PlayerAttribute attr);
std::string_view toString(CollectibleType type);
std::string_view toString(ProjectileGuidance guidance);
std::string_view toString(TargetLossPolicy policy);
std::string_view toString(TargetingRule rule);
std::string_view toString(Terrain terrain);
std::string_view toString(WaveState state);
std::string_view toString(GameState state);

// Parsers accept the lowercase names produced by toString.
std::optional<TowerType> parseTowerType(std::string_view key);
std::optional<EnemyType> parseEnemyType(std::string_view key);
std::optional<TowerAttribute> parseTowerAttribute(std::string_view key);
std::optional<PlayerAttribute> parsePlayerAttribute(std::string_view key);
std::optional<CollectibleType> parseCollectibleType(std::string_view key);
std::optional<ProjectileGuidance> parseProjectileGuidance(std::string_view key);
std::optional<TargetLossPolicy> parseTargetLossPolicy(std::string_view key);
std::optional<TargetingRule> parseTargetingRule(std::string_view key);
std::optional<Terrain> parseTerrain(std::string_view key);

// Timed power-ups are the collectibles that leave an effect on the player.
bool isTimedPowerUp(CollectibleType type);

}  // namespace Rampart
