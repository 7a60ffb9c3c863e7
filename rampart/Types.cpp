#include "Types.h"

namespace Rampart {

std::string_view toString(EntityKind kind) {
    switch (kind) {
        case EntityKind::Tower: return "tower";
        case EntityKind::Enemy: return "enemy";
        case EntityKind::Player: return "player";
        case EntityKind::Projectile: return "projectile";
        case EntityKind::Collectible: return "collectible";
    }
    return "unknown";
}

std::string_view toString(TowerType type) {
    switch (type) {
        case TowerType::Basic: return "basic";
        case TowerType::Sniper: return "sniper";
        case TowerType::Rapid: return "rapid";
        case TowerType::Wall: return "wall";
    }
    return "unknown";
}

std::string_view toString(EnemyType type) {
    switch (type) {
        case EnemyType::Basic: return "basic";
        case EnemyType::Fast: return "fast";
        case EnemyType::Tank: return "tank";
    }
    return "unknown";
}

std::string_view toString(TowerAttribute attr) {
    switch (attr) {
        case TowerAttribute::Damage: return "damage";
        case TowerAttribute::Range: return "range";
        case TowerAttribute::FireRate: return "fire_rate";
    }
    return "unknown";
}

std::string_view toString(PlayerAttribute attr) {
    switch (attr) {
        case PlayerAttribute::Damage: return "damage";
        case PlayerAttribute::Speed: return "speed";
        case PlayerAttribute::FireRate: return "fire_rate";
        case PlayerAttribute::Health: return "health";
        case PlayerAttribute::Regeneration: return "regeneration";
    }
    return "unknown";
}

std::string_view toString(CollectibleType type) {
    switch (type) {
        case CollectibleType::Health: return "health";
        case CollectibleType::ExtraCurrency: return "extra_currency";
        case CollectibleType::ExtraDamage: return "extra_damage";
        case CollectibleType::FasterShooting: return "faster_shooting";
        case CollectibleType::Shield: return "shield";
        case CollectibleType::SpeedBoost: return "speed_boost";
    }
    return "unknown";
}

std::string_view toString(ProjectileGuidance guidance) {
    switch (guidance) {
        case ProjectileGuidance::Homing: return "homing";
        case ProjectileGuidance::Ballistic: return "ballistic";
    }
    return "unknown";
}

std::string_view toString(TargetLossPolicy policy) {
    switch (policy) {
        case TargetLossPolicy::Discard: return "discard";
        case TargetLossPolicy::ContinueBallistic: return "continue_ballistic";
    }
    return "unknown";
}

std::string_view toString(TargetingRule rule) {
    switch (rule) {
        case TargetingRule::Nearest: return "nearest";
        case TargetingRule::FurthestAlongPath: return "furthest_along_path";
        case TargetingRule::LowestHealth: return "lowest_health";
    }
    return "unknown";
}

std::string_view toString(Terrain terrain) {
    switch (terrain) {
        case Terrain::Open: return "open";
        case Terrain::Path: return "path";
        case Terrain::Rough: return "rough";
        case Terrain::Bridge: return "bridge";
    }
    return "unknown";
}

std::string_view toString(WaveState state) {
    switch (state) {
        case WaveState::Idle: return "idle";
        case WaveState::Spawning: return "spawning";
        case WaveState::Active: return "active";
        case WaveState::Complete: return "complete";
    }
    return "unknown";
}

std::string_view toString(GameState state) {
    switch (state) {
        case GameState::Menu: return "menu";
        case GameState::Playing: return "playing";
        case GameState::Paused: return "paused";
        case GameState::GameOver: return "game_over";
        case GameState::Victory: return "victory";
    }
    return "unknown";
}

std::optional<TowerType> parseTowerType(std::string_view k) {
    if (k == "basic") return TowerType::Basic;
    if (k == "sniper") return TowerType::Sniper;
    if (k == "rapid") return TowerType::Rapid;
    if (k == "wall") return TowerType::Wall;
    return std::nullopt;
}

std::optional<EnemyType> parseEnemyType(std::string_view k) {
    if (k == "basic") return EnemyType::Basic;
    if (k == "fast") return EnemyType::Fast;
    if (k == "tank") return EnemyType::Tank;
    return std::nullopt;
}

std::optional<TowerAttribute> parseTowerAttribute(std::string_view k) {
    if (k == "damage") return TowerAttribute::Damage;
    if (k == "range") return TowerAttribute::Range;
    if (k == "fire_rate") return TowerAttribute::FireRate;
    return std::nullopt;
}

std::optional<PlayerAttribute> parsePlayerAttribute(std::string_view k) {
    if (k == "damage") return PlayerAttribute::Damage;
    if (k == "speed") return PlayerAttribute::Speed;
    if (k == "fire_rate") return PlayerAttribute::FireRate;
    if (k == "health") return PlayerAttribute::Health;
    if (k == "regeneration") return PlayerAttribute::Regeneration;
    return std::nullopt;
}

std::optional<CollectibleType> parseCollectibleType(std::string_view k) {
    if (k == "health") return CollectibleType::Health;
    if (k == "extra_currency") return CollectibleType::ExtraCurrency;
    if (k == "extra_damage") return CollectibleType::ExtraDamage;
    if (k == "faster_shooting") return CollectibleType::FasterShooting;
    if (k == "shield") return CollectibleType::Shield;
    if (k == "speed_boost") return CollectibleType::SpeedBoost;
    return std::nullopt;
}

std::optional<ProjectileGuidance> parseProjectileGuidance(std::string_view k) {
    if (k == "homing") return ProjectileGuidance::Homing;
    if (k == "ballistic") return ProjectileGuidance::Ballistic;
    return std::nullopt;
}

std::optional<TargetLossPolicy> parseTargetLossPolicy(std::string_view k) {
    if (k == "discard") return TargetLossPolicy::Discard;
    if (k == "continue_ballistic") return TargetLossPolicy::ContinueBallistic;
    return std::nullopt;
}

std::optional<TargetingRule> parseTargetingRule(std::string_view k) {
    if (k == "nearest") return TargetingRule::Nearest;
    if (k == "furthest_along_path") return TargetingRule::FurthestAlongPath;
    if (k == "lowest_health") return TargetingRule::LowestHealth;
    return std::nullopt;
}

std::optional<Terrain> parseTerrain(std::string_view k) {
    if (k == "open") return Terrain::Open;
    if (k == "path") return Terrain::Path;
    if (k == "rough") return Terrain::Rough;
    if (k == "bridge") return Terrain::Bridge;
    return std::nullopt;
}

bool isTimedPowerUp(CollectibleType type) {
    switch (type) {
        case CollectibleType::Health:
        case CollectibleType::ExtraCurrency:
            return false;
        case CollectibleType::ExtraDamage:
        case CollectibleType::FasterShooting:
        case CollectibleType::Shield:
        case CollectibleType::SpeedBoost:
            return true;
    }
    return false;
}

}  // namespace Rampart
