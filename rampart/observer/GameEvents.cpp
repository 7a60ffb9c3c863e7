#include "GameEvents.h"

namespace Rampart {

std::string_view toString(EventType type) {
    switch (type) {
        case EventType::CurrencyChanged: return "currencyChanged";
        case EventType::LivesChanged: return "livesChanged";
        case EventType::ScoreChanged: return "scoreChanged";
        case EventType::WaveStarted: return "waveStarted";
        case EventType::WaveCompleted: return "waveCompleted";
        case EventType::EnemySpawned: return "enemySpawned";
        case EventType::EnemyKilled: return "enemyKilled";
        case EventType::EnemyReachedGoal: return "enemyReachedGoal";
        case EventType::TowerPlaced: return "towerPlaced";
        case EventType::TowerUpgraded: return "towerUpgraded";
        case EventType::TowerSold: return "towerSold";
        case EventType::TowerSelected: return "towerSelected";
        case EventType::SelectedTowerTypeChanged: return "selectedTowerTypeChanged";
        case EventType::PlayerDamaged: return "playerDamaged";
        case EventType::PlayerHealed: return "playerHealed";
        case EventType::PlayerUpgraded: return "playerUpgraded";
        case EventType::CollectiblePicked: return "collectiblePicked";
        case EventType::GameStateChanged: return "gameStateChanged";
        case EventType::GameOver: return "gameOver";
    }
    return "unknown";
}

}  // namespace Rampart
