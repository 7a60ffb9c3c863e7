// Typed notifications produced for UI layers by the ChangeObserver.
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>
#include <variant>

#include "../../engine/ecs/Entity.h"
#include "../Types.h"
#include "../world/Cell.h"

namespace Rampart {

enum class EventType {
    CurrencyChanged,
    LivesChanged,
    ScoreChanged,
    WaveStarted,
    WaveCompleted,
    EnemySpawned,
    EnemyKilled,
    EnemyReachedGoal,
    TowerPlaced,
    TowerUpgraded,
    TowerSold,
    TowerSelected,
    SelectedTowerTypeChanged,
    PlayerDamaged,
    PlayerHealed,
    PlayerUpgraded,
    CollectiblePicked,
    GameStateChanged,
    GameOver
};

std::string_view toString(EventType type);

struct CurrencyChanged {
    static constexpr EventType kType = EventType::CurrencyChanged;
    std::int64_t before{0};
    std::int64_t after{0};
};

struct LivesChanged {
    static constexpr EventType kType = EventType::LivesChanged;
    int before{0};
    int after{0};
};

struct ScoreChanged {
    static constexpr EventType kType = EventType::ScoreChanged;
    std::int64_t before{0};
    std::int64_t after{0};
};

struct WaveStarted {
    static constexpr EventType kType = EventType::WaveStarted;
    int wave{0};
    int enemyCount{0};
    bool generated{false};  // produced by endless mode
};

struct WaveCompleted {
    static constexpr EventType kType = EventType::WaveCompleted;
    int wave{0};
    std::int64_t bonus{0};
};

struct EnemySpawned {
    static constexpr EventType kType = EventType::EnemySpawned;
    Engine::ECS::Entity enemy{Engine::ECS::kInvalidEntity};
    EnemyType type{EnemyType::Basic};
    int wave{0};
    bool boss{false};
};

struct EnemyKilled {
    static constexpr EventType kType = EventType::EnemyKilled;
    Engine::ECS::Entity enemy{Engine::ECS::kInvalidEntity};
    Engine::ECS::Entity killer{Engine::ECS::kInvalidEntity};
    EnemyType type{EnemyType::Basic};
    std::int64_t reward{0};
};

struct EnemyReachedGoal {
    static constexpr EventType kType = EventType::EnemyReachedGoal;
    Engine::ECS::Entity enemy{Engine::ECS::kInvalidEntity};
    int livesCost{0};
};

struct TowerPlaced {
    static constexpr EventType kType = EventType::TowerPlaced;
    Engine::ECS::Entity tower{Engine::ECS::kInvalidEntity};
    TowerType type{TowerType::Basic};
    Cell cell{};
    std::int64_t cost{0};
};

struct TowerUpgraded {
    static constexpr EventType kType = EventType::TowerUpgraded;
    Engine::ECS::Entity tower{Engine::ECS::kInvalidEntity};
    TowerAttribute attribute{TowerAttribute::Damage};
    int before{0};
    int after{0};
    std::int64_t cost{0};
};

struct TowerSold {
    static constexpr EventType kType = EventType::TowerSold;
    Engine::ECS::Entity tower{Engine::ECS::kInvalidEntity};
    TowerType type{TowerType::Basic};
    Cell cell{};
    std::int64_t refund{0};
};

struct TowerSelected {
    static constexpr EventType kType = EventType::TowerSelected;
    std::optional<Engine::ECS::Entity> before;
    std::optional<Engine::ECS::Entity> after;
};

struct SelectedTowerTypeChanged {
    static constexpr EventType kType = EventType::SelectedTowerTypeChanged;
    std::optional<TowerType> before;
    std::optional<TowerType> after;
};

struct PlayerDamaged {
    static constexpr EventType kType = EventType::PlayerDamaged;
    Engine::ECS::Entity source{Engine::ECS::kInvalidEntity};
    float before{0.0f};
    float after{0.0f};
};

struct PlayerHealed {
    static constexpr EventType kType = EventType::PlayerHealed;
    float before{0.0f};
    float after{0.0f};
};

struct PlayerUpgraded {
    static constexpr EventType kType = EventType::PlayerUpgraded;
    PlayerAttribute attribute{PlayerAttribute::Damage};
    int before{0};
    int after{0};
    std::int64_t cost{0};
};

struct CollectiblePicked {
    static constexpr EventType kType = EventType::CollectiblePicked;
    Engine::ECS::Entity collectible{Engine::ECS::kInvalidEntity};
    CollectibleType type{CollectibleType::Health};
};

struct GameStateChanged {
    static constexpr EventType kType = EventType::GameStateChanged;
    GameState before{GameState::Menu};
    GameState after{GameState::Menu};
};

struct GameOver {
    static constexpr EventType kType = EventType::GameOver;
    bool won{false};
    std::int64_t score{0};
    int wave{0};
};

using EventPayload = std::variant<CurrencyChanged, LivesChanged, ScoreChanged, WaveStarted, WaveCompleted,
                                  EnemySpawned, EnemyKilled, EnemyReachedGoal, TowerPlaced, TowerUpgraded,
                                  TowerSold, TowerSelected, SelectedTowerTypeChanged, PlayerDamaged, PlayerHealed,
                                  PlayerUpgraded, CollectiblePicked, GameStateChanged, GameOver>;

struct GameEvent {
    std::uint64_t tick{0};
    EventPayload payload;

    EventType type() const {
        return std::visit([](const auto& p) { return std::decay_t<decltype(p)>::kType; }, payload);
    }

    template <typename P>
    const P* as() const {
        return std::get_if<P>(&payload);
    }
};

}  // namespace Rampart
