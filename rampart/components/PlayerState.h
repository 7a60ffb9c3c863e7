// Player unit: upgrades, input intent, timers and active power-ups.
#pragma once

#include <array>
#include <map>

#include "../../engine/math/Vec2.h"
#include "../Types.h"

namespace Rampart {

struct PlayerState {
    std::array<int, kPlayerAttributeCount> levels{};
    // Stats after upgrades, before power-ups.
    float damage{0.0f};
    float speed{0.0f};
    float fireRate{0.0f};
    float regenPerSecond{0.0f};

    Engine::Vec2 moveDirection{};
    bool firing{false};
    float fireCooldown{0.0f};

    // Power-up -> expiry in simulation seconds.
    std::map<CollectibleType, double> effects;

    bool downed{false};
    float respawnTimer{0.0f};
    float regenDelay{0.0f};

    int level(PlayerAttribute attr) const { return levels[index(attr)]; }
    // Active while the clock is before the expiry; an effect is gone on the tick it expires.
    bool hasEffect(CollectibleType type, double now) const {
        const auto it = effects.find(type);
        return it != effects.end() && it->second > now;
    }
};

}  // namespace Rampart
