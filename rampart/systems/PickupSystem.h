// Collectible drops, pickup by the player, despawn and power-up expiry.
#pragma once

#include <optional>

#include "../../engine/math/Vec2.h"
#include "../Types.h"
#include "../sim/SimContext.h"

namespace Rampart {

class PickupSystem {
public:
    // One draw from the session RNG. Returns the type dropped, if any.
    std::optional<CollectibleType> rollDrop(SimContext& ctx, const Engine::Vec2& position);

    // Collection and despawn. Runs after combat.
    void update(SimContext& ctx);

    // Drops power-ups whose expiry has been reached. Runs before anything reads them.
    void expireEffects(SimContext& ctx);

    // Applies a collectible's effect to the player. Exposed for direct use by tests and tools.
    void applyPickup(SimContext& ctx, Engine::ECS::Entity player, CollectibleType type);

private:
    void collect(SimContext& ctx);
    void ageCollectibles(SimContext& ctx);
};

}  // namespace Rampart
