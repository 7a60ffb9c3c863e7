// Dropped collectible waiting for the player.
#pragma once

#include "../Types.h"

namespace Rampart {

struct CollectibleState {
    CollectibleType type{CollectibleType::Health};
    float remaining{0.0f};  // seconds until it despawns
};

}  // namespace Rampart
