// Player vitals: regeneration after a damage-free delay and respawn after being downed.
#pragma once

#include "../sim/SimContext.h"

namespace Rampart {

class PlayerSystem {
public:
    void update(SimContext& ctx);
};

}  // namespace Rampart
