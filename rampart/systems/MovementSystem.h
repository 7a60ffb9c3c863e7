// Advances enemies along their routes, projectiles along their flight and the player by input.
#pragma once

#include "../sim/SimContext.h"

namespace Rampart {

class MovementSystem {
public:
    // Re-routes every live enemy from its current position. Call after the planner recomputed.
    void reroute(SimContext& ctx);

    void update(SimContext& ctx);

private:
    void moveEnemies(SimContext& ctx);
    void moveProjectiles(SimContext& ctx);
    void movePlayer(SimContext& ctx);
};

}  // namespace Rampart
