// Scalar progress along a shared route.
#pragma once

#include <memory>

#include "../world/Route.h"

namespace Rampart {

struct PathFollower {
    std::shared_ptr<const Route> route;
    float progress{0.0f};
    // Distance covered since spawning, across re-routes.
    float travelled{0.0f};
    int spawnIndex{0};

    bool arrived() const { return !route || progress >= route->length(); }
};

}  // namespace Rampart
