// Breadth-first distance field from the goal and the routes derived from it.
#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "../../engine/math/Vec2.h"
#include "Cell.h"
#include "Route.h"

namespace Rampart {

class SpatialGrid;

class PathPlanner {
public:
    static constexpr int kUnreachable = -1;

    // Rebuilds the distance field unconditionally.
    void recompute(const SpatialGrid& grid);
    // Rebuilds only when the grid changed since the last call. Returns true if it did.
    bool refreshIfDirty(SpatialGrid& grid);

    // Steps to the goal, or kUnreachable. Valid after recompute().
    int distance(const Cell& c) const;
    bool reachable(const Cell& c) const { return distance(c) != kUnreachable; }

    // Cell route from `start` to the goal; nullptr when unreachable.
    std::shared_ptr<const Route> routeFrom(const SpatialGrid& grid, const Cell& start) const;
    // Same, but the polyline begins at the given world position instead of the start cell's centre.
    std::shared_ptr<const Route> routeFrom(const SpatialGrid& grid, const Engine::Vec2& startPos) const;

    // True when occupying `cell` would leave any spawn or any of `extraSources` without a route.
    bool wouldDisconnect(const SpatialGrid& grid, const Cell& cell, const std::vector<Cell>& extraSources) const;

    // Every consecutive pair adjacent and every cell walkable.
    static bool routeIsWalkable(const SpatialGrid& grid, const Route& route);

    // BFS from the goal over walkable cells; `extraBlocked` is treated as a tower.
    static std::vector<int> distanceField(const SpatialGrid& grid, std::optional<Cell> extraBlocked = std::nullopt);

private:
    std::vector<Cell> cellPath(const SpatialGrid& grid, const Cell& start) const;

    int width_{0};
    int height_{0};
    std::vector<int> field_;
};

}  // namespace Rampart
