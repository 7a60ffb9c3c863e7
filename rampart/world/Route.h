// Walkable polyline from a start position to the goal, addressed by distance travelled.
#pragma once

#include <vector>

#include "../../engine/math/Vec2.h"
#include "Cell.h"

namespace Rampart {

class Route {
public:
    Route() = default;
    // `points` holds one world point per cell, optionally preceded by a free start point.
    Route(std::vector<Cell> cells, std::vector<Engine::Vec2> points);

    const std::vector<Cell>& cells() const { return cells_; }
    const std::vector<Engine::Vec2>& points() const { return points_; }
    bool empty() const { return points_.empty(); }
    float length() const { return cumulative_.empty() ? 0.0f : cumulative_.back(); }

    // Clamped to [0, length()].
    Engine::Vec2 positionAt(float progress) const;

private:
    std::vector<Cell> cells_;
    std::vector<Engine::Vec2> points_;
    std::vector<float> cumulative_;
};

}  // namespace Rampart
