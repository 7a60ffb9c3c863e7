// Occupancy map of placement cells. Validates and commits tower placement.
#pragma once

#include <array>
#include <vector>

#include "../../engine/ecs/Entity.h"
#include "../../engine/math/Vec2.h"
#include "../CommandResult.h"
#include "../config/GameConfig.h"
#include "Cell.h"

namespace Rampart {

class PathPlanner;

enum class CellState { Empty, Blocked, Tower };

class SpatialGrid {
public:
    SpatialGrid() = default;
    explicit SpatialGrid(const GridConfig& config);

    int width() const { return width_; }
    int height() const { return height_; }
    float cellSize() const { return cellSize_; }
    bool diagonalMoves() const { return diagonal_; }
    const std::vector<Cell>& spawns() const { return spawns_; }
    Cell goal() const { return goal_; }

    bool inBounds(const Cell& c) const { return c.x >= 0 && c.y >= 0 && c.x < width_ && c.y < height_; }
    CellState state(const Cell& c) const;
    bool isWalkable(const Cell& c) const { return inBounds(c) && state(c) == CellState::Empty; }
    bool isSpawn(const Cell& c) const;
    bool isGoal(const Cell& c) const { return c == goal_; }

    Terrain terrain(const Cell& c) const;
    // Multiplier applied to enemy speed inside the cell; 1 outside the grid.
    float speedFactor(const Cell& c) const;

    // Empty terrain that is neither a spawn nor the goal.
    bool isBuildable(const Cell& c) const;

    // Full placement check. `enemyCells` are the cells live enemies currently stand in;
    // each must keep a route to the goal, as must every spawn.
    CommandError validatePlacement(const Cell& c, const PathPlanner& planner,
                                   const std::vector<Cell>& enemyCells) const;

    // Validates, then commits. Nothing changes on failure.
    CommandResult placeTower(const Cell& c, Engine::ECS::Entity towerId, const PathPlanner& planner,
                             const std::vector<Cell>& enemyCells);
    // Returns the tower that stood in the cell, or kInvalidEntity.
    Engine::ECS::Entity removeTower(const Cell& c);

    Engine::ECS::Entity towerAt(const Cell& c) const;

    // N, E, S, W, then NE, SE, SW, NW when diagonal moves are enabled. In-bounds only.
    std::vector<Cell> neighbors(const Cell& c) const;

    Cell cellAt(const Engine::Vec2& worldPos) const;
    Engine::Vec2 cellCenter(const Cell& c) const;

    bool dirty() const { return dirty_; }
    void markDirty() { dirty_ = true; }
    void clearDirty() { dirty_ = false; }

private:
    std::size_t indexOf(const Cell& c) const {
        return static_cast<std::size_t>(c.y) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(c.x);
    }

    int width_{0};
    int height_{0};
    float cellSize_{1.0f};
    bool diagonal_{false};
    std::vector<CellState> cells_;
    std::vector<Terrain> terrain_;
    std::array<float, kTerrainCount> terrainSpeed_{};
    std::vector<Engine::ECS::Entity> towers_;
    std::vector<Cell> spawns_;
    Cell goal_{};
    bool dirty_{true};
};

}  // namespace Rampart
