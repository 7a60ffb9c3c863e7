#include "SpatialGrid.h"

#include <algorithm>
#include <cmath>

#include "PathPlanner.h"

namespace Rampart {

SpatialGrid::SpatialGrid(const GridConfig& config)
    : width_(std::max(0, config.width)),
      height_(std::max(0, config.height)),
      cellSize_(config.cellSize),
      diagonal_(config.diagonalMoves),
      terrainSpeed_(config.terrainSpeed),
      spawns_(config.spawns),
      goal_(config.goal) {
    const std::size_t count = static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_);
    cells_.assign(count, CellState::Empty);
    towers_.assign(count, Engine::ECS::kInvalidEntity);
    terrain_.assign(count, Terrain::Open);
    for (const TerrainPatch& patch : config.terrain) {
        for (const Cell& c : patch.cells) {
            if (inBounds(c)) terrain_[indexOf(c)] = patch.type;
        }
    }
    for (const Cell& c : config.blocked) {
        if (inBounds(c)) cells_[indexOf(c)] = CellState::Blocked;
    }
}

CellState SpatialGrid::state(const Cell& c) const {
    if (!inBounds(c)) return CellState::Blocked;
    return cells_[indexOf(c)];
}

Terrain SpatialGrid::terrain(const Cell& c) const {
    if (!inBounds(c)) return Terrain::Open;
    return terrain_[indexOf(c)];
}

float SpatialGrid::speedFactor(const Cell& c) const {
    if (!inBounds(c)) return 1.0f;
    return terrainSpeed_[index(terrain_[indexOf(c)])];
}

bool SpatialGrid::isSpawn(const Cell& c) const {
    return std::find(spawns_.begin(), spawns_.end(), c) != spawns_.end();
}

bool SpatialGrid::isBuildable(const Cell& c) const {
    return inBounds(c) && state(c) == CellState::Empty && !isSpawn(c) && !isGoal(c);
}

CommandError SpatialGrid::validatePlacement(const Cell& c, const PathPlanner& planner,
                                            const std::vector<Cell>& enemyCells) const {
    if (!inBounds(c)) return CommandError::OutOfBounds;
    if (state(c) == CellState::Tower) return CommandError::OccupiedCell;
    if (!isBuildable(c)) return CommandError::NotBuildable;
    if (std::find(enemyCells.begin(), enemyCells.end(), c) != enemyCells.end()) {
        return CommandError::OccupiedCell;
    }
    if (planner.wouldDisconnect(*this, c, enemyCells)) return CommandError::WouldBlockPath;
    return CommandError::None;
}

CommandResult SpatialGrid::placeTower(const Cell& c, Engine::ECS::Entity towerId, const PathPlanner& planner,
                                      const std::vector<Cell>& enemyCells) {
    const CommandError err = validatePlacement(c, planner, enemyCells);
    if (err != CommandError::None) return CommandResult::fail(err);
    cells_[indexOf(c)] = CellState::Tower;
    towers_[indexOf(c)] = towerId;
    dirty_ = true;
    return CommandResult::ok(static_cast<std::int64_t>(towerId));
}

Engine::ECS::Entity SpatialGrid::removeTower(const Cell& c) {
    if (!inBounds(c) || cells_[indexOf(c)] != CellState::Tower) return Engine::ECS::kInvalidEntity;
    const Engine::ECS::Entity id = towers_[indexOf(c)];
    cells_[indexOf(c)] = CellState::Empty;
    towers_[indexOf(c)] = Engine::ECS::kInvalidEntity;
    dirty_ = true;
    return id;
}

Engine::ECS::Entity SpatialGrid::towerAt(const Cell& c) const {
    if (!inBounds(c)) return Engine::ECS::kInvalidEntity;
    return towers_[indexOf(c)];
}

std::vector<Cell> SpatialGrid::neighbors(const Cell& c) const {
    constexpr int dirs[8][2] = {{0, -1}, {1, 0}, {0, 1}, {-1, 0}, {1, -1}, {1, 1}, {-1, 1}, {-1, -1}};
    const int count = diagonal_ ? 8 : 4;
    std::vector<Cell> out;
    out.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
        const Cell n{c.x + dirs[i][0], c.y + dirs[i][1]};
        if (inBounds(n)) out.push_back(n);
    }
    return out;
}

Cell SpatialGrid::cellAt(const Engine::Vec2& worldPos) const {
    return Cell{static_cast<int>(std::floor(worldPos.x / cellSize_)),
                static_cast<int>(std::floor(worldPos.y / cellSize_))};
}

Engine::Vec2 SpatialGrid::cellCenter(const Cell& c) const {
    return Engine::Vec2{(static_cast<float>(c.x) + 0.5f) * cellSize_, (static_cast<float>(c.y) + 0.5f) * cellSize_};
}

}  // namespace Rampart
