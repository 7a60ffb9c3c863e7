#include "PathPlanner.h"

#include <cstdlib>

#include "SpatialGrid.h"

namespace Rampart {

namespace {
// Diagonal steps may not squeeze between two non-walkable orthogonal cells.
bool canStep(const SpatialGrid& grid, const Cell& from, const Cell& to, const std::optional<Cell>& extraBlocked) {
    auto walkable = [&](const Cell& c) { return grid.isWalkable(c) && !(extraBlocked && *extraBlocked == c); };
    if (!walkable(to)) return false;
    const int dx = to.x - from.x;
    const int dy = to.y - from.y;
    if (dx != 0 && dy != 0) {
        if (!walkable(Cell{from.x + dx, from.y}) || !walkable(Cell{from.x, from.y + dy})) return false;
    }
    return true;
}
}  // namespace

std::vector<int> PathPlanner::distanceField(const SpatialGrid& grid, std::optional<Cell> extraBlocked) {
    const int w = grid.width();
    const int h = grid.height();
    std::vector<int> field(static_cast<std::size_t>(w) * static_cast<std::size_t>(h), kUnreachable);
    const Cell goal = grid.goal();
    if (!grid.isWalkable(goal) || (extraBlocked && *extraBlocked == goal)) return field;

    auto idx = [w](const Cell& c) { return static_cast<std::size_t>(c.y) * static_cast<std::size_t>(w) + c.x; };

    std::vector<Cell> queue;
    queue.reserve(field.size());
    field[idx(goal)] = 0;
    queue.push_back(goal);
    std::size_t qHead = 0;
    while (qHead < queue.size()) {
        const Cell cur = queue[qHead++];
        const int next = field[idx(cur)] + 1;
        for (const Cell& n : grid.neighbors(cur)) {
            if (field[idx(n)] != kUnreachable) continue;
            if (!canStep(grid, cur, n, extraBlocked)) continue;
            field[idx(n)] = next;
            queue.push_back(n);
        }
    }
    return field;
}

void PathPlanner::recompute(const SpatialGrid& grid) {
    width_ = grid.width();
    height_ = grid.height();
    field_ = distanceField(grid);
}

bool PathPlanner::refreshIfDirty(SpatialGrid& grid) {
    if (!grid.dirty() && !field_.empty()) return false;
    recompute(grid);
    grid.clearDirty();
    return true;
}

int PathPlanner::distance(const Cell& c) const {
    if (c.x < 0 || c.y < 0 || c.x >= width_ || c.y >= height_) return kUnreachable;
    return field_[static_cast<std::size_t>(c.y) * static_cast<std::size_t>(width_) + c.x];
}

std::vector<Cell> PathPlanner::cellPath(const SpatialGrid& grid, const Cell& start) const {
    std::vector<Cell> path;
    int d = distance(start);
    if (d == kUnreachable) return path;
    path.push_back(start);
    Cell cur = start;
    while (d > 0) {
        bool stepped = false;
        for (const Cell& n : grid.neighbors(cur)) {
            if (distance(n) != d - 1) continue;
            if (!canStep(grid, cur, n, std::nullopt)) continue;
            cur = n;
            stepped = true;
            break;
        }
        // A consistent field always has a downhill neighbour.
        if (!stepped) return {};
        path.push_back(cur);
        --d;
    }
    return path;
}

std::shared_ptr<const Route> PathPlanner::routeFrom(const SpatialGrid& grid, const Cell& start) const {
    std::vector<Cell> cells = cellPath(grid, start);
    if (cells.empty()) return nullptr;
    std::vector<Engine::Vec2> points;
    points.reserve(cells.size());
    for (const Cell& c : cells) points.push_back(grid.cellCenter(c));
    return std::make_shared<const Route>(std::move(cells), std::move(points));
}

std::shared_ptr<const Route> PathPlanner::routeFrom(const SpatialGrid& grid, const Engine::Vec2& startPos) const {
    std::vector<Cell> cells = cellPath(grid, grid.cellAt(startPos));
    if (cells.empty()) return nullptr;
    std::vector<Engine::Vec2> points;
    points.reserve(cells.size() + 1);
    points.push_back(startPos);
    for (const Cell& c : cells) points.push_back(grid.cellCenter(c));
    return std::make_shared<const Route>(std::move(cells), std::move(points));
}

bool PathPlanner::wouldDisconnect(const SpatialGrid& grid, const Cell& cell,
                                  const std::vector<Cell>& extraSources) const {
    const std::vector<int> field = distanceField(grid, cell);
    auto unreachable = [&](const Cell& c) {
        if (!grid.inBounds(c)) return true;
        return field[static_cast<std::size_t>(c.y) * static_cast<std::size_t>(grid.width()) + c.x] == kUnreachable;
    };
    for (const Cell& s : grid.spawns()) {
        if (unreachable(s)) return true;
    }
    for (const Cell& s : extraSources) {
        if (unreachable(s)) return true;
    }
    return false;
}

bool PathPlanner::routeIsWalkable(const SpatialGrid& grid, const Route& route) {
    const auto& cells = route.cells();
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (!grid.isWalkable(cells[i])) return false;
        if (i == 0) continue;
        const int dx = std::abs(cells[i].x - cells[i - 1].x);
        const int dy = std::abs(cells[i].y - cells[i - 1].y);
        if (dx > 1 || dy > 1 || (dx + dy) == 0) return false;
        if (dx + dy == 2 && !grid.diagonalMoves()) return false;
    }
    return true;
}

}  // namespace Rampart
