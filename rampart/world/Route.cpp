#include "Route.h"

#include <algorithm>

namespace Rampart {

Route::Route(std::vector<Cell> cells, std::vector<Engine::Vec2> points)
    : cells_(std::move(cells)), points_(std::move(points)) {
    cumulative_.reserve(points_.size());
    float total = 0.0f;
    for (std::size_t i = 0; i < points_.size(); ++i) {
        if (i > 0) total += Engine::distance(points_[i - 1], points_[i]);
        cumulative_.push_back(total);
    }
}

Engine::Vec2 Route::positionAt(float progress) const {
    if (points_.empty()) return Engine::Vec2{};
    if (progress <= 0.0f) return points_.front();
    if (progress >= length()) return points_.back();
    // First vertex whose cumulative distance reaches `progress`.
    auto it = std::lower_bound(cumulative_.begin(), cumulative_.end(), progress);
    const std::size_t hi = static_cast<std::size_t>(it - cumulative_.begin());
    if (hi == 0) return points_.front();
    const std::size_t lo = hi - 1;
    const float segment = cumulative_[hi] - cumulative_[lo];
    if (segment <= 0.0f) return points_[hi];
    return Engine::lerp(points_[lo], points_[hi], (progress - cumulative_[lo]) / segment);
}

}  // namespace Rampart
