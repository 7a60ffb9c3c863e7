// Integer grid coordinate.
#pragma once

namespace Rampart {

struct Cell {
    int x{0};
    int y{0};
};

inline bool operator==(const Cell& a, const Cell& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Cell& a, const Cell& b) { return !(a == b); }
inline bool operator<(const Cell& a, const Cell& b) { return a.y != b.y ? a.y < b.y : a.x < b.x; }

}  // namespace Rampart
