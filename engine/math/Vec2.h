// Minimal 2D vector for world positions and headings.
#pragma once

#include <cmath>

namespace Engine {

struct Vec2 {
    float x{0.0f};
    float y{0.0f};

    Vec2() = default;
    Vec2(float xIn, float yIn) : x(xIn), y(yIn) {}

    Vec2& operator+=(const Vec2& rhs) {
        x += rhs.x;
        y += rhs.y;
        return *this;
    }

    Vec2& operator-=(const Vec2& rhs) {
        x -= rhs.x;
        y -= rhs.y;
        return *this;
    }

    float lengthSquared() const { return x * x + y * y; }
    float length() const { return std::sqrt(lengthSquared()); }

    // Zero vector stays zero.
    Vec2 normalized() const {
        const float len = length();
        if (len <= 0.0f) return Vec2{};
        return Vec2{x / len, y / len};
    }
};

inline Vec2 operator*(const Vec2& v, float scalar) { return Vec2{v.x * scalar, v.y * scalar}; }
inline Vec2 operator+(const Vec2& a, const Vec2& b) { return Vec2{a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(const Vec2& a, const Vec2& b) { return Vec2{a.x - b.x, a.y - b.y}; }
inline bool operator==(const Vec2& a, const Vec2& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Vec2& a, const Vec2& b) { return !(a == b); }

inline float distanceSquared(const Vec2& a, const Vec2& b) { return (a - b).lengthSquared(); }
inline float distance(const Vec2& a, const Vec2& b) { return (a - b).length(); }

inline Vec2 lerp(const Vec2& a, const Vec2& b, float t) { return a + (b - a) * t; }

}  // namespace Engine
