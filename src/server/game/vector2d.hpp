// SPDX-License-Identifier: Apache-2.0
// vector2d.hpp - 2D value vector used for positions and displacements
#pragma once

#include <cmath>
#include <ostream>

namespace blob::game {

struct Vector2D
{
    float x{0.f};
    float y{0.f};

    float magnitude() const { return std::sqrt(x * x + y * y); }

    // Zero vector maps to zero (a player at rest has no direction).
    Vector2D normalize() const
    {
        float m = magnitude();
        if (m == 0.f)
            return Vector2D{0.f, 0.f};
        return Vector2D{x / m, y / m};
    }

    Vector2D scale(float by) const { return Vector2D{x * by, y * by}; }
};

inline Vector2D operator+(Vector2D a, Vector2D b)
{
    return Vector2D{a.x + b.x, a.y + b.y};
}

inline Vector2D operator-(Vector2D a, Vector2D b)
{
    return Vector2D{a.x - b.x, a.y - b.y};
}

inline Vector2D operator*(Vector2D v, float by)
{
    return v.scale(by);
}

inline bool operator==(Vector2D a, Vector2D b)
{
    return a.x == b.x && a.y == b.y;
}

inline float distance(Vector2D a, Vector2D b)
{
    return (a - b).magnitude();
}

inline std::ostream &operator<<(std::ostream &os, Vector2D v)
{
    return os << '(' << v.x << ", " << v.y << ')';
}

} // namespace blob::game
