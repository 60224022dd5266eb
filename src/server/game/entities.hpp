// SPDX-License-Identifier: Apache-2.0
// entities.hpp - Player and food data plus the mass / growth / movement rules
#pragma once
#include "server/game/vector2d.hpp"

#include <cstdint>
#include <string>

namespace blob::game {

inline constexpr float kPi = 3.14159265358979323846f;
inline constexpr float kDefaultPlayerRadius = 10.0f;
// Distance budget per Move is kMoveSpeedFactor / sqrt(mass).
inline constexpr float kMoveSpeedFactor = 100.0f;

struct Food
{
    Vector2D position;
    float radius{0.f};
};

struct Player
{
    uint32_t id{0};
    Vector2D position;
    float radius{kDefaultPlayerRadius};
    std::string name;

    Player() = default;
    Player(uint32_t player_id, std::string player_name, float initial_radius = kDefaultPlayerRadius)
        : id(player_id), radius(initial_radius), name(std::move(player_name))
    {}

    float mass() const;
    // Step length for one Move at the current size (larger players are slower).
    float speed() const;
    // Advances one step toward target; stays put when the target is closer than one step.
    void move_towards(Vector2D target);
};

// Derived, never stored: 2 * pi * r^2.
float mass(float radius);
// Mass-conserving merge of two circles; used for player-vs-player and player-vs-food.
float radius_after_eat(float radius_a, float radius_b);

// Centers closer than the sum of radii.
inline bool overlaps(Vector2D a, float ra, Vector2D b, float rb)
{
    return distance(a, b) < ra + rb;
}

} // namespace blob::game
