// SPDX-License-Identifier: Apache-2.0
#include "server/game/entities.hpp"

#include <cmath>

namespace blob::game {

float mass(float radius)
{
    return 2.0f * radius * radius * kPi;
}

float radius_after_eat(float radius_a, float radius_b)
{
    float combined = mass(radius_a) + mass(radius_b);
    return std::sqrt(combined / (2.0f * kPi));
}

float Player::mass() const
{
    return game::mass(radius);
}

float Player::speed() const
{
    return kMoveSpeedFactor / std::sqrt(mass());
}

void Player::move_towards(Vector2D target)
{
    float v = speed();
    Vector2D diff = target - position;
    if (diff.magnitude() < v)
        return; // arrived; wait for the next target
    position = position + diff.normalize() * v;
}

} // namespace blob::game
