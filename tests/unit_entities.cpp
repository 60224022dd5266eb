// SPDX-License-Identifier: Apache-2.0
// unit_entities.cpp
// Mass, growth and movement rules of a single player.
#include "server/game/entities.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace blob::game;

static bool near(float a, float b, float eps = 1e-3f)
{
    return std::fabs(a - b) < eps;
}

int main()
{
    // mass = 2*pi*r^2
    assert(near(mass(10.f), 2.f * kPi * 100.f));
    assert(mass(0.f) == 0.f);

    // Growth conserves mass.
    float r = radius_after_eat(10.f, 10.f);
    assert(near(r, std::sqrt(200.f)));
    assert(near(mass(r), mass(10.f) + mass(10.f), 1e-1f));
    assert(near(radius_after_eat(7.f, 0.f), 7.f));
    {
        float a = 12.f, b = 3.5f;
        assert(near(mass(radius_after_eat(a, b)), mass(a) + mass(b), 1e-1f));
    }

    // Speed shrinks with size.
    Player small{1, "s", 10.f};
    Player big{2, "b", 20.f};
    assert(small.speed() > big.speed());
    assert(near(small.speed(), kMoveSpeedFactor / std::sqrt(small.mass())));

    // One step covers exactly speed() toward the target.
    {
        Player p{3, "p"};
        float step = p.speed();
        p.move_towards(Vector2D{100.f, 0.f});
        assert(near(p.position.x, step));
        assert(p.position.y == 0.f);
    }

    // A target closer than one step leaves the player in place.
    {
        Player p{4, "p"};
        p.position = Vector2D{50.f, 50.f};
        Vector2D target{50.f + p.speed() * 0.5f, 50.f};
        p.move_towards(target);
        assert(p.position == (Vector2D{50.f, 50.f}));
        p.move_towards(p.position);
        assert(p.position == (Vector2D{50.f, 50.f}));
    }

    // Repeated moves approach the target monotonically without overshooting.
    {
        Player p{5, "p"};
        Vector2D target{30.f, 40.f};
        float prev = distance(p.position, target);
        for (int i = 0; i < 100; ++i) {
            p.move_towards(target);
            float d = distance(p.position, target);
            assert(d <= prev + 1e-4f);
            prev = d;
        }
        assert(prev < p.speed());
    }

    // A zero-radius player has no finite speed; moving must not corrupt its position.
    {
        Player p{6, "dead", 0.f};
        p.position = Vector2D{1.f, 2.f};
        p.move_towards(Vector2D{500.f, 500.f});
        assert(p.position == (Vector2D{1.f, 2.f}));
    }

    // Overlap is strict.
    assert(overlaps(Vector2D{0.f, 0.f}, 5.f, Vector2D{9.f, 0.f}, 5.f));
    assert(!overlaps(Vector2D{0.f, 0.f}, 5.f, Vector2D{10.f, 0.f}, 5.f));

    std::cout << "unit_entities OK" << std::endl;
    return 0;
}
