// SPDX-License-Identifier: Apache-2.0
#include "server/game/world.hpp"

#include <algorithm>

namespace blob::game {

static uint32_t seed_or_random(uint32_t seed)
{
    return seed != 0 ? seed : std::random_device{}();
}

World::World(const WorldConfig &cfg) : m_cfg(cfg), m_rng(seed_or_random(cfg.seed))
{
    m_food.reserve(m_cfg.food_floor);
    replenish_food();
}

Player *World::find_player(uint32_t id)
{
    auto it = std::find_if(m_players.begin(), m_players.end(), [&](const Player &p) { return p.id == id; });
    return it == m_players.end() ? nullptr : &*it;
}

const Player *World::find_player(uint32_t id) const
{
    auto it = std::find_if(m_players.begin(), m_players.end(), [&](const Player &p) { return p.id == id; });
    return it == m_players.end() ? nullptr : &*it;
}

bool World::add_player(uint32_t id, std::string name)
{
    if (find_player(id))
        return false;
    m_players.emplace_back(id, std::move(name), m_cfg.initial_player_radius);
    return true;
}

bool World::remove_player(uint32_t id)
{
    auto before = m_players.size();
    m_players.erase(
        std::remove_if(m_players.begin(), m_players.end(), [&](const Player &p) { return p.id == id; }),
        m_players.end());
    return m_players.size() != before;
}

bool World::move_player(uint32_t id, Vector2D target)
{
    Player *p = find_player(id);
    if (!p)
        return false;
    p->move_towards(target);
    return true;
}

// Full ordered scan: every pair is visited twice, (i,j) then (j,i), and each visit
// reads the radii left by the previous one. i wins only when strictly larger, so on a
// tie the earlier player of the visit loses. A player zeroed by an earlier visit can
// still take part in later visits; outcomes depend on collection order.
void World::resolve_player_collisions()
{
    const size_t n = m_players.size();
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            Player &a = m_players[i];
            Player &b = m_players[j];
            if (a.id == b.id)
                continue;
            if (!overlaps(a.position, a.radius, b.position, b.radius))
                continue;
            float merged = radius_after_eat(a.radius, b.radius);
            if (a.radius > b.radius) {
                a.radius = merged;
                b.radius = 0.f;
            } else {
                b.radius = merged;
                a.radius = 0.f;
            }
        }
    }
}

// Reverse traversal on both collections so erasing food[j] never skips an item.
void World::resolve_food_collisions()
{
    for (size_t i = m_players.size(); i-- > 0;) {
        for (size_t j = m_food.size(); j-- > 0;) {
            Player &p = m_players[i];
            const Food &f = m_food[j];
            if (!overlaps(p.position, p.radius, f.position, f.radius))
                continue;
            p.radius = radius_after_eat(p.radius, f.radius);
            m_food.erase(m_food.begin() + static_cast<std::ptrdiff_t>(j));
        }
    }
}

std::vector<uint32_t> World::dead_players() const
{
    std::vector<uint32_t> ids;
    for (const auto &p : m_players) {
        if (p.radius <= m_cfg.dead_radius)
            ids.push_back(p.id);
    }
    return ids;
}

void World::replenish_food()
{
    while (m_food.size() < m_cfg.food_floor)
        m_food.push_back(random_food());
}

Food World::random_food()
{
    std::uniform_real_distribution<float> ur(m_cfg.food_min_radius, m_cfg.food_max_radius);
    float radius = ur(m_rng);
    std::uniform_real_distribution<float> ux(radius, m_cfg.arena_width - radius);
    std::uniform_real_distribution<float> uy(radius, m_cfg.arena_height - radius);
    float x = ux(m_rng);
    float y = uy(m_rng);
    return Food{Vector2D{x, y}, radius};
}

Player &World::insert_player(Player p)
{
    m_players.push_back(std::move(p));
    return m_players.back();
}

void World::set_food(std::vector<Food> food)
{
    m_food = std::move(food);
}

} // namespace blob::game
