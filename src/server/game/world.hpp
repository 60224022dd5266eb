// SPDX-License-Identifier: Apache-2.0
// world.hpp - Authoritative players + food collections and the per-tick rules.
// Owned by GameManager; only the command consumer touches it.
#pragma once
#include "server/game/entities.hpp"

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace blob::game {

struct WorldConfig
{
    // Bounds used only to place food; players are not confined.
    float arena_width{800.f};
    float arena_height{600.f};
    uint32_t food_floor{50};
    float food_min_radius{2.f};
    float food_max_radius{6.f};
    float initial_player_radius{kDefaultPlayerRadius};
    // Players at or below this radius are reaped.
    float dead_radius{0.01f};
    // 0 = seed from std::random_device
    uint32_t seed{0};
};

class World
{
public:
    explicit World(const WorldConfig &cfg);

    const WorldConfig &config() const { return m_cfg; }
    const std::vector<Player> &players() const { return m_players; }
    const std::vector<Food> &food() const { return m_food; }

    Player *find_player(uint32_t id);
    const Player *find_player(uint32_t id) const;
    // Returns false (and changes nothing) if the id is already present.
    bool add_player(uint32_t id, std::string name);
    // Returns false if the id was not present.
    bool remove_player(uint32_t id);
    // Unknown id is a no-op; returns whether a player moved.
    bool move_player(uint32_t id, Vector2D target);

    // Tick steps, in the order Update runs them.
    void resolve_player_collisions();
    void resolve_food_collisions();
    std::vector<uint32_t> dead_players() const;
    void replenish_food();

private:
    friend struct WorldTestAccess;
    // Exact scenario setup, bypassing add_player and random placement.
    Player &insert_player(Player p);
    void set_food(std::vector<Food> food);

    Food random_food();

    WorldConfig m_cfg;
    std::mt19937 m_rng;
    std::vector<Player> m_players;
    std::vector<Food> m_food;
};

} // namespace blob::game
