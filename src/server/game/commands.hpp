// SPDX-License-Identifier: Apache-2.0
// commands.hpp - Command vocabulary consumed by GameManager and the messages it emits.
#pragma once
#include "server/game/entities.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace blob::game {

// Player commands: sourced by a connection, carry the sender's id.
struct Join
{
    std::string name;
};

struct Move
{
    Vector2D position;
};

struct PlayerCommand
{
    uint32_t id{0};
    std::variant<Join, Move> action;
};

// Internal commands: sourced by the tick timer, the disconnect path, or the consumer itself.
struct Update
{};

struct AddPlayer
{
    uint32_t id{0};
    std::string name;
};

struct RemovePlayer
{
    uint32_t id{0};
};

using InternalCommand = std::variant<Update, AddPlayer, RemovePlayer>;
using Command = std::variant<PlayerCommand, InternalCommand>;

inline Command make_join(uint32_t id, std::string name)
{
    return PlayerCommand{id, Join{std::move(name)}};
}

inline Command make_move(uint32_t id, Vector2D position)
{
    return PlayerCommand{id, Move{position}};
}

inline Command make_update()
{
    return InternalCommand{Update{}};
}

inline Command make_remove(uint32_t id)
{
    return InternalCommand{RemovePlayer{id}};
}

const char *command_name(const Command &cmd);

// Outbound vocabulary (wire-agnostic).
struct JoinSuccess
{
    uint32_t id{0};
};

struct PlayerEaten
{
    uint32_t id{0};
};

struct StateSnapshot
{
    uint64_t tick{0};
    std::vector<Player> players;
    std::vector<Food> food;
};

using MessageToClient = std::variant<JoinSuccess, PlayerEaten, StateSnapshot>;

} // namespace blob::game
