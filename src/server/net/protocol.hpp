// SPDX-License-Identifier: Apache-2.0
// protocol.hpp
// Conversion between the core's command/message vocabulary and the protobuf wire schema.
#pragma once
#include "arena.pb.h"
#include "server/game/commands.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace blob::net {

// Nothing is returned for payloads that do not parse, carry no command, omit a
// required field, or carry a non-finite coordinate. The caller discards the message and keeps the connection.
std::optional<game::Command> decode_client_message(uint32_t player_id, const std::string &payload);

void to_proto(const game::MessageToClient &msg, blob::ServerMessage &out);
bool encode_server_message(const game::MessageToClient &msg, std::string &out);

// Client-side helpers (bot client and tests).
bool encode_join(const std::string &name, std::string &out);
bool encode_move(game::Vector2D target, std::string &out);

} // namespace blob::net
