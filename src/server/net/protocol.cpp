// SPDX-License-Identifier: Apache-2.0
#include "server/net/protocol.hpp"

#include <cmath>
#include <type_traits>

namespace blob::net {

static void set_vec(blob::Vec2 *out, game::Vector2D v)
{
    out->set_x(v.x);
    out->set_y(v.y);
}

std::optional<game::Command> decode_client_message(uint32_t player_id, const std::string &payload)
{
    blob::ClientMessage cmsg;
    if (!cmsg.ParseFromArray(payload.data(), static_cast<int>(payload.size())))
        return std::nullopt;
    switch (cmsg.payload_case()) {
        case blob::ClientMessage::kJoin:
            return game::make_join(player_id, cmsg.join().name());
        case blob::ClientMessage::kMove: {
            if (!cmsg.move().has_position())
                return std::nullopt;
            const auto &p = cmsg.move().position();
            // World positions stay finite.
            if (!std::isfinite(p.x()) || !std::isfinite(p.y()))
                return std::nullopt;
            return game::make_move(player_id, game::Vector2D{p.x(), p.y()});
        }
        case blob::ClientMessage::PAYLOAD_NOT_SET:
            break;
    }
    return std::nullopt;
}

void to_proto(const game::MessageToClient &msg, blob::ServerMessage &out)
{
    std::visit(
        [&out](const auto &m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, game::JoinSuccess>) {
                out.mutable_join_success()->set_id(m.id);
            } else if constexpr (std::is_same_v<T, game::PlayerEaten>) {
                out.mutable_player_eaten()->set_id(m.id);
            } else {
                auto *st = out.mutable_state();
                st->set_tick(m.tick);
                st->mutable_players()->Reserve(static_cast<int>(m.players.size()));
                for (const auto &p : m.players) {
                    auto *ps = st->add_players();
                    ps->set_id(p.id);
                    set_vec(ps->mutable_position(), p.position);
                    ps->set_radius(p.radius);
                    ps->set_name(p.name);
                }
                st->mutable_food()->Reserve(static_cast<int>(m.food.size()));
                for (const auto &f : m.food) {
                    auto *fs = st->add_food();
                    set_vec(fs->mutable_position(), f.position);
                    fs->set_radius(f.radius);
                }
            }
        },
        msg);
}

bool encode_server_message(const game::MessageToClient &msg, std::string &out)
{
    blob::ServerMessage smsg;
    to_proto(msg, smsg);
    return smsg.SerializeToString(&out);
}

bool encode_join(const std::string &name, std::string &out)
{
    blob::ClientMessage cmsg;
    cmsg.mutable_join()->set_name(name);
    return cmsg.SerializeToString(&out);
}

bool encode_move(game::Vector2D target, std::string &out)
{
    blob::ClientMessage cmsg;
    set_vec(cmsg.mutable_move()->mutable_position(), target);
    return cmsg.SerializeToString(&out);
}

} // namespace blob::net
