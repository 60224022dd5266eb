// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/world.hpp"

#include <cstdint>
#include <string>

namespace blob {

struct ServerConfig
{
    uint16_t listen_port{3000};
    uint32_t tick_interval_ms{10};
    float arena_width{800.f};
    float arena_height{600.f};
    uint32_t food_floor{50};
    float food_min_radius{2.f};
    float food_max_radius{6.f};
    float initial_player_radius{10.f};
    // Per-subscriber snapshot backlog before the oldest is discarded.
    uint32_t broadcast_backlog{100};
    uint32_t connection_poll_ms{5};
    uint32_t fixed_seed{0}; // 0 = random
    std::string log_level{"info"};
    bool log_json{false};
    uint16_t metrics_port{0}; // 0 disables
    uint32_t metrics_log_interval_sec{60};
};

// Keys missing from the file keep their defaults. Throws YAML::Exception on unreadable or
// malformed YAML and std::invalid_argument when validate() rejects the result.
ServerConfig load_config(const std::string &path);
ServerConfig parse_config(const std::string &yaml_text);
void validate(const ServerConfig &cfg);

game::WorldConfig world_config(const ServerConfig &cfg);

} // namespace blob
