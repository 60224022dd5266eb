// SPDX-License-Identifier: Apache-2.0
#include "server/config.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace blob {

template <typename T>
static void read_key(const YAML::Node &root, const char *key, T &out)
{
    if (root[key])
        out = root[key].as<T>();
}

static ServerConfig from_node(const YAML::Node &root)
{
    ServerConfig cfg;
    if (!root || root.IsNull())
        return cfg;
    if (!root.IsMap())
        throw std::invalid_argument("config root must be a mapping");
    read_key(root, "listen_port", cfg.listen_port);
    read_key(root, "tick_interval_ms", cfg.tick_interval_ms);
    read_key(root, "arena_width", cfg.arena_width);
    read_key(root, "arena_height", cfg.arena_height);
    read_key(root, "food_floor", cfg.food_floor);
    read_key(root, "food_min_radius", cfg.food_min_radius);
    read_key(root, "food_max_radius", cfg.food_max_radius);
    read_key(root, "initial_player_radius", cfg.initial_player_radius);
    read_key(root, "broadcast_backlog", cfg.broadcast_backlog);
    read_key(root, "connection_poll_ms", cfg.connection_poll_ms);
    read_key(root, "fixed_seed", cfg.fixed_seed);
    read_key(root, "log_level", cfg.log_level);
    read_key(root, "log_json", cfg.log_json);
    read_key(root, "metrics_port", cfg.metrics_port);
    read_key(root, "metrics_log_interval_sec", cfg.metrics_log_interval_sec);
    validate(cfg);
    return cfg;
}

ServerConfig load_config(const std::string &path)
{
    return from_node(YAML::LoadFile(path));
}

ServerConfig parse_config(const std::string &yaml_text)
{
    return from_node(YAML::Load(yaml_text));
}

void validate(const ServerConfig &cfg)
{
    if (cfg.tick_interval_ms == 0)
        throw std::invalid_argument("tick_interval_ms must be > 0");
    if (cfg.broadcast_backlog == 0)
        throw std::invalid_argument("broadcast_backlog must be > 0");
    if (cfg.connection_poll_ms == 0)
        throw std::invalid_argument("connection_poll_ms must be > 0");
    if (!(cfg.food_min_radius > 0.f) || !(cfg.food_min_radius < cfg.food_max_radius))
        throw std::invalid_argument("food radii must satisfy 0 < food_min_radius < food_max_radius");
    if (!(cfg.arena_width > 2.f * cfg.food_max_radius) || !(cfg.arena_height > 2.f * cfg.food_max_radius))
        throw std::invalid_argument("arena must be wider and taller than 2 * food_max_radius");
    if (!(cfg.initial_player_radius > 0.f))
        throw std::invalid_argument("initial_player_radius must be > 0");
}

game::WorldConfig world_config(const ServerConfig &cfg)
{
    game::WorldConfig w;
    w.arena_width = cfg.arena_width;
    w.arena_height = cfg.arena_height;
    w.food_floor = cfg.food_floor;
    w.food_min_radius = cfg.food_min_radius;
    w.food_max_radius = cfg.food_max_radius;
    w.initial_player_radius = cfg.initial_player_radius;
    w.seed = cfg.fixed_seed;
    return w;
}

} // namespace blob
