// SPDX-License-Identifier: Apache-2.0
// Headless bot: joins, then chases the nearest food from each received State.
#include "arena.pb.h"
#include "common/framing.hpp"
#include "common/logger.hpp"
#include "server/game/vector2d.hpp"
#include "server/net/protocol.hpp"
#include "server/net/socket_io.hpp"

#include <coro/coro.hpp>
#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>
#include <coro/net/tcp/client.hpp>

#include <cstdlib>
#include <limits>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>

using namespace std::chrono_literals;

namespace {

struct BotOptions
{
    std::string host{"127.0.0.1"};
    uint16_t port{3000};
    std::string name{"bot"};
    uint32_t active_secs{30};
};

coro::task<bool> send_frame(coro::net::tcp::client &client, const std::string &payload)
{
    auto frame = blob::netutil::build_frame(payload);
    co_return co_await blob::net::send_all(client, std::span<const char>(frame.data(), frame.size()));
}

// Reads whatever is available within the timeout into the parse state.
// Returns false once the connection is unusable.
coro::task<bool> pump(coro::net::tcp::client &client, blob::netutil::FrameParseState &fps, std::chrono::milliseconds timeout)
{
    auto pstat = co_await client.poll(coro::poll_op::read, timeout);
    if (pstat == coro::poll_status::timeout)
        co_return true;
    if (pstat != coro::poll_status::event)
        co_return false;
    std::string tmp(4096, '\0');
    auto [st, span] = client.recv(tmp);
    if (st == coro::net::recv_status::would_block)
        co_return true;
    if (st != coro::net::recv_status::ok)
        co_return false;
    fps.buffer.insert(fps.buffer.end(), span.begin(), span.end());
    co_return !fps.corrupt;
}

std::optional<blob::game::Vector2D> nearest_food(const blob::State &state, uint32_t self_id)
{
    const blob::PlayerState *me = nullptr;
    for (const auto &p : state.players()) {
        if (p.id() == self_id)
            me = &p;
    }
    if (!me || state.food_size() == 0)
        return std::nullopt;
    blob::game::Vector2D origin{me->position().x(), me->position().y()};
    std::optional<blob::game::Vector2D> best;
    float best_dist = std::numeric_limits<float>::max();
    for (const auto &f : state.food()) {
        blob::game::Vector2D pos{f.position().x(), f.position().y()};
        float d = blob::game::distance(origin, pos);
        if (d < best_dist) {
            best_dist = d;
            best = pos;
        }
    }
    return best;
}

coro::task<int> bot_flow(std::shared_ptr<coro::io_scheduler> scheduler, BotOptions opts)
{
    co_await scheduler->schedule();
    coro::net::tcp::client cli{
        scheduler, {.address = coro::net::ip_address::from_string(opts.host), .port = opts.port}};
    auto cstatus = co_await cli.connect(5s);
    if (cstatus != coro::net::connect_status::connected) {
        blob::log::error("[bot] connect to {}:{} failed", opts.host, opts.port);
        co_return 1;
    }
    std::string payload;
    if (!blob::net::encode_join(opts.name, payload) || !co_await send_frame(cli, payload)) {
        blob::log::error("[bot] failed to send join");
        co_return 1;
    }
    blob::netutil::FrameParseState fps;
    std::optional<uint32_t> self_id;
    uint64_t states_seen = 0;
    auto start = std::chrono::steady_clock::now();
    while (std::chrono::steady_clock::now() - start < std::chrono::seconds(opts.active_secs)) {
        if (!co_await pump(cli, fps, 50ms)) {
            blob::log::warn("[bot] connection lost");
            co_return 1;
        }
        std::optional<blob::game::Vector2D> target;
        while (blob::netutil::try_extract(fps, payload)) {
            blob::ServerMessage sm;
            if (!sm.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
                blob::log::warn("[bot] unparsable server message ({} bytes)", payload.size());
                continue;
            }
            if (sm.has_join_success() && !self_id) {
                self_id = sm.join_success().id();
                blob::log::info("[bot] joined as player {}", *self_id);
            } else if (sm.has_player_eaten()) {
                if (self_id && sm.player_eaten().id() == *self_id) {
                    blob::log::info("[bot] eaten after {} states", states_seen);
                    co_return 0;
                }
            } else if (sm.has_state() && self_id) {
                ++states_seen;
                if (auto t = nearest_food(sm.state(), *self_id))
                    target = t;
            }
        }
        // Only the newest target of a batch is worth sending.
        if (target) {
            if (!blob::net::encode_move(*target, payload) || !co_await send_frame(cli, payload)) {
                blob::log::warn("[bot] failed to send move");
                co_return 1;
            }
        }
    }
    blob::log::info("[bot] active phase finished after {} states", states_seen);
    co_return 0;
}

} // namespace

int main(int argc, char **argv)
{
    BotOptions opts;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--host" && i + 1 < argc)
                opts.host = argv[++i];
            else if (a == "--port" && i + 1 < argc)
                opts.port = static_cast<uint16_t>(std::stoi(argv[++i]));
            else if (a == "--name" && i + 1 < argc)
                opts.name = argv[++i];
            else if (a == "--secs" && i + 1 < argc)
                opts.active_secs = static_cast<uint32_t>(std::stoul(argv[++i]));
            else
                throw std::invalid_argument("unknown option " + a);
        }
        if (const char *env_secs = std::getenv("BLOB_BOT_SECS"))
            opts.active_secs = static_cast<uint32_t>(std::stoul(env_secs));
    } catch (const std::exception &ex) {
        blob::log::error("[bot] bad arguments: {}", ex.what());
        return 2;
    }
    blob::log::init();
    auto scheduler = coro::default_executor::io_executor();
    int rc = coro::sync_wait(bot_flow(scheduler, opts));
    blob::log::shutdown();
    return rc;
}
