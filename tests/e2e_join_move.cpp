// SPDX-License-Identifier: Apache-2.0
// e2e_join_move.cpp
// Full server over loopback TCP: malformed frame tolerated, join, snapshot, move, disconnect.
#include "arena.pb.h"
#include "common/framing.hpp"
#include "common/metrics.hpp"
#include "server/net/listener.hpp"
#include "server/net/protocol.hpp"

#include <coro/coro.hpp>
#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>
#include <coro/net/tcp/client.hpp>

#include <cassert>
#include <iostream>
#include <optional>
#include <span>
#include <thread>

using namespace std::chrono_literals;

static coro::task<bool> send_payload(coro::net::tcp::client &cli, const std::string &payload)
{
    auto frame = blob::netutil::build_frame(payload);
    std::span<const char> rest(frame.data(), frame.size());
    while (!rest.empty()) {
        co_await cli.poll(coro::poll_op::write);
        auto [s, r] = cli.send(rest);
        if (s == coro::net::send_status::ok || s == coro::net::send_status::would_block)
            rest = r;
        else
            co_return false;
    }
    co_return true;
}

// Reads until pred accepts a message or the deadline passes.
template <typename Pred>
static coro::task<bool> read_until(
    coro::net::tcp::client &cli, blob::netutil::FrameParseState &fps, std::chrono::seconds limit, Pred pred)
{
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        std::string pl;
        while (blob::netutil::try_extract(fps, pl)) {
            blob::ServerMessage sm;
            bool parsed = sm.ParseFromArray(pl.data(), static_cast<int>(pl.size()));
            assert(parsed);
            if (pred(sm))
                co_return true;
        }
        co_await cli.poll(coro::poll_op::read, 100ms);
        std::string tmp(4096, '\0');
        auto [rs, span] = cli.recv(tmp);
        if (rs == coro::net::recv_status::would_block)
            continue;
        if (rs != coro::net::recv_status::ok)
            co_return false;
        fps.buffer.insert(fps.buffer.end(), span.begin(), span.end());
    }
    co_return false;
}

static const blob::PlayerState *find_self(const blob::State &st, uint32_t id)
{
    for (const auto &p : st.players()) {
        if (p.id() == id)
            return &p;
    }
    return nullptr;
}

static coro::task<void> client_flow(std::shared_ptr<coro::io_scheduler> sched, uint16_t port)
{
    co_await sched->yield_for(50ms);
    {
        coro::net::tcp::client cli{sched, {.address = coro::net::ip_address::from_string("127.0.0.1"), .port = port}};
        auto st = co_await cli.connect(2s);
        assert(st == coro::net::connect_status::connected);

        // Undecodable payload: discarded, connection stays up.
        assert(co_await send_payload(cli, std::string("\x0a\x05" "ab", 4)));

        std::string payload;
        assert(blob::net::encode_join("e2e", payload));
        assert(co_await send_payload(cli, payload));

        blob::netutil::FrameParseState fps;
        std::optional<uint32_t> self;
        bool joined = co_await read_until(cli, fps, 5s, [&](const blob::ServerMessage &sm) {
            if (sm.has_join_success())
                self = sm.join_success().id();
            return self.has_value();
        });
        assert(joined && *self == 0);

        float start_x = 0.f, start_y = 0.f;
        bool baseline = co_await read_until(cli, fps, 5s, [&](const blob::ServerMessage &sm) {
            if (!sm.has_state())
                return false;
            const auto *me = find_self(sm.state(), *self);
            if (!me)
                return false;
            start_x = me->position().x();
            start_y = me->position().y();
            return true;
        });
        assert(baseline);

        assert(blob::net::encode_move(blob::game::Vector2D{start_x + 100.f, start_y}, payload));
        assert(co_await send_payload(cli, payload));
        bool moved = co_await read_until(cli, fps, 5s, [&](const blob::ServerMessage &sm) {
            if (!sm.has_state())
                return false;
            const auto *me = find_self(sm.state(), *self);
            return me && me->position().x() > start_x && me->position().y() == start_y;
        });
        assert(moved);
    }
    // Client destroyed: the server notices the close and unregisters the player.
    co_return;
}

int main()
{
    auto sched = coro::default_executor::io_executor();
    uint16_t port = 41010;
    auto sinks = std::make_shared<blob::session::SinkRegistry>();
    auto hub = std::make_shared<blob::session::BroadcastHub>();
    blob::game::WorldConfig cfg;
    cfg.seed = 5;
    auto manager = std::make_shared<blob::game::GameManager>(cfg, sinks, hub);
    sched->spawn(manager->run(sched));
    sched->spawn(manager->run_ticker(sched, 10ms));
    sched->spawn(blob::net::run_listener(
        sched,
        blob::net::ServerContext{.manager = manager, .sinks = sinks, .hub = hub},
        blob::net::ListenerOptions{.port = port, .poll_timeout = 5ms}));
    coro::sync_wait(client_flow(sched, port));

    auto deadline = std::chrono::steady_clock::now() + 3s;
    while (sinks->size() != 0 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(10ms);
    assert(sinks->size() == 0);
    assert(blob::metrics::runtime().malformed_messages.load() >= 1);
    std::cout << "e2e_join_move OK" << std::endl;
    return 0;
}
