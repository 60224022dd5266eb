// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/game_manager.hpp"
#include "server/session/broadcast_hub.hpp"
#include "server/session/sink_registry.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <chrono>
#include <cstdint>
#include <memory>

namespace blob::net {

struct ListenerOptions
{
    uint16_t port{3000};
    // Read poll timeout per connection loop; bounds how long queued outbound
    // messages wait before being flushed.
    std::chrono::milliseconds poll_timeout{5};
};

struct ServerContext
{
    std::shared_ptr<game::GameManager> manager;
    std::shared_ptr<session::SinkRegistry> sinks;
    std::shared_ptr<session::BroadcastHub> hub;
};

// Starts the TCP accept loop. Each accepted connection becomes one player: it gets an
// id, a direct sink and a broadcast subscription, and its frames are decoded into
// player commands submitted to the manager.
coro::task<void> run_listener(std::shared_ptr<coro::io_scheduler> scheduler, ServerContext ctx, ListenerOptions opts);

} // namespace blob::net
