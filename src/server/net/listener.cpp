// SPDX-License-Identifier: Apache-2.0
#include "server/net/listener.hpp"

#include "common/framing.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/net/protocol.hpp"
#include "server/net/socket_io.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <span>
#include <string>
#include <vector>

namespace blob::net {

static coro::task<void> connection_loop(
    std::shared_ptr<coro::io_scheduler> scheduler, ServerContext ctx, ListenerOptions opts, coro::net::tcp::client client);

coro::task<void> run_listener(std::shared_ptr<coro::io_scheduler> scheduler, ServerContext ctx, ListenerOptions opts)
{
    co_await scheduler->schedule();
    blob::log::info("[listener] accepting on port {}", opts.port);
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = opts.port}};
    while (true) {
        auto status = co_await server.poll();
        if (status == coro::poll_status::event) {
            auto client = server.accept();
            if (client.socket().is_valid())
                scheduler->spawn(connection_loop(scheduler, ctx, opts, std::move(client)));
        } else if (status == coro::poll_status::error || status == coro::poll_status::closed) {
            blob::log::error("[listener] poll error/closed, exiting accept loop");
            co_return;
        }
    }
}

// Direct messages first, then snapshots, so JoinSuccess precedes the first State that
// contains the player.
static std::string build_batch(
    const std::vector<game::MessageToClient> &direct, const std::vector<session::SharedMessage> &broadcast)
{
    std::string batch;
    std::string payload;
    for (const auto &msg : direct) {
        if (encode_server_message(msg, payload))
            netutil::append_frame(batch, payload);
    }
    for (const auto &msg : broadcast) {
        if (encode_server_message(*msg, payload))
            netutil::append_frame(batch, payload);
    }
    return batch;
}

static coro::task<void> connection_loop(
    std::shared_ptr<coro::io_scheduler> scheduler, ServerContext ctx, ListenerOptions opts, coro::net::tcp::client client)
{
    co_await scheduler->schedule();
    const uint32_t id = ctx.sinks->allocate_id();
    auto sink = ctx.sinks->register_sink(id);
    auto feed = ctx.hub->subscribe();
    blob::log::info("[conn] player={} connected", id);
    netutil::FrameParseState fps;
    const char *reason = "closed by peer";
    bool open = true;
    while (open) {
        auto batch = build_batch(sink->drain(), feed->drain());
        if (!batch.empty() && !co_await send_all(client, std::span<const char>(batch.data(), batch.size()))) {
            reason = "send failed";
            break;
        }
        auto pstat = co_await client.poll(coro::poll_op::read, opts.poll_timeout);
        if (pstat == coro::poll_status::timeout)
            continue;
        if (pstat == coro::poll_status::error || pstat == coro::poll_status::closed) {
            reason = "poll error";
            break;
        }
        std::string tmp(4096, '\0');
        auto [rstatus, span] = client.recv(tmp);
        if (rstatus == coro::net::recv_status::closed)
            break;
        if (rstatus == coro::net::recv_status::would_block)
            continue;
        if (rstatus != coro::net::recv_status::ok) {
            reason = "recv error";
            break;
        }
        fps.buffer.insert(fps.buffer.end(), span.begin(), span.end());
        std::string payload;
        while (netutil::try_extract(fps, payload)) {
            auto cmd = decode_client_message(id, payload);
            if (!cmd) {
                blob::metrics::runtime().malformed_messages.fetch_add(1, std::memory_order_relaxed);
                blob::log::debug("[conn] player={} malformed message ({} bytes) discarded", id, payload.size());
                continue;
            }
            if (!co_await ctx.manager->submit(std::move(*cmd))) {
                reason = "simulation stopped";
                open = false;
                break;
            }
        }
        if (fps.corrupt) {
            reason = "corrupt framing";
            break;
        }
    }
    ctx.sinks->unregister_sink(id);
    feed.reset();
    blob::log::info("[conn] player={} disconnected ({})", id, reason);
    if (!co_await ctx.manager->submit(game::make_remove(id)))
        blob::log::debug("[conn] player={} removal not submitted: intake closed", id);
    co_return;
}

} // namespace blob::net
