// SPDX-License-Identifier: Apache-2.0
#include "server/net/metrics_http.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/net/socket_io.hpp"

#include <coro/net/tcp/client.hpp>
#include <coro/net/tcp/server.hpp>
#include <coro/poll.hpp>

#include <chrono>
#include <span>
#include <sstream>
#include <string_view>

namespace blob::net {

static void counter(std::ostringstream &oss, const char *name, uint64_t v)
{
    oss << "# TYPE blob_" << name << " counter\n" << "blob_" << name << ' ' << v << '\n';
}

static void gauge(std::ostringstream &oss, const char *name, uint64_t v)
{
    oss << "# TYPE blob_" << name << " gauge\n" << "blob_" << name << ' ' << v << '\n';
}

std::string build_metrics_body()
{
    std::ostringstream oss;
    auto &rt = blob::metrics::runtime();
    counter(oss, "commands_applied", rt.commands_applied.load());
    counter(oss, "updates_applied", rt.updates_applied.load());
    counter(oss, "players_eaten", rt.players_eaten.load());
    counter(oss, "malformed_messages", rt.malformed_messages.load());
    counter(oss, "direct_delivered", rt.direct_delivered.load());
    counter(oss, "direct_dropped", rt.direct_dropped.load());
    counter(oss, "broadcasts_published", rt.broadcasts_published.load());
    counter(oss, "broadcast_backlog_drops", rt.broadcast_backlog_drops.load());
    gauge(oss, "intake_depth", rt.intake_depth.load());
    gauge(oss, "players_alive", rt.players_alive.load());
    gauge(oss, "food_count", rt.food_count.load());
    gauge(oss, "connected_players", rt.connected_players.load());
    gauge(oss, "p99_tick_ns", blob::metrics::approx_tick_p99());
    // Tick duration histogram; buckets double from 50us.
    oss << "# TYPE blob_tick_duration_ns histogram\n";
    uint64_t cumulative = 0;
    for (int i = 0; i < blob::metrics::RuntimeCounters::TICK_BUCKETS; ++i) {
        cumulative += rt.tick_hist[i].load();
        uint64_t le = blob::metrics::RuntimeCounters::TICK_BUCKET_BASE_NS << i;
        oss << "blob_tick_duration_ns_bucket{le=\"" << le << "\"} " << cumulative << '\n';
    }
    oss << "blob_tick_duration_ns_bucket{le=\"+Inf\"} " << cumulative << '\n';
    oss << "blob_tick_duration_ns_sum " << rt.tick_duration_ns_accum.load() << '\n';
    oss << "blob_tick_duration_ns_count " << rt.tick_samples.load() << '\n';
    return oss.str();
}

HttpResponse route_metrics_request(std::string_view request)
{
    auto line_end = request.find("\r\n");
    if (line_end == std::string_view::npos)
        return {400, "Bad Request", "malformed request\n"};
    std::string_view line = request.substr(0, line_end);
    auto sp1 = line.find(' ');
    auto sp2 = sp1 == std::string_view::npos ? sp1 : line.find(' ', sp1 + 1);
    if (sp1 == std::string_view::npos || sp2 == std::string_view::npos)
        return {400, "Bad Request", "malformed request\n"};
    std::string_view method = line.substr(0, sp1);
    std::string_view target = line.substr(sp1 + 1, sp2 - sp1 - 1);
    target = target.substr(0, target.find('?'));
    if (target != "/metrics")
        return {404, "Not Found", "not found\n"};
    if (method != "GET")
        return {405, "Method Not Allowed", "only GET is supported\n"};
    return {200, "OK", build_metrics_body()};
}

std::string render_http_response(const HttpResponse &resp)
{
    std::ostringstream out;
    out << "HTTP/1.1 " << resp.status << ' ' << resp.reason << "\r\n";
    out << "Content-Type: text/plain; version=0.0.4\r\n";
    if (resp.status == 405)
        out << "Allow: GET\r\n";
    out << "Content-Length: " << resp.body.size() << "\r\n";
    out << "Connection: close\r\n\r\n";
    out << resp.body;
    return out.str();
}

// One request per connection; the head is read until the blank line or the size cap.
static coro::task<void> serve_scrape(std::shared_ptr<coro::io_scheduler> scheduler, coro::net::tcp::client client)
{
    co_await scheduler->schedule();
    constexpr size_t kMaxRequestHead = 4096;
    std::string head;
    std::string chunk(1024, '\0');
    while (head.find("\r\n\r\n") == std::string::npos && head.size() < kMaxRequestHead) {
        auto pstat = co_await client.poll(coro::poll_op::read, std::chrono::milliseconds(200));
        if (pstat != coro::poll_status::event) {
            blob::log::debug("[metrics] scrape abandoned before request completed");
            co_return;
        }
        auto [rs, span] = client.recv(chunk);
        if (rs == coro::net::recv_status::would_block)
            continue;
        if (rs != coro::net::recv_status::ok) {
            blob::log::debug("[metrics] scrape read failed");
            co_return;
        }
        head.append(span.begin(), span.end());
    }
    auto resp = route_metrics_request(head);
    if (resp.status != 200)
        blob::log::debug("[metrics] scrape rejected status={}", resp.status);
    auto wire = render_http_response(resp);
    if (!co_await send_all(client, std::span<const char>(wire.data(), wire.size())))
        blob::log::debug("[metrics] scrape response not delivered");
}

coro::task<void> run_metrics_endpoint(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port)
{
    co_await scheduler->schedule();
    coro::net::tcp::server server{scheduler, coro::net::tcp::server::options{.port = port}};
    blob::log::info("[metrics] serving GET /metrics on port {}", port);
    while (true) {
        auto st = co_await server.poll();
        if (st == coro::poll_status::timeout)
            continue;
        if (st != coro::poll_status::event) {
            blob::log::error("[metrics] listener on port {} failed; endpoint disabled", port);
            co_return;
        }
        auto client = server.accept();
        if (!client.socket().is_valid()) {
            blob::log::debug("[metrics] accept returned an invalid socket");
            continue;
        }
        scheduler->spawn(serve_scrape(scheduler, std::move(client)));
    }
}

} // namespace blob::net
