// SPDX-License-Identifier: Apache-2.0
#include "common/metrics.hpp"
#include "server/net/metrics_http.hpp"

#include <cassert>
#include <iostream>
#include <string>

int main()
{
    using namespace blob::metrics;
    assert(avg_tick_ns() == 0);
    assert(approx_tick_p99() == 0);
    // 99 fast ticks and one slow one: p99 stays in the fast bucket.
    for (int i = 0; i < 99; ++i)
        add_tick_duration(10'000);
    add_tick_duration(5'000'000);
    auto &rt = runtime();
    assert(rt.tick_samples.load() == 100);
    assert(avg_tick_ns() == (99ull * 10'000 + 5'000'000) / 100);
    assert(approx_tick_p99() == RuntimeCounters::TICK_BUCKET_BASE_NS);
    assert(rt.tick_hist[0].load() == 99);
    // Beyond the last bucket lands in the last bucket.
    add_tick_duration(10'000'000'000ull);
    assert(rt.tick_hist[RuntimeCounters::TICK_BUCKETS - 1].load() == 1);

    rt.players_alive.store(3);
    rt.malformed_messages.fetch_add(2);
    auto json = runtime_json("runtime");
    assert(json.rfind("{\"metric\":\"runtime\"", 0) == 0);
    assert(json.find("\"players_alive\":3") != std::string::npos);
    assert(json.back() == '}');

    auto body = blob::net::build_metrics_body();
    assert(body.find("# TYPE blob_players_alive gauge\nblob_players_alive 3\n") != std::string::npos);
    assert(body.find("blob_malformed_messages 2\n") != std::string::npos);
    assert(body.find("blob_tick_duration_ns_count 101\n") != std::string::npos);
    assert(body.find("blob_tick_duration_ns_bucket{le=\"+Inf\"} 101\n") != std::string::npos);

    using blob::net::route_metrics_request;
    auto ok = route_metrics_request("GET /metrics HTTP/1.1\r\nHost: x\r\n\r\n");
    assert(ok.status == 200);
    assert(ok.body.find("blob_players_alive 3") != std::string::npos);
    assert(route_metrics_request("GET /metrics?x=1 HTTP/1.1\r\n\r\n").status == 200);
    assert(route_metrics_request("GET / HTTP/1.1\r\n\r\n").status == 404);
    assert(route_metrics_request("GET /metricsx HTTP/1.1\r\n\r\n").status == 404);
    assert(route_metrics_request("POST /metrics HTTP/1.1\r\n\r\n").status == 405);
    assert(route_metrics_request("GET/metrics\r\n\r\n").status == 400);
    assert(route_metrics_request("").status == 400);

    auto wire = blob::net::render_http_response(route_metrics_request("DELETE /metrics HTTP/1.1\r\n\r\n"));
    assert(wire.rfind("HTTP/1.1 405 Method Not Allowed\r\n", 0) == 0);
    assert(wire.find("Allow: GET\r\n") != std::string::npos);
    wire = blob::net::render_http_response(ok);
    assert(wire.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
    assert(wire.find("Content-Length: " + std::to_string(ok.body.size()) + "\r\n") != std::string::npos);
    assert(wire.size() >= ok.body.size() && wire.compare(wire.size() - ok.body.size(), ok.body.size(), ok.body) == 0);
    std::cout << "unit_metrics OK" << std::endl;
    return 0;
}
