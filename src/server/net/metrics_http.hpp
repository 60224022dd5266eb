// SPDX-License-Identifier: Apache-2.0
// metrics_http.hpp
// Prometheus text-format endpoint (GET /metrics, HTTP/1.1, one request per connection).
#pragma once
#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace blob::net {

struct HttpResponse
{
    int status{200};
    std::string_view reason{"OK"};
    std::string body;
};

std::string build_metrics_body();
// Maps a raw request head to a response: 200 for GET /metrics, 405 for other methods on
// that path, 404 for other paths, 400 when the request line cannot be parsed.
HttpResponse route_metrics_request(std::string_view request);
std::string render_http_response(const HttpResponse &resp);
coro::task<void> run_metrics_endpoint(std::shared_ptr<coro::io_scheduler> scheduler, uint16_t port);

} // namespace blob::net
