// SPDX-License-Identifier: Apache-2.0
#include "server/net/socket_io.hpp"

#include <coro/poll.hpp>

namespace blob::net {

coro::task<bool> send_all(coro::net::tcp::client &client, std::span<const char> data)
{
    std::span<const char> rest = data;
    while (!rest.empty()) {
        auto pstat = co_await client.poll(coro::poll_op::write);
        if (pstat == coro::poll_status::error || pstat == coro::poll_status::closed)
            co_return false;
        auto [s, remaining] = client.send(rest);
        if (s != coro::net::send_status::ok && s != coro::net::send_status::would_block)
            co_return false;
        rest = remaining;
    }
    co_return true;
}

} // namespace blob::net
