// SPDX-License-Identifier: Apache-2.0
#pragma once
#include <coro/coro.hpp>
#include <coro/net/tcp/client.hpp>

#include <span>

namespace blob::net {

// Writes every byte or reports failure.
coro::task<bool> send_all(coro::net::tcp::client &client, std::span<const char> data);

} // namespace blob::net
