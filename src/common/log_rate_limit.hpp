// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/logger.hpp"

#include <atomic>
#include <cstdint>

// Per-callsite rate-limited logging: emits every Nth invocation.
// Usage: BLOB_LOG_EVERY_N(debug, 100, "tick {} players={}", tick, n);
#define BLOB_LOG_EVERY_N(level, N, ...) \
    do { \
        static std::atomic<uint64_t> blob_log_every_n_counter{0}; \
        if ((blob_log_every_n_counter.fetch_add(1, std::memory_order_relaxed) + 1) % (N) == 0) { \
            blob::log::level(__VA_ARGS__); \
        } \
    } while (0)
