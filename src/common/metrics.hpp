// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Process-wide counters and gauges (atomics, no dynamic allocation).
#pragma once
#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

namespace blob::metrics {

struct RuntimeCounters
{
    // Command application time for Update commands (one tick).
    std::atomic<uint64_t> tick_duration_ns_accum{0};
    std::atomic<uint64_t> tick_samples{0};
    // Power-of-two buckets (base 50us) -> up to ~25ms.
    static constexpr int TICK_BUCKETS = 10;
    static constexpr uint64_t TICK_BUCKET_BASE_NS = 50'000;
    std::atomic<uint64_t> tick_hist[TICK_BUCKETS]{};
    // Consumer throughput
    std::atomic<uint64_t> commands_applied{0};
    std::atomic<uint64_t> updates_applied{0};
    std::atomic<uint64_t> intake_depth{0};
    // World gauges (written by the single consumer)
    std::atomic<uint64_t> players_alive{0};
    std::atomic<uint64_t> food_count{0};
    std::atomic<uint64_t> players_eaten{0};
    // Transport
    std::atomic<uint64_t> connected_players{0};
    std::atomic<uint64_t> malformed_messages{0};
    std::atomic<uint64_t> direct_delivered{0};
    std::atomic<uint64_t> direct_dropped{0};
    std::atomic<uint64_t> broadcasts_published{0};
    std::atomic<uint64_t> broadcast_backlog_drops{0};
};

inline RuntimeCounters &runtime()
{
    static RuntimeCounters inst;
    return inst;
}

inline void add_tick_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.tick_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.tick_samples.fetch_add(1, std::memory_order_relaxed);
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        if (ns < (RuntimeCounters::TICK_BUCKET_BASE_NS << i)) {
            rt.tick_hist[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    rt.tick_hist[RuntimeCounters::TICK_BUCKETS - 1].fetch_add(1, std::memory_order_relaxed);
}

inline uint64_t avg_tick_ns()
{
    auto &rt = runtime();
    uint64_t samples = rt.tick_samples.load(std::memory_order_relaxed);
    return samples ? rt.tick_duration_ns_accum.load(std::memory_order_relaxed) / samples : 0;
}

// Upper bound of the histogram bucket holding the 99th percentile.
inline uint64_t approx_tick_p99()
{
    auto &rt = runtime();
    uint64_t total = rt.tick_samples.load(std::memory_order_relaxed);
    if (total == 0)
        return 0;
    uint64_t target = (total * 99 + 99 - 1) / 100; // ceil(total*0.99)
    uint64_t cumulative = 0;
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        cumulative += rt.tick_hist[i].load(std::memory_order_relaxed);
        if (cumulative >= target)
            return RuntimeCounters::TICK_BUCKET_BASE_NS << i;
    }
    return RuntimeCounters::TICK_BUCKET_BASE_NS << (RuntimeCounters::TICK_BUCKETS - 1);
}

// Single-line JSON summary used by the periodic metrics log.
inline std::string runtime_json(const char *tag)
{
    auto &rt = runtime();
    std::ostringstream j;
    j << "{\"metric\":\"" << tag << "\"";
    j << ",\"avg_tick_ns\":" << avg_tick_ns();
    j << ",\"p99_tick_ns\":" << approx_tick_p99();
    j << ",\"ticks\":" << rt.tick_samples.load(std::memory_order_relaxed);
    j << ",\"commands_applied\":" << rt.commands_applied.load(std::memory_order_relaxed);
    j << ",\"intake_depth\":" << rt.intake_depth.load(std::memory_order_relaxed);
    j << ",\"players_alive\":" << rt.players_alive.load(std::memory_order_relaxed);
    j << ",\"food_count\":" << rt.food_count.load(std::memory_order_relaxed);
    j << ",\"players_eaten\":" << rt.players_eaten.load(std::memory_order_relaxed);
    j << ",\"connected_players\":" << rt.connected_players.load(std::memory_order_relaxed);
    j << ",\"malformed_messages\":" << rt.malformed_messages.load(std::memory_order_relaxed);
    j << ",\"direct_delivered\":" << rt.direct_delivered.load(std::memory_order_relaxed);
    j << ",\"direct_dropped\":" << rt.direct_dropped.load(std::memory_order_relaxed);
    j << ",\"broadcasts_published\":" << rt.broadcasts_published.load(std::memory_order_relaxed);
    j << ",\"broadcast_backlog_drops\":" << rt.broadcast_backlog_drops.load(std::memory_order_relaxed);
    j << "}";
    return j.str();
}

} // namespace blob::metrics
