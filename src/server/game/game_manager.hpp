// SPDX-License-Identifier: Apache-2.0
#pragma once
#include "server/game/commands.hpp"
#include "server/game/outlets.hpp"
#include "server/game/world.hpp"

#include <coro/coro.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <unordered_set>
#include <vector>

namespace blob::game {

inline constexpr size_t kCommandIntakeCapacity = 100;

// Owns the world and serializes every mutation of it through one bounded FIFO.
// Any number of producers submit(); exactly one run() coroutine consumes and applies.
class GameManager : public std::enable_shared_from_this<GameManager>
{
public:
    GameManager(
        const WorldConfig &cfg,
        std::shared_ptr<IPlayerOutlet> players_out,
        std::shared_ptr<IBroadcastOutlet> broadcast_out);

    // Producer side. Suspends while the intake is full; false once closed.
    coro::task<bool> submit(Command cmd);
    // Closes the intake. The consumer treats this as fatal and stops.
    void close();
    bool closed() const noexcept { return m_closed.load(std::memory_order_acquire); }
    bool stopped() const noexcept { return m_stopped.load(std::memory_order_acquire); }

    // Consumer loop. Follow-up commands are resubmitted on spawned producers.
    coro::task<void> run(std::shared_ptr<coro::io_scheduler> scheduler);
    // Enqueues Update every interval. No drift compensation.
    coro::task<void> run_ticker(std::shared_ptr<coro::io_scheduler> scheduler, std::chrono::milliseconds interval);

    // Applies one command. Consumer only.
    void apply(const Command &cmd);
    // Commands scheduled by apply() that must go back through the intake.
    std::vector<Command> take_follow_ups();

    const World &world() const { return m_world; }
    uint64_t tick() const noexcept { return m_tick; }

private:
    friend struct GameManagerTestAccess;

    void apply_player(const PlayerCommand &cmd);
    void apply_internal(const InternalCommand &cmd);
    void add_player(uint32_t id, std::string name);
    void remove_player(uint32_t id);
    void update();
    void publish_state();
    void notify(uint32_t id, const MessageToClient &msg);

    World m_world;
    std::shared_ptr<IPlayerOutlet> m_players_out;
    std::shared_ptr<IBroadcastOutlet> m_broadcast_out;
    coro::ring_buffer<Command, kCommandIntakeCapacity> m_intake;
    std::atomic<bool> m_closed{false};
    std::atomic<bool> m_stopped{false};
    // Ids with a RemovePlayer already scheduled by the reap step.
    std::unordered_set<uint32_t> m_reap_pending;
    std::vector<Command> m_follow_ups;
    uint64_t m_tick{0};
};

} // namespace blob::game
