// SPDX-License-Identifier: Apache-2.0
#include "server/game/game_manager.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"

#include <type_traits>

namespace blob::game {

namespace {

template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

coro::task<void> resubmit(
    std::shared_ptr<coro::io_scheduler> scheduler, std::shared_ptr<GameManager> manager, Command cmd)
{
    co_await scheduler->schedule();
    const char *name = command_name(cmd);
    if (!co_await manager->submit(std::move(cmd)))
        blob::log::warn("[game] follow-up {} dropped: intake closed", name);
    co_return;
}

} // namespace

const char *command_name(const Command &cmd)
{
    return std::visit(
        overloaded{
            [](const PlayerCommand &pc) {
                return std::holds_alternative<Join>(pc.action) ? "Join" : "Move";
            },
            [](const InternalCommand &ic) {
                return std::visit(
                    overloaded{
                        [](const Update &) { return "Update"; },
                        [](const AddPlayer &) { return "AddPlayer"; },
                        [](const RemovePlayer &) { return "RemovePlayer"; }},
                    ic);
            }},
        cmd);
}

GameManager::GameManager(
    const WorldConfig &cfg,
    std::shared_ptr<IPlayerOutlet> players_out,
    std::shared_ptr<IBroadcastOutlet> broadcast_out)
    : m_world(cfg), m_players_out(std::move(players_out)), m_broadcast_out(std::move(broadcast_out))
{
    blob::metrics::runtime().food_count.store(m_world.food().size(), std::memory_order_relaxed);
}

coro::task<bool> GameManager::submit(Command cmd)
{
    if (closed())
        co_return false;
    auto result = co_await m_intake.produce(std::move(cmd));
    blob::metrics::runtime().intake_depth.store(m_intake.size(), std::memory_order_relaxed);
    co_return result == coro::rb::produce_result::produced;
}

void GameManager::close()
{
    if (m_closed.exchange(true, std::memory_order_acq_rel))
        return;
    m_intake.shutdown();
}

coro::task<void> GameManager::run(std::shared_ptr<coro::io_scheduler> scheduler)
{
    co_await scheduler->schedule();
    blob::log::info(
        "[game] consumer started players={} food={}", m_world.players().size(), m_world.food().size());
    auto self = shared_from_this();
    while (true) {
        auto next = co_await m_intake.consume();
        if (!next) {
            blob::log::error("[game] command intake closed; simulation stopped at tick {}", m_tick);
            break;
        }
        blob::metrics::runtime().intake_depth.store(m_intake.size(), std::memory_order_relaxed);
        apply(*next);
        for (auto &cmd : take_follow_ups())
            scheduler->spawn(resubmit(scheduler, self, std::move(cmd)));
    }
    m_stopped.store(true, std::memory_order_release);
    co_return;
}

coro::task<void> GameManager::run_ticker(
    std::shared_ptr<coro::io_scheduler> scheduler, std::chrono::milliseconds interval)
{
    co_await scheduler->schedule();
    blob::log::info("[game] tick source started interval={}ms", interval.count());
    while (true) {
        co_await scheduler->yield_for(interval);
        if (!co_await submit(make_update())) {
            blob::log::warn("[game] tick source stopped: intake closed");
            co_return;
        }
    }
}

void GameManager::apply(const Command &cmd)
{
    blob::metrics::runtime().commands_applied.fetch_add(1, std::memory_order_relaxed);
    std::visit(
        overloaded{
            [this](const PlayerCommand &pc) { apply_player(pc); },
            [this](const InternalCommand &ic) { apply_internal(ic); }},
        cmd);
}

std::vector<Command> GameManager::take_follow_ups()
{
    std::vector<Command> out;
    out.swap(m_follow_ups);
    return out;
}

void GameManager::apply_player(const PlayerCommand &cmd)
{
    if (const auto *join = std::get_if<Join>(&cmd.action)) {
        // Join is AddPlayer with the connection's id.
        apply_internal(AddPlayer{cmd.id, join->name});
        return;
    }
    const auto &move = std::get<Move>(cmd.action);
    if (!m_world.move_player(cmd.id, move.position))
        blob::log::trace("[game] move for absent player={} ignored", cmd.id);
}

void GameManager::apply_internal(const InternalCommand &cmd)
{
    std::visit(
        overloaded{
            [this](const Update &) { update(); },
            [this](const AddPlayer &ap) { add_player(ap.id, ap.name); },
            [this](const RemovePlayer &rp) { remove_player(rp.id); }},
        cmd);
}

void GameManager::add_player(uint32_t id, std::string name)
{
    if (!m_world.add_player(id, name)) {
        blob::log::debug("[game] join ignored: player={} already present", id);
        return;
    }
    blob::log::info("[game] player joined id={} name={}", id, name);
    notify(id, JoinSuccess{id});
    blob::metrics::runtime().players_alive.store(m_world.players().size(), std::memory_order_relaxed);
}

void GameManager::remove_player(uint32_t id)
{
    m_reap_pending.erase(id);
    if (!m_world.find_player(id)) {
        blob::log::debug("[game] remove ignored: player={} absent", id);
        return;
    }
    // Notify before removal so the sink is still keyed by this id.
    notify(id, PlayerEaten{id});
    m_world.remove_player(id);
    blob::log::info("[game] player removed id={}", id);
    auto &rt = blob::metrics::runtime();
    rt.players_eaten.fetch_add(1, std::memory_order_relaxed);
    rt.players_alive.store(m_world.players().size(), std::memory_order_relaxed);
}

void GameManager::update()
{
    auto start = std::chrono::steady_clock::now();
    ++m_tick;
    m_world.resolve_player_collisions();
    m_world.resolve_food_collisions();
    for (uint32_t id : m_world.dead_players()) {
        if (m_reap_pending.insert(id).second) {
            blob::log::debug("[game] player={} eaten at tick {}; removal scheduled", id, m_tick);
            m_follow_ups.push_back(make_remove(id));
        }
    }
    m_world.replenish_food();
    publish_state();

    auto &rt = blob::metrics::runtime();
    rt.updates_applied.fetch_add(1, std::memory_order_relaxed);
    rt.players_alive.store(m_world.players().size(), std::memory_order_relaxed);
    rt.food_count.store(m_world.food().size(), std::memory_order_relaxed);
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start);
    blob::metrics::add_tick_duration(static_cast<uint64_t>(ns.count()));
    BLOB_LOG_EVERY_N(
        debug, 1000, "[game] tick={} players={} food={}", m_tick, m_world.players().size(), m_world.food().size());
}

void GameManager::publish_state()
{
    StateSnapshot snap;
    snap.tick = m_tick;
    snap.players = m_world.players();
    snap.food = m_world.food();
    m_broadcast_out->publish(MessageToClient{std::move(snap)});
    blob::metrics::runtime().broadcasts_published.fetch_add(1, std::memory_order_relaxed);
}

void GameManager::notify(uint32_t id, const MessageToClient &msg)
{
    if (m_players_out->send_to(id, msg)) {
        blob::metrics::runtime().direct_delivered.fetch_add(1, std::memory_order_relaxed);
    } else {
        blob::metrics::runtime().direct_dropped.fetch_add(1, std::memory_order_relaxed);
        blob::log::debug("[game] player={} unreachable; notification discarded", id);
    }
}

} // namespace blob::game
