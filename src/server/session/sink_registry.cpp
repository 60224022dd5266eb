// SPDX-License-Identifier: Apache-2.0
#include "server/session/sink_registry.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

namespace blob::session {

bool PlayerSink::push(const game::MessageToClient &msg)
{
    std::scoped_lock lk{m_mutex};
    if (m_closed)
        return false;
    m_outgoing.push_back(msg);
    return true;
}

std::vector<game::MessageToClient> PlayerSink::drain()
{
    std::scoped_lock lk{m_mutex};
    std::vector<game::MessageToClient> out;
    out.reserve(m_outgoing.size());
    for (auto &m : m_outgoing)
        out.push_back(std::move(m));
    m_outgoing.clear();
    return out;
}

void PlayerSink::close()
{
    std::scoped_lock lk{m_mutex};
    m_closed = true;
    m_outgoing.clear();
}

bool PlayerSink::is_closed()
{
    std::scoped_lock lk{m_mutex};
    return m_closed;
}

uint32_t SinkRegistry::allocate_id() noexcept
{
    return m_next_id.fetch_add(1, std::memory_order_relaxed);
}

std::shared_ptr<PlayerSink> SinkRegistry::register_sink(uint32_t id)
{
    auto sink = std::make_shared<PlayerSink>(id);
    std::shared_ptr<PlayerSink> replaced;
    {
        std::scoped_lock lk{m_mutex};
        auto [it, inserted] = m_sinks.try_emplace(id, sink);
        if (!inserted) {
            replaced = std::move(it->second);
            it->second = sink;
        }
        blob::metrics::runtime().connected_players.store(m_sinks.size(), std::memory_order_relaxed);
    }
    if (replaced) {
        blob::log::warn("[sinks] player={} re-registered; previous sink closed", id);
        replaced->close();
    }
    return sink;
}

void SinkRegistry::unregister_sink(uint32_t id)
{
    std::shared_ptr<PlayerSink> removed;
    {
        std::scoped_lock lk{m_mutex};
        auto it = m_sinks.find(id);
        if (it == m_sinks.end())
            return;
        removed = std::move(it->second);
        m_sinks.erase(it);
        blob::metrics::runtime().connected_players.store(m_sinks.size(), std::memory_order_relaxed);
    }
    removed->close();
}

std::shared_ptr<PlayerSink> SinkRegistry::find(uint32_t id)
{
    std::scoped_lock lk{m_mutex};
    auto it = m_sinks.find(id);
    return it == m_sinks.end() ? nullptr : it->second;
}

size_t SinkRegistry::size()
{
    std::scoped_lock lk{m_mutex};
    return m_sinks.size();
}

bool SinkRegistry::send_to(uint32_t id, const game::MessageToClient &msg)
{
    auto sink = find(id);
    if (!sink)
        return false;
    return sink->push(msg);
}

} // namespace blob::session
