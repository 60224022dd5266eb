// SPDX-License-Identifier: Apache-2.0
#include "server/session/broadcast_hub.hpp"

#include "common/metrics.hpp"

#include <algorithm>

namespace blob::session {

std::vector<SharedMessage> Subscription::drain()
{
    std::scoped_lock lk{m_mutex};
    std::vector<SharedMessage> out(m_pending.begin(), m_pending.end());
    m_pending.clear();
    return out;
}

size_t Subscription::pending()
{
    std::scoped_lock lk{m_mutex};
    return m_pending.size();
}

uint64_t Subscription::dropped()
{
    std::scoped_lock lk{m_mutex};
    return m_dropped;
}

void Subscription::deliver(const SharedMessage &msg)
{
    std::scoped_lock lk{m_mutex};
    if (m_pending.size() >= m_backlog) {
        m_pending.pop_front();
        ++m_dropped;
        blob::metrics::runtime().broadcast_backlog_drops.fetch_add(1, std::memory_order_relaxed);
    }
    m_pending.push_back(msg);
}

std::shared_ptr<Subscription> BroadcastHub::subscribe()
{
    auto sub = std::make_shared<Subscription>(m_backlog);
    std::scoped_lock lk{m_mutex};
    m_subscribers.push_back(sub);
    return sub;
}

size_t BroadcastHub::subscriber_count()
{
    std::scoped_lock lk{m_mutex};
    return static_cast<size_t>(
        std::count_if(m_subscribers.begin(), m_subscribers.end(), [](auto &w) { return !w.expired(); }));
}

void BroadcastHub::publish(const game::MessageToClient &msg)
{
    auto shared = std::make_shared<const game::MessageToClient>(msg);
    std::scoped_lock lk{m_mutex};
    m_subscribers.erase(
        std::remove_if(
            m_subscribers.begin(),
            m_subscribers.end(),
            [&](auto &w) {
                auto sub = w.lock();
                if (!sub)
                    return true;
                sub->deliver(shared);
                return false;
            }),
        m_subscribers.end());
}

} // namespace blob::session
