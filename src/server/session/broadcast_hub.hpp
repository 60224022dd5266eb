// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/outlets.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

namespace blob::session {

using SharedMessage = std::shared_ptr<const game::MessageToClient>;

// One subscriber's view of the broadcast stream. Bounded: when the backlog is full the
// oldest message is discarded, so a slow reader skips snapshots instead of stalling ticks.
class Subscription
{
public:
    explicit Subscription(size_t backlog) : m_backlog(backlog == 0 ? 1 : backlog) {}

    std::vector<SharedMessage> drain();
    size_t pending();
    uint64_t dropped();

private:
    friend class BroadcastHub;
    void deliver(const SharedMessage &msg);

    size_t m_backlog;
    std::mutex m_mutex;
    std::deque<SharedMessage> m_pending;
    uint64_t m_dropped{0};
};

class BroadcastHub : public game::IBroadcastOutlet
{
public:
    explicit BroadcastHub(size_t backlog = 100) : m_backlog(backlog) {}

    // Receives everything published after this call; release the pointer to unsubscribe.
    std::shared_ptr<Subscription> subscribe();
    size_t subscriber_count();

    void publish(const game::MessageToClient &msg) override;

private:
    size_t m_backlog;
    std::mutex m_mutex;
    std::vector<std::weak_ptr<Subscription>> m_subscribers;
};

} // namespace blob::session
