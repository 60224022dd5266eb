// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "server/game/outlets.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace blob::session {

// Outbound queue for one connected player. The connection loop drains it and does the
// actual socket write, so pushing never waits on the network.
class PlayerSink
{
public:
    explicit PlayerSink(uint32_t id) : m_id(id) {}

    uint32_t id() const noexcept { return m_id; }
    // False once closed.
    bool push(const game::MessageToClient &msg);
    std::vector<game::MessageToClient> drain();
    void close();
    bool is_closed();

private:
    uint32_t m_id;
    std::mutex m_mutex; // guards this entry only
    std::deque<game::MessageToClient> m_outgoing;
    bool m_closed{false};
};

class SinkRegistry : public game::IPlayerOutlet
{
public:
    // Player ids are handed out on the accept path, starting at 0.
    uint32_t allocate_id() noexcept;
    std::shared_ptr<PlayerSink> register_sink(uint32_t id);
    void unregister_sink(uint32_t id);
    std::shared_ptr<PlayerSink> find(uint32_t id);
    size_t size();

    bool send_to(uint32_t id, const game::MessageToClient &msg) override;

private:
    std::atomic<uint32_t> m_next_id{0};
    std::mutex m_mutex; // guards the map, never held while pushing into a sink
    std::unordered_map<uint32_t, std::shared_ptr<PlayerSink>> m_sinks;
};

} // namespace blob::session
