// SPDX-License-Identifier: Apache-2.0
// outlets.hpp
// Outbound seams of the simulation core. Implementations must not block the caller:
// the command consumer pushes into them between commands.
#pragma once
#include "server/game/commands.hpp"

#include <cstdint>

namespace blob::game {

class IPlayerOutlet
{
public:
    virtual ~IPlayerOutlet() = default;
    // Queue a message for one player. False when that player is unreachable.
    virtual bool send_to(uint32_t id, const MessageToClient &msg) = 0;
};

class IBroadcastOutlet
{
public:
    virtual ~IBroadcastOutlet() = default;
    // Deliver to every current subscriber (best effort, latest-state-wins).
    virtual void publish(const MessageToClient &msg) = 0;
};

} // namespace blob::game
