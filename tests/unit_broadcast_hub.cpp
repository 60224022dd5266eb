// SPDX-License-Identifier: Apache-2.0
#include "server/session/broadcast_hub.hpp"

#include <cassert>
#include <iostream>

using namespace blob;

static game::MessageToClient state(uint64_t tick)
{
    game::StateSnapshot s;
    s.tick = tick;
    return s;
}

static uint64_t tick_of(const session::SharedMessage &m)
{
    return std::get<game::StateSnapshot>(*m).tick;
}

int main()
{
    session::BroadcastHub hub{3};
    // Publishing with no subscribers is fine.
    hub.publish(state(0));

    auto a = hub.subscribe();
    auto b = hub.subscribe();
    assert(hub.subscriber_count() == 2);
    hub.publish(state(1));
    hub.publish(state(2));
    auto got = a->drain();
    assert(got.size() == 2 && tick_of(got[0]) == 1 && tick_of(got[1]) == 2);
    // Both subscribers share the same message object.
    auto got_b = b->drain();
    assert(got_b.size() == 2 && got_b[0].get() == got[0].get());

    // A lagging subscriber keeps only the newest `backlog` messages.
    for (uint64_t t = 3; t <= 7; ++t)
        hub.publish(state(t));
    assert(a->pending() == 3);
    assert(a->dropped() == 2);
    got = a->drain();
    assert(tick_of(got[0]) == 5 && tick_of(got[2]) == 7);
    assert(a->pending() == 0);

    // Late subscribers only see what follows.
    auto c = hub.subscribe();
    hub.publish(state(8));
    got = c->drain();
    assert(got.size() == 1 && tick_of(got[0]) == 8);

    // Releasing the subscription unsubscribes.
    b.reset();
    assert(hub.subscriber_count() == 2);
    hub.publish(state(9));
    assert(a->drain().size() == 2);
    c.reset();
    a.reset();
    hub.publish(state(10));
    assert(hub.subscriber_count() == 0);

    // Zero backlog is clamped to one.
    session::BroadcastHub tiny{0};
    auto t = tiny.subscribe();
    tiny.publish(state(1));
    tiny.publish(state(2));
    got = t->drain();
    assert(got.size() == 1 && tick_of(got[0]) == 2);

    std::cout << "unit_broadcast_hub OK" << std::endl;
    return 0;
}
