#pragma once

#include "room/room.hpp"
#include "session_registry.hpp"

// Publishes the number of active sessions to the room on every tick.
class Heartbeat {
public:
    Heartbeat(SessionRegistry& registry, DistributionSink& sink, bool verbose = false);

    // A failed publish is logged; the next tick proceeds as usual.
    bool tick();

    unsigned long ticks() const { return ticks_; }

private:
    SessionRegistry& registry_;
    DistributionSink& sink_;
    bool verbose_;
    unsigned long ticks_ = 0;
};
