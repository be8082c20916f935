#include "heartbeat.hpp"

#include "messages.hpp"

#include <print>

Heartbeat::Heartbeat(SessionRegistry& registry, DistributionSink& sink, bool verbose)
    : registry_(registry), sink_(sink), verbose_(verbose) {}

bool Heartbeat::tick() {
    ++ticks_;

    HeartbeatMessage msg{
        .active_sessions = registry_.size(),
        .timestamp = iso_timestamp_now(),
    };

    auto sent = sink_.publish(msg.to_json().dump(), true);
    if (!sent) {
        std::println(stderr, "heartbeat: publish failed: {}", sent.error());
        return false;
    }

    if (verbose_) {
        std::println(stderr, "[room-transcriber] Status update sent: {} tracks processing",
                     msg.active_sessions);
    }
    return true;
}
