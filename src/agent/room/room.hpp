#pragma once

#include "../audio_stream.hpp"
#include "room_events.hpp"

#include <expected>
#include <string>
#include <vector>

// Outbound broadcast channel to every participant in the room.
class DistributionSink {
public:
    virtual ~DistributionSink() = default;
    virtual std::expected<void, std::string> publish(const std::string& payload,
                                                     bool reliable = true) = 0;
};

// The room as seen by the agent core.
class Room : public DistributionSink {
public:
    virtual std::string name() const = 0;
    virtual std::vector<Participant> remote_participants() const = 0;

    // Frames of a subscribed remote audio track. Opening a track again ends
    // the previous stream for it.
    virtual AudioStreamPtr open_audio_stream(const TrackId& track) = 0;
};
