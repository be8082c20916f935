#pragma once

#include "../session_registry.hpp"

#include <string>
#include <variant>
#include <vector>

enum class TrackKind { Audio, Video, Data, Unknown };

struct TrackPublication {
    std::string sid;
    TrackKind kind = TrackKind::Unknown;
    bool subscribed = false;
};

struct Participant {
    std::string sid;
    std::string identity;
    std::vector<TrackPublication> tracks;
};

struct ParticipantConnected {
    Participant participant;
};

struct ParticipantDisconnected {
    Participant participant;
};

struct TrackSubscribed {
    Participant participant;
    TrackPublication track;
};

struct TrackUnsubscribed {
    Participant participant;
    TrackPublication track;
};

struct DataReceived {
    std::string participant_identity;
    std::string topic;
    std::string data;
};

using RoomEvent = std::variant<ParticipantConnected, ParticipantDisconnected,
                               TrackSubscribed, TrackUnsubscribed, DataReceived>;

inline TrackId track_id(const Participant& p, const TrackPublication& t) {
    return {p.sid, t.sid};
}
