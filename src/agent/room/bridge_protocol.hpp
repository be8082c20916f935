#pragma once

#include "../audio_stream.hpp"
#include "room_events.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Newline-delimited JSON spoken with the room gateway process.
namespace bridge {

// First message after connecting: the room and everyone already in it.
struct RoomJoined {
    std::string room;
    std::vector<Participant> participants;
};

struct AudioFrameMessage {
    TrackId track;
    AudioFrame frame;
};

// The gateway stopped delivering a track, cleanly or with an error.
struct TrackEnded {
    TrackId track;
    std::optional<std::string> error;
};

using Message = std::variant<RoomJoined, RoomEvent, AudioFrameMessage, TrackEnded>;

std::expected<Message, std::string> parse_message(const nlohmann::json& j);

nlohmann::json publish_command(const std::string& payload, bool reliable);

TrackKind track_kind_from_string(const std::string& s);

} // namespace bridge
