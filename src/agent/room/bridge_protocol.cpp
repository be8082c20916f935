#include "bridge_protocol.hpp"

#include <cstdint>
#include <limits>
#include <optional>

using json = nlohmann::json;

namespace bridge {

namespace {

TrackPublication parse_track(const json& j) {
    return TrackPublication{
        .sid = j.at("sid").get<std::string>(),
        .kind = track_kind_from_string(j.value("kind", "")),
        .subscribed = j.value("subscribed", false),
    };
}

Participant parse_participant(const json& j) {
    Participant p{
        .sid = j.at("sid").get<std::string>(),
        .identity = j.value("identity", ""),
        .tracks = {},
    };
    if (j.contains("tracks")) {
        for (auto& t : j["tracks"]) {
            p.tracks.push_back(parse_track(t));
        }
    }
    if (p.identity.empty()) p.identity = p.sid;
    return p;
}

TrackId parse_track_ref(const json& j) {
    return {j.at("participant_sid").get<std::string>(), j.at("track_sid").get<std::string>()};
}

// nlohmann narrows out-of-range integers silently, so samples and
// format fields are range-checked here.
std::optional<std::vector<int16_t>> parse_samples(const json& j) {
    if (!j.is_array()) return std::nullopt;
    std::vector<int16_t> out;
    out.reserve(j.size());
    for (auto& v : j) {
        if (!v.is_number_integer()) return std::nullopt;
        auto n = v.get<int64_t>();
        if (n < std::numeric_limits<int16_t>::min() || n > std::numeric_limits<int16_t>::max()) {
            return std::nullopt;
        }
        out.push_back(static_cast<int16_t>(n));
    }
    return out;
}

std::optional<uint32_t> parse_format_field(const json& j, const char* key, uint32_t fallback) {
    if (!j.contains(key)) return fallback;
    auto& v = j[key];
    if (!v.is_number_integer()) return std::nullopt;
    if (!v.is_number_unsigned() && v.get<int64_t>() < 0) return std::nullopt;
    auto n = v.get<uint64_t>();
    if (n > std::numeric_limits<uint32_t>::max()) return std::nullopt;
    return static_cast<uint32_t>(n);
}

} // namespace

TrackKind track_kind_from_string(const std::string& s) {
    if (s == "audio") return TrackKind::Audio;
    if (s == "video") return TrackKind::Video;
    if (s == "data") return TrackKind::Data;
    return TrackKind::Unknown;
}

std::expected<Message, std::string> parse_message(const json& j) {
    if (!j.is_object()) return std::unexpected("message is not an object");

    std::string event = j.value("event", "");

    try {
        if (event == "audio_frame") {
            auto track = parse_track_ref(j);
            auto samples = parse_samples(j.at("samples"));
            if (!samples) return std::unexpected("audio_frame: sample out of range");
            auto sample_rate = parse_format_field(j, "sample_rate", 16000);
            auto num_channels = parse_format_field(j, "num_channels", 1);
            if (!sample_rate || !num_channels) return std::unexpected("audio_frame: bad format");

            AudioFrameMessage m{
                .track = std::move(track),
                .frame = {
                    .samples = std::move(*samples),
                    .sample_rate = *sample_rate,
                    .num_channels = *num_channels,
                },
            };
            if (m.frame.num_channels == 0 || m.frame.sample_rate == 0) {
                return std::unexpected("audio_frame: bad format");
            }
            if (m.frame.samples.size() % m.frame.num_channels != 0) {
                return std::unexpected("audio_frame: partial sample");
            }
            return m;
        }
        if (event == "track_subscribed") {
            return RoomEvent{TrackSubscribed{parse_participant(j.at("participant")),
                                             parse_track(j.at("track"))}};
        }
        if (event == "track_unsubscribed") {
            return RoomEvent{TrackUnsubscribed{parse_participant(j.at("participant")),
                                               parse_track(j.at("track"))}};
        }
        if (event == "participant_connected") {
            return RoomEvent{ParticipantConnected{parse_participant(j.at("participant"))}};
        }
        if (event == "participant_disconnected") {
            return RoomEvent{ParticipantDisconnected{parse_participant(j.at("participant"))}};
        }
        if (event == "track_ended") {
            return TrackEnded{parse_track_ref(j), std::nullopt};
        }
        if (event == "track_error") {
            return TrackEnded{parse_track_ref(j), j.value("message", "track error")};
        }
        if (event == "data_received") {
            std::string identity;
            if (j.contains("participant") && j["participant"].is_object()) {
                identity = j["participant"].value("identity", "");
            }
            return RoomEvent{DataReceived{
                .participant_identity = std::move(identity),
                .topic = j.value("topic", ""),
                .data = j.value("data", ""),
            }};
        }
        if (event == "room_joined") {
            RoomJoined m{.room = j.at("room").get<std::string>(), .participants = {}};
            if (j.contains("participants")) {
                for (auto& p : j["participants"]) {
                    m.participants.push_back(parse_participant(p));
                }
            }
            return m;
        }
    } catch (const json::exception& e) {
        return std::unexpected(event + ": " + e.what());
    }

    return std::unexpected("unknown event '" + event + "'");
}

json publish_command(const std::string& payload, bool reliable) {
    return {{"cmd", "publish_data"}, {"reliable", reliable}, {"data", payload}};
}

} // namespace bridge
