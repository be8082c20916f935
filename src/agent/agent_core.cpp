#include "agent_core.hpp"

#include "messages.hpp"

#include <format>
#include <print>

AgentCore::AgentCore(Room& room, SpeechEngine& engine, TranscriptStore& store,
                     SessionRegistry& registry, bool verbose)
    : room_(room), engine_(engine), store_(store), registry_(registry), verbose_(verbose) {}

AgentCore::~AgentCore() {
    shutdown();
}

void AgentCore::start() {
    auto participants = room_.remote_participants();
    log(std::format("Connected to room {}, {} participants", room_.name(), participants.size()));

    for (auto& p : participants) {
        process_participant_tracks(p);
    }
}

void AgentCore::handle_event(const RoomEvent& event) {
    reap_finished();

    if (auto* joined = std::get_if<ParticipantConnected>(&event)) {
        log("New participant joined: " + joined->participant.identity);
        process_participant_tracks(joined->participant);
    } else if (auto* sub = std::get_if<TrackSubscribed>(&event)) {
        if (sub->track.kind != TrackKind::Audio) return;
        log("New audio track from " + sub->participant.identity);
        process_audio_track(sub->participant, sub->track);
    } else if (auto* unsub = std::get_if<TrackUnsubscribed>(&event)) {
        if (unsub->track.kind != TrackKind::Audio) return;
        log("Audio track removed from " + unsub->participant.identity);
        // The session may still be draining; free the id now so the track
        // can be picked up again right away.
        registry_.release(track_id(unsub->participant, unsub->track).str());
    } else if (auto* left = std::get_if<ParticipantDisconnected>(&event)) {
        log("Participant left: " + left->participant.identity);
    } else if (auto* data = std::get_if<DataReceived>(&event)) {
        if (data->topic == "lk.chat") {
            log("Chat message received: " + data->data);
        }
    }
}

void AgentCore::process_participant_tracks(const Participant& participant) {
    for (auto& track : participant.tracks) {
        if (track.subscribed && track.kind == TrackKind::Audio) {
            process_audio_track(participant, track);
        }
    }
}

void AgentCore::process_audio_track(const Participant& participant, const TrackPublication& track) {
    auto id = track_id(participant, track);
    auto key = id.str();

    auto lease = registry_.try_acquire(key);
    if (!lease) {
        log("Already processing track " + key);
        return;
    }

    auto audio = room_.open_audio_stream(id);
    if (!audio) {
        std::println(stderr, "agent: no audio stream for track {}", key);
        registry_.release(key, *lease);
        return;
    }

    auto session = std::make_unique<TrackSession>(
        id, *lease, participant.identity, room_.name(), std::move(audio),
        TrackSession::Deps{registry_, engine_, room_, store_}, verbose_);

    auto* s = session.get();
    sessions_.push_back(Running{std::move(session), std::jthread([s] { s->run(); })});
}

void AgentCore::reap_finished() {
    for (auto& r : sessions_) {
        if (r.session->status() == TrackStatus::Terminated && r.thread.joinable()) {
            r.thread.join();
        }
    }
    std::erase_if(sessions_, [](const Running& r) {
        return r.session->status() == TrackStatus::Terminated && !r.thread.joinable();
    });
}

nlohmann::json AgentCore::handle_command(const std::string& cmd_str,
                                         const nlohmann::json& /*cmd*/) {
    if (cmd_str == "status") return handle_status();
    if (cmd_str == "sessions") return handle_sessions();
    return {{"status", "error"}, {"message", "unknown command"}};
}

nlohmann::json AgentCore::handle_status() {
    return {
        {"status", "healthy"},
        {"service", "room-transcriber"},
        {"room", room_.name()},
        {"active_sessions", registry_.size()},
        {"timestamp", iso_timestamp_now()},
    };
}

nlohmann::json AgentCore::handle_sessions() {
    reap_finished();

    nlohmann::json resp = {{"status", "ok"}, {"sessions", nlohmann::json::array()}};
    for (auto& r : sessions_) {
        auto state = r.session->status();
        if (state == TrackStatus::Terminated) continue;
        resp["sessions"].push_back({
            {"track", r.session->id()},
            {"participant", r.session->participant()},
            {"state", state == TrackStatus::Active ? "active" : "stopping"},
        });
    }
    return resp;
}

void AgentCore::shutdown() {
    if (sessions_.empty()) return;

    log(std::format("Waiting for {} sessions to finish...", sessions_.size()));
    for (auto& r : sessions_) {
        r.session->close_audio();
    }
    for (auto& r : sessions_) {
        if (r.thread.joinable()) r.thread.join();
    }
    sessions_.clear();
}

void AgentCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[room-transcriber] {}", msg);
    }
}
