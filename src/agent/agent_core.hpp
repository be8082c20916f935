#pragma once

#include "room/room.hpp"
#include "room/room_events.hpp"
#include "session_registry.hpp"
#include "speech/speech_engine.hpp"
#include "storage/transcript_store.hpp"
#include "track_session.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

// Turns room events into transcription sessions. All public methods are
// called from the event loop thread; the sessions themselves run on their
// own threads.
class AgentCore {
public:
    AgentCore(Room& room, SpeechEngine& engine, TranscriptStore& store,
              SessionRegistry& registry, bool verbose);
    ~AgentCore();

    AgentCore(const AgentCore&) = delete;
    AgentCore& operator=(const AgentCore&) = delete;

    // Starts sessions for every audio track already in the room.
    void start();

    void handle_event(const RoomEvent& event);

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    // Joins and drops sessions that have terminated.
    void reap_finished();

    // Sessions not yet reaped, terminated or not.
    size_t session_count() const { return sessions_.size(); }

    // Ends every track's audio and waits for all sessions to finish.
    void shutdown();

private:
    void process_participant_tracks(const Participant& participant);
    void process_audio_track(const Participant& participant, const TrackPublication& track);

    nlohmann::json handle_status();
    nlohmann::json handle_sessions();

    void log(const std::string& msg);

    Room& room_;
    SpeechEngine& engine_;
    TranscriptStore& store_;
    SessionRegistry& registry_;
    bool verbose_;

    struct Running {
        std::unique_ptr<TrackSession> session;
        std::jthread thread;
    };
    std::vector<Running> sessions_;
};
