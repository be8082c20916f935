#pragma once

#include "audio_stream.hpp"
#include "room/room.hpp"
#include "session_registry.hpp"
#include "speech/speech_engine.hpp"
#include "storage/transcript_store.hpp"

#include <atomic>
#include <expected>
#include <stop_token>
#include <string>

enum class TrackStatus { Active, Stopping, Terminated };

// Transcribes one remote audio track from first frame to end of stream.
//
// run() forwards audio frames into a speech conversation on one thread while
// draining its events on another, joins both, and always releases its lease
// on the track id on the way out. Failures are logged, never thrown.
class TrackSession {
public:
    struct Deps {
        SessionRegistry& registry;
        SpeechEngine& engine;
        DistributionSink& sink;
        TranscriptStore& store;
    };

    TrackSession(TrackId id, SessionRegistry::Lease lease, std::string participant,
                 std::string room, AudioStreamPtr audio, Deps deps, bool verbose = false);

    TrackSession(const TrackSession&) = delete;
    TrackSession& operator=(const TrackSession&) = delete;

    void run();

    const std::string& id() const { return id_; }
    const std::string& participant() const { return participant_; }
    TrackStatus status() const { return status_.load(std::memory_order_acquire); }

    // Ends the audio side; the session winds down on its own.
    void close_audio() { audio_->close(); }

private:
    std::expected<void, std::string> forward_frames(SpeechStream& speech, std::stop_token stoken);
    std::expected<void, std::string> drain_events(SpeechStream& speech);
    void handle_event(const SpeechEvent& event);

    void log(const std::string& msg);

    std::string id_;
    SessionRegistry::Lease lease_;
    std::string participant_;
    std::string room_;
    AudioStreamPtr audio_;
    Deps deps_;
    bool verbose_;

    std::atomic<TrackStatus> status_{TrackStatus::Active};
};
