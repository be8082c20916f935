#include "track_session.hpp"

#include "messages.hpp"

#include <exception>
#include <format>
#include <print>
#include <thread>

using json = nlohmann::json;

TrackSession::TrackSession(TrackId id, SessionRegistry::Lease lease, std::string participant,
                           std::string room, AudioStreamPtr audio, Deps deps, bool verbose)
    : id_(id.str()), lease_(lease), participant_(std::move(participant)), room_(std::move(room)),
      audio_(std::move(audio)), deps_(deps), verbose_(verbose) {}

void TrackSession::run() {
    // Runs on every exit path, including exceptions.
    struct Release {
        TrackSession& s;
        ~Release() {
            // A no-op if the id was released on unsubscribe and has been
            // acquired again since.
            s.deps_.registry.release(s.id_, s.lease_);
            s.status_.store(TrackStatus::Terminated, std::memory_order_release);
            s.log("Stopped processing track " + s.id_);
        }
    } release{*this};

    log(std::format("Starting transcription for {} (track: {})", participant_, id_));

    try {
        auto opened = deps_.engine.open_stream();
        if (!opened) {
            std::println(stderr, "session {}: cannot open speech stream: {}", id_, opened.error());
            return;
        }
        SpeechStream& speech = **opened;

        std::expected<void, std::string> forwarded;
        std::expected<void, std::string> drained;

        std::jthread forwarder([&](std::stop_token stoken) {
            try {
                forwarded = forward_frames(speech, stoken);
            } catch (const std::exception& e) {
                speech.end_input();
                forwarded = std::unexpected(std::string("frame forwarding: ") + e.what());
            }
        });

        std::jthread drainer([&] {
            try {
                drained = drain_events(speech);
            } catch (const std::exception& e) {
                drained = std::unexpected(std::string("event draining: ") + e.what());
            }
            if (!drained) {
                // Nobody is listening any more; unblock the audio side.
                status_.store(TrackStatus::Stopping, std::memory_order_release);
                forwarder.request_stop();
                speech.cancel();
            }
        });

        drainer.join();
        forwarder.join();

        if (!forwarded) {
            std::println(stderr, "session {}: error processing audio for {}: {}",
                         id_, participant_, forwarded.error());
        }
        if (!drained) {
            std::println(stderr, "session {}: error processing audio for {}: {}",
                         id_, participant_, drained.error());
        }
    } catch (const std::exception& e) {
        std::println(stderr, "session {}: error processing audio for {}: {}",
                     id_, participant_, e.what());
    }
}

std::expected<void, std::string> TrackSession::forward_frames(SpeechStream& speech,
                                                              std::stop_token stoken) {
    while (true) {
        auto item = audio_->next(stoken);
        if (!item) {
            speech.end_input();
            return std::unexpected("audio source: " + item.error());
        }
        if (!item->has_value()) break;

        auto pushed = speech.push_frame(**item);
        if (!pushed) {
            speech.end_input();
            return std::unexpected("speech engine: " + pushed.error());
        }
    }

    speech.end_input();
    return {};
}

std::expected<void, std::string> TrackSession::drain_events(SpeechStream& speech) {
    while (true) {
        auto event = speech.next_event();
        if (!event) {
            return std::unexpected("speech engine: " + event.error());
        }
        if (!event->has_value()) return {};
        handle_event(**event);
    }
}

void TrackSession::handle_event(const SpeechEvent& event) {
    if (event.type == SpeechEventType::EndOfSpeech) {
        log("End of speech detected for " + participant_);
        return;
    }
    if (event.alternatives.empty()) return;

    const auto& best = event.alternatives.front();
    if (!has_text(best.text)) return;

    TranscriptMessage msg{
        .text = best.text,
        .is_final = event.type == SpeechEventType::FinalTranscript,
        .participant = participant_,
        .timestamp = iso_timestamp_now(),
        .confidence = best.confidence,
    };

    auto payload = msg.to_json().dump(-1, ' ', false, json::error_handler_t::replace);
    auto sent = deps_.sink.publish(payload, true);
    if (!sent) {
        std::println(stderr, "session {}: publish failed: {}", id_, sent.error());
    }

    if (!msg.is_final) {
        log(std::format("[{}]: {}...", participant_, msg.text));
        return;
    }

    log(std::format("[{}]: {}", participant_, msg.text));

    auto saved = deps_.store.append(TranscriptRecord{
        .timestamp = msg.timestamp,
        .participant = participant_,
        .text = msg.text,
        .room = room_,
    });
    if (!saved) {
        std::println(stderr, "session {}: saving transcript failed: {}", id_, saved.error());
    }
}

void TrackSession::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[room-transcriber] {}", msg);
    }
}
