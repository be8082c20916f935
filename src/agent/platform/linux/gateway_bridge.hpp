#pragma once

#include "room/bridge_protocol.hpp"
#include "room/room.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

// The room, reached through a local gateway process over a unix socket.
//
// Everything except publish() belongs to the event loop thread. Audio frames
// are routed into the per-track AudioStreams handed out by
// open_audio_stream(); room events are returned to the caller of
// read_events().
class GatewayBridge : public Room {
public:
    explicit GatewayBridge(bool verbose = false);
    ~GatewayBridge() override;

    GatewayBridge(const GatewayBridge&) = delete;
    GatewayBridge& operator=(const GatewayBridge&) = delete;

    // Connects and waits for the room_joined greeting.
    bool connect(const std::string& endpoint, uint32_t timeout_ms);

    int fd() const { return fd_; }

    // Reads what the socket has and handles every complete line. Room events
    // are appended to out. Returns false once the gateway is gone.
    bool read_events(std::vector<RoomEvent>& out);

    // Handles one protocol line as if it came from the socket.
    void handle_line(const std::string& line, std::vector<RoomEvent>& out);

    void close();

    std::string name() const override { return room_name_; }
    std::vector<Participant> remote_participants() const override { return participants_; }
    AudioStreamPtr open_audio_stream(const TrackId& track) override;
    std::expected<void, std::string> publish(const std::string& payload, bool reliable) override;

    size_t open_streams() const { return streams_.size(); }
    uint64_t dropped_frames() const { return dropped_frames_; }

private:
    void apply(const bridge::RoomJoined& joined);
    void apply(const RoomEvent& event);
    void route(bridge::AudioFrameMessage& msg);
    void end_track(const std::string& key, const std::optional<std::string>& error);
    void fail_all(const std::string& error);

    Participant* find_participant(const std::string& sid);

    void log(const std::string& msg);

    static constexpr size_t MAX_LINE = 4 * 1024 * 1024;

    bool verbose_;
    int fd_ = -1;
    std::string buf_;
    bool joined_ = false;

    std::string room_name_;
    std::vector<Participant> participants_;
    std::map<std::string, AudioStreamPtr> streams_;
    uint64_t dropped_frames_ = 0;

    std::mutex send_mutex_;
};
