#include "platform/linux/gateway_bridge.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <nlohmann/json.hpp>
#include <poll.h>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using json = nlohmann::json;

GatewayBridge::GatewayBridge(bool verbose) : verbose_(verbose) {}

GatewayBridge::~GatewayBridge() {
    for (auto& [key, stream] : streams_) {
        stream->close();
    }
    streams_.clear();
    close();
}

bool GatewayBridge::connect(const std::string& endpoint, uint32_t timeout_ms) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.empty() || endpoint.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "bridge: bad socket path '{}'", endpoint);
        return false;
    }
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        std::println(stderr, "bridge: socket() failed: {}", std::strerror(errno));
        return false;
    }

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "bridge: cannot connect to {}: {}", endpoint, std::strerror(errno));
        ::close(fd);
        return false;
    }

    // A stalled gateway must not wedge the sessions publishing through it.
    timeval tv{.tv_sec = 5, .tv_usec = 0};
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    {
        std::lock_guard lock(send_mutex_);
        fd_ = fd;
    }
    buf_.clear();
    joined_ = false;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::vector<RoomEvent> early;

    while (true) {
        auto pos = buf_.find('\n');
        if (pos != std::string::npos) {
            std::string line = buf_.substr(0, pos);
            buf_.erase(0, pos + 1);
            handle_line(line, early);
            if (joined_) break;
            std::println(stderr, "bridge: expected room_joined greeting, got: {}", line.substr(0, 200));
            close();
            return false;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            std::println(stderr, "bridge: no room_joined from {} within {} ms", endpoint, timeout_ms);
            close();
            return false;
        }

        pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
        int ret = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (ret < 0 && errno == EINTR) continue;
        if (ret <= 0) continue;

        char tmp[4096];
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n <= 0) {
            std::println(stderr, "bridge: gateway closed the connection during handshake");
            close();
            return false;
        }
        buf_.append(tmp, static_cast<size_t>(n));
    }

    log(std::format("Joined room {} ({} participants)", room_name_, participants_.size()));
    return true;
}

bool GatewayBridge::read_events(std::vector<RoomEvent>& out) {
    if (fd_ < 0) return false;

    bool alive = true;
    char tmp[65536];
    while (true) {
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), MSG_DONTWAIT);
        if (n > 0) {
            buf_.append(tmp, static_cast<size_t>(n));
            if (static_cast<size_t>(n) < sizeof(tmp)) break;
            continue;
        }
        if (n == 0) {
            log("Room gateway closed the connection");
            alive = false;
            break;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) break;
        std::println(stderr, "bridge: recv failed: {}", std::strerror(errno));
        alive = false;
        break;
    }

    size_t pos;
    while ((pos = buf_.find('\n')) != std::string::npos) {
        std::string line = buf_.substr(0, pos);
        buf_.erase(0, pos + 1);
        if (!line.empty()) handle_line(line, out);
    }

    if (buf_.size() > MAX_LINE) {
        std::println(stderr, "bridge: line exceeds {} bytes, dropping connection", MAX_LINE);
        alive = false;
    }

    if (!alive) {
        fail_all("room gateway disconnected");
        close();
    }
    return alive;
}

void GatewayBridge::handle_line(const std::string& line, std::vector<RoomEvent>& out) {
    json j;
    try {
        j = json::parse(line);
    } catch (const json::exception& e) {
        std::println(stderr, "bridge: malformed line: {}", e.what());
        return;
    }

    auto msg = bridge::parse_message(j);
    if (!msg) {
        std::println(stderr, "bridge: {}", msg.error());
        return;
    }

    if (auto* joined = std::get_if<bridge::RoomJoined>(&*msg)) {
        apply(*joined);
    } else if (auto* frame = std::get_if<bridge::AudioFrameMessage>(&*msg)) {
        route(*frame);
    } else if (auto* ended = std::get_if<bridge::TrackEnded>(&*msg)) {
        end_track(ended->track.str(), ended->error);
    } else if (auto* event = std::get_if<RoomEvent>(&*msg)) {
        apply(*event);
        out.push_back(std::move(*event));
    }
}

void GatewayBridge::close() {
    std::lock_guard lock(send_mutex_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

AudioStreamPtr GatewayBridge::open_audio_stream(const TrackId& track) {
    auto key = track.str();
    if (auto it = streams_.find(key); it != streams_.end()) {
        it->second->close();
    }
    auto stream = std::make_shared<AudioStream>();
    streams_[key] = stream;
    return stream;
}

std::expected<void, std::string> GatewayBridge::publish(const std::string& payload, bool reliable) {
    std::string msg = bridge::publish_command(payload, reliable)
                          .dump(-1, ' ', false, json::error_handler_t::replace) + "\n";

    std::lock_guard lock(send_mutex_);
    if (fd_ < 0) return std::unexpected("not connected to room gateway");

    size_t off = 0;
    while (off < msg.size()) {
        ssize_t n = ::send(fd_, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(std::string("send failed: ") + std::strerror(errno));
        }
        off += static_cast<size_t>(n);
    }
    return {};
}

void GatewayBridge::apply(const bridge::RoomJoined& joined) {
    room_name_ = joined.room;
    participants_ = joined.participants;
    joined_ = true;
}

void GatewayBridge::apply(const RoomEvent& event) {
    if (auto* connected = std::get_if<ParticipantConnected>(&event)) {
        if (auto* p = find_participant(connected->participant.sid)) {
            *p = connected->participant;
        } else {
            participants_.push_back(connected->participant);
        }
    } else if (auto* left = std::get_if<ParticipantDisconnected>(&event)) {
        auto prefix = left->participant.sid + "_";
        std::vector<std::string> keys;
        for (auto& [key, stream] : streams_) {
            if (key.starts_with(prefix)) keys.push_back(key);
        }
        for (auto& key : keys) end_track(key, std::nullopt);
        std::erase_if(participants_, [&](const Participant& p) {
            return p.sid == left->participant.sid;
        });
    } else if (auto* sub = std::get_if<TrackSubscribed>(&event)) {
        auto* p = find_participant(sub->participant.sid);
        if (!p) {
            participants_.push_back(sub->participant);
            p = &participants_.back();
        }
        auto it = std::ranges::find_if(p->tracks, [&](const TrackPublication& t) {
            return t.sid == sub->track.sid;
        });
        auto track = sub->track;
        track.subscribed = true;
        if (it != p->tracks.end()) {
            *it = track;
        } else {
            p->tracks.push_back(track);
        }
    } else if (auto* unsub = std::get_if<TrackUnsubscribed>(&event)) {
        if (auto* p = find_participant(unsub->participant.sid)) {
            for (auto& t : p->tracks) {
                if (t.sid == unsub->track.sid) t.subscribed = false;
            }
        }
        end_track(track_id(unsub->participant, unsub->track).str(), std::nullopt);
    }
}

void GatewayBridge::route(bridge::AudioFrameMessage& msg) {
    auto it = streams_.find(msg.track.str());
    if (it == streams_.end() || !it->second->push(std::move(msg.frame))) {
        ++dropped_frames_;
    }
}

void GatewayBridge::end_track(const std::string& key, const std::optional<std::string>& error) {
    auto it = streams_.find(key);
    if (it == streams_.end()) return;

    if (error) {
        it->second->fail(*error);
    } else {
        it->second->close();
    }
    streams_.erase(it);
}

void GatewayBridge::fail_all(const std::string& error) {
    for (auto& [key, stream] : streams_) {
        stream->fail(error);
    }
    streams_.clear();
}

Participant* GatewayBridge::find_participant(const std::string& sid) {
    auto it = std::ranges::find_if(participants_, [&](const Participant& p) { return p.sid == sid; });
    return it != participants_.end() ? &*it : nullptr;
}

void GatewayBridge::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[room-transcriber] {}", msg);
    }
}
