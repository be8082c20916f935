#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

namespace {

std::string transcript_dir(const Config::Storage& storage) {
    if (!storage.transcript_dir.empty()) return storage.transcript_dir;
    auto data = platform::data_dir();
    if (data.empty()) return "transcripts";
    return (std::filesystem::path(data) / "transcripts").string();
}

LanSpeechEngine::Options engine_options(const Config::Speech& s) {
    return LanSpeechEngine::Options{
        .url = s.url,
        .api_format = s.api_format,
        .language = s.language,
        .timeout_s = s.timeout_s,
        .segmenter = {
            .silence_threshold = s.silence_threshold,
            .silence_ms = s.silence_ms,
            .interim_interval_ms = s.interim_interval_ms,
            .max_utterance_ms = s.max_utterance_s * 1000,
            .min_speech_ms = s.min_speech_ms,
        },
    };
}

} // namespace

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      bridge_(verbose_),
      engine_(engine_options(config_.speech)),
      store_(transcript_dir(config_.storage)),
      heartbeat_(registry_, bridge_, verbose_),
      core_(bridge_, engine_, store_, registry_, verbose_) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (timer_fd_ >= 0) ::close(timer_fd_);
}

bool LinuxEventLoop::init() {
    // Without the room there is nothing to do.
    auto bridge_path = config_.room.bridge.empty() ? platform::bridge_endpoint() : config_.room.bridge;
    log("Connecting to room gateway at " + bridge_path);
    if (!bridge_.connect(bridge_path, config_.room.connect_timeout_ms)) return false;

    // Status socket (optional)
    auto status_path = config_.status.socket.empty() ? platform::status_endpoint() : config_.status.socket;
    if (status_server_.start(status_path)) {
        log("Status socket listening on " + status_path);
    } else {
        std::println(stderr, "Warning: status socket unavailable, continuing without it");
    }

    log("Saving transcripts to " + store_.dir());

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Heartbeat timer
    timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }
    itimerspec spec{};
    spec.it_interval.tv_sec = config_.heartbeat.interval_s;
    spec.it_value.tv_sec = config_.heartbeat.interval_s;
    if (timerfd_settime(timer_fd_, 0, &spec, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(timer_fd_, EPOLLIN) ||
        !add_fd(bridge_.fd(), EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }
    if (status_server_.server_fd() >= 0) {
        add_fd(status_server_.server_fd(), EPOLLIN);
    }

    running_.store(true, std::memory_order_release);

    // Pick up everyone already in the room, then anything that arrived
    // right behind the greeting.
    core_.start();
    on_bridge_readable();
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n && running_.load(std::memory_order_relaxed); i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                ::read(signal_fd_, &info, sizeof(info));
                log("Received signal, shutting down");
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == timer_fd_) {
                uint64_t expirations;
                ::read(timer_fd_, &expirations, sizeof(expirations));
                heartbeat_.tick();
                core_.reap_finished();
                continue;
            }

            if (fd == bridge_.fd()) {
                on_bridge_readable();
                continue;
            }

            if (fd == status_server_.server_fd()) {
                int client_fd = status_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev);
                }
                continue;
            }

            on_status_client(fd);
        }
    }

    core_.shutdown();
    status_server_.stop();
    bridge_.close();
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::on_bridge_readable() {
    std::vector<RoomEvent> room_events;
    bool alive = bridge_.read_events(room_events);

    for (auto& event : room_events) {
        core_.handle_event(event);
    }

    if (!alive) {
        std::println(stderr, "Lost connection to the room gateway, shutting down");
        running_.store(false, std::memory_order_release);
    }
}

void LinuxEventLoop::on_status_client(int fd) {
    std::vector<nlohmann::json> cmds;
    bool alive = status_server_.read_commands(fd, cmds);

    for (auto& cmd : cmds) {
        std::string cmd_str = cmd.value("cmd", "");
        status_server_.send_response(fd, core_.handle_command(cmd_str, cmd));
    }

    if (!alive) {
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
        status_server_.close_client(fd);
    }
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[room-transcriber] {}", msg);
    }
}
