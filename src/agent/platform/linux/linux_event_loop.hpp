#pragma once

#include "agent_core.hpp"
#include "config.hpp"
#include "heartbeat.hpp"
#include "platform/linux/gateway_bridge.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "session_registry.hpp"
#include "speech/lan_speech_engine.hpp"
#include "storage/transcript_store.hpp"

#include <atomic>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void on_bridge_readable();
    void on_status_client(int fd);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    SessionRegistry registry_;
    GatewayBridge bridge_;
    LanSpeechEngine engine_;
    TranscriptStore store_;
    UnixSocketServer status_server_;
    Heartbeat heartbeat_;

    // Last: its sessions use everything above and are joined first.
    AgentCore core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int timer_fd_ = -1;

    std::atomic<bool> running_{false};
};
