#include "platform/linux/unix_socket_server.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <print>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketServer::UnixSocketServer() = default;

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::start(const std::string& endpoint) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.empty() || endpoint.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "status: bad socket path '{}'", endpoint);
        return false;
    }
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    // Remove a stale socket, but never some other file that happens to
    // sit at the configured path.
    struct stat st{};
    if (::lstat(endpoint.c_str(), &st) == 0) {
        if (!S_ISSOCK(st.st_mode)) {
            std::println(stderr, "status: {} exists and is not a socket", endpoint);
            return false;
        }
        ::unlink(endpoint.c_str());
    }

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        std::println(stderr, "status: socket() failed: {}", std::strerror(errno));
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "status: bind() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (::listen(server_fd_, 4) < 0) {
        std::println(stderr, "status: listen() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        ::unlink(endpoint.c_str());
        return false;
    }

    socket_path_ = endpoint;
    return true;
}

void UnixSocketServer::stop() {
    for (auto& c : clients_) {
        ::close(c.fd);
    }
    clients_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;
    clients_.push_back({fd, {}});
    return fd;
}

bool UnixSocketServer::read_commands(int client_fd, std::vector<nlohmann::json>& cmds) {
    auto* client = find_client(client_fd);
    if (!client) return false;

    char buf[4096];
    ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
    if (n < 0) return errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR;
    if (n == 0) return false;

    client->buf.append(buf, static_cast<size_t>(n));

    size_t pos;
    while ((pos = client->buf.find('\n')) != std::string::npos) {
        std::string line = client->buf.substr(0, pos);
        client->buf.erase(0, pos + 1);
        if (line.empty()) continue;

        try {
            cmds.push_back(nlohmann::json::parse(line));
        } catch (const nlohmann::json::exception&) {
            cmds.push_back({{"cmd", ""}, {"error", "malformed command"}});
        }
    }

    // A client that never sends a newline does not get to grow the buffer forever.
    return client->buf.size() <= MAX_LINE;
}

bool UnixSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    std::string msg = response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
    ssize_t sent = ::send(client_fd, msg.data(), msg.size(), MSG_NOSIGNAL);
    return sent == static_cast<ssize_t>(msg.size());
}

void UnixSocketServer::close_client(int client_fd) {
    ::close(client_fd);
    std::erase_if(clients_, [client_fd](const ClientBuffer& c) { return c.fd == client_fd; });
}

UnixSocketServer::ClientBuffer* UnixSocketServer::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const ClientBuffer& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}
