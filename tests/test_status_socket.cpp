#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_server.hpp"

#include <cstring>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;

namespace {

std::string tmp_socket_path() {
    return "/tmp/rt_test_status_" + std::to_string(getpid()) + ".sock";
}

int connect_to(const std::string& path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

void send_str(int fd, const std::string& s) {
    ::send(fd, s.data(), s.size(), MSG_NOSIGNAL);
}

std::string read_line(int fd) {
    std::string line;
    char c;
    while (::recv(fd, &c, 1, 0) == 1 && c != '\n') line.push_back(c);
    return line;
}

} // namespace

TEST_CASE("Status socket", "[status]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(std::filesystem::exists(sock_path));
        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("StaleSocketIsReplaced") {
        // A socket file left behind by a process that died without cleanup.
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, sock_path.c_str(), sizeof(addr.sun_path) - 1);
        int stale = ::socket(AF_UNIX, SOCK_STREAM, 0);
        REQUIRE(::bind(stale, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        ::close(stale);
        REQUIRE(std::filesystem::exists(sock_path));

        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        int client = connect_to(sock_path);
        REQUIRE(client >= 0);
        ::close(client);
        server.stop();
    }

    SECTION("RegularFileIsNotRemoved") {
        {
            std::ofstream f(sock_path);
            f << "keep me";
        }
        UnixSocketServer server;
        REQUIRE_FALSE(server.start(sock_path));
        REQUIRE(std::filesystem::is_regular_file(sock_path));
        std::filesystem::remove(sock_path);
    }

    SECTION("CommandRoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int client = connect_to(sock_path);
        REQUIRE(client >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        send_str(client, "{\"cmd\":\"status\"}\n{\"cmd\":\"sessions\"}\n");

        std::vector<json> cmds;
        REQUIRE(server.read_commands(client_fd, cmds));
        REQUIRE(cmds.size() == 2);
        REQUIRE(cmds[0]["cmd"] == "status");
        REQUIRE(cmds[1]["cmd"] == "sessions");

        REQUIRE(server.send_response(client_fd, {{"status", "healthy"}}));
        auto resp = json::parse(read_line(client));
        REQUIRE(resp["status"] == "healthy");

        ::close(client);
        server.close_client(client_fd);
    }

    SECTION("CommandSplitAcrossReads") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        int client = connect_to(sock_path);
        int client_fd = server.accept_client();

        std::vector<json> cmds;
        send_str(client, "{\"cmd\":\"sta");
        REQUIRE(server.read_commands(client_fd, cmds));
        REQUIRE(cmds.empty());

        send_str(client, "tus\"}\n");
        REQUIRE(server.read_commands(client_fd, cmds));
        REQUIRE(cmds.size() == 1);
        REQUIRE(cmds[0]["cmd"] == "status");

        ::close(client);
        server.close_client(client_fd);
    }

    SECTION("MalformedCommand") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        int client = connect_to(sock_path);
        int client_fd = server.accept_client();

        send_str(client, "garbage\n");
        std::vector<json> cmds;
        REQUIRE(server.read_commands(client_fd, cmds));
        REQUIRE(cmds.size() == 1);
        REQUIRE(cmds[0]["cmd"] == "");
        REQUIRE(cmds[0].contains("error"));

        ::close(client);
        server.close_client(client_fd);
    }

    SECTION("ClientHangupIsReported") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        int client = connect_to(sock_path);
        int client_fd = server.accept_client();

        ::close(client);
        std::vector<json> cmds;
        REQUIRE_FALSE(server.read_commands(client_fd, cmds));
        server.close_client(client_fd);
    }
}
