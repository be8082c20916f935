#include <catch2/catch_test_macros.hpp>

#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <optional>
#include <string>

namespace {

// Sets (or clears) an environment variable and restores it afterwards.
struct ScopedEnv {
    std::string name;
    std::optional<std::string> saved;

    ScopedEnv(std::string n, const char* value) : name(std::move(n)) {
        if (const char* old = std::getenv(name.c_str())) saved = old;
        if (value) ::setenv(name.c_str(), value, 1);
        else ::unsetenv(name.c_str());
    }
    ~ScopedEnv() {
        if (saved) ::setenv(name.c_str(), saved->c_str(), 1);
        else ::unsetenv(name.c_str());
    }
};

} // namespace

TEST_CASE("Platform paths", "[platform]") {
    ScopedEnv home("HOME", "/home/tester");

    SECTION("XdgDirsWin") {
        ScopedEnv config("XDG_CONFIG_HOME", "/xdg/config");
        ScopedEnv data("XDG_DATA_HOME", "/xdg/data");
        REQUIRE(platform::config_dir() == "/xdg/config/room-transcriber");
        REQUIRE(platform::data_dir() == "/xdg/data/room-transcriber");
    }

    SECTION("HomeFallback") {
        ScopedEnv config("XDG_CONFIG_HOME", nullptr);
        ScopedEnv data("XDG_DATA_HOME", nullptr);
        REQUIRE(platform::config_dir() == "/home/tester/.config/room-transcriber");
        REQUIRE(platform::data_dir() == "/home/tester/.local/share/room-transcriber");
    }

    SECTION("RelativeOrEmptyXdgIsIgnored") {
        ScopedEnv config("XDG_CONFIG_HOME", "relative/config");
        ScopedEnv data("XDG_DATA_HOME", "");
        REQUIRE(platform::config_dir() == "/home/tester/.config/room-transcriber");
        REQUIRE(platform::data_dir() == "/home/tester/.local/share/room-transcriber");
    }

    SECTION("NoHomeNoXdg") {
        ScopedEnv config("XDG_CONFIG_HOME", nullptr);
        ScopedEnv no_home("HOME", nullptr);
        REQUIRE(platform::config_dir().empty());
    }

    SECTION("SocketEndpoints") {
        {
            ScopedEnv runtime("XDG_RUNTIME_DIR", "/run/user/1000");
            REQUIRE(platform::bridge_endpoint() == "/run/user/1000/room-gateway.sock");
            REQUIRE(platform::status_endpoint() == "/run/user/1000/room-transcriber.sock");
        }
        ScopedEnv runtime("XDG_RUNTIME_DIR", "");
        REQUIRE(platform::bridge_endpoint() == "/tmp/room-gateway.sock");
        REQUIRE(platform::status_endpoint() == "/tmp/room-transcriber.sock");
    }
}
