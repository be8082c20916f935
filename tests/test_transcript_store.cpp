#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "storage/transcript_store.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <thread>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;

namespace {

TranscriptRecord record(const std::string& text, const std::string& room = "standup") {
    return {
        .timestamp = "2025-03-01T14:05:09.123456",
        .participant = "alice",
        .text = text,
        .room = room,
    };
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream f(path);
    f << content;
}

} // namespace

TEST_CASE("Transcript store", "[store]") {
    TmpDir dir;
    TranscriptStore store(dir.path);

    SECTION("PathPerRoomAndDay") {
        REQUIRE(store.path_for("standup", "2025-03-01") ==
                (std::filesystem::path(dir.path) / "standup_2025-03-01.json").string());
    }

    SECTION("RoomNameStaysInsideDirectory") {
        auto path = std::filesystem::path(store.path_for("../etc/passwd", "2025-03-01"));
        REQUIRE(path.parent_path() == std::filesystem::path(dir.path));
        REQUIRE(path.filename() == ".._etc_passwd_2025-03-01.json");

        REQUIRE(std::filesystem::path(store.path_for("", "2025-03-01")).filename() ==
                "room_2025-03-01.json");
    }

    SECTION("AppendCreatesDirectoryAndFile") {
        TranscriptStore nested((std::filesystem::path(dir.path) / "a" / "b").string());
        REQUIRE(nested.append(record("hello")));
        REQUIRE(std::filesystem::exists(nested.path_for("standup", "2025-03-01")));
    }

    SECTION("AppendsInOrder") {
        REQUIRE(store.append(record("one")));
        REQUIRE(store.append(record("two")));

        auto records = store.load("standup", "2025-03-01");
        REQUIRE(records.size() == 2);
        REQUIRE(records[0].text == "one");
        REQUIRE(records[1].text == "two");
        REQUIRE(records[1].participant == "alice");
        REQUIRE(records[1].room == "standup");
    }

    SECTION("FileIsIndentedJsonArray") {
        REQUIRE(store.append(record("hello")));

        std::ifstream f(store.path_for("standup", "2025-03-01"));
        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        REQUIRE(content.starts_with("[\n  {\n"));

        auto j = json::parse(content);
        REQUIRE(j.is_array());
        REQUIRE(j[0]["text"] == "hello");
        REQUIRE(j[0]["timestamp"] == "2025-03-01T14:05:09.123456");
    }

    SECTION("BlankTextIsRejected") {
        REQUIRE_FALSE(store.append(record("   ")));
        REQUIRE_FALSE(std::filesystem::exists(store.path_for("standup", "2025-03-01")));
    }

    SECTION("RoomsAndDaysAreSeparate") {
        auto later = record("next day");
        later.timestamp = "2025-03-02T00:00:01.000000";
        REQUIRE(store.append(record("a")));
        REQUIRE(store.append(record("b", "retro")));
        REQUIRE(store.append(later));

        REQUIRE(store.load("standup", "2025-03-01").size() == 1);
        REQUIRE(store.load("retro", "2025-03-01").size() == 1);
        REQUIRE(store.load("standup", "2025-03-02").size() == 1);
    }

    SECTION("CorruptFileStartsOver") {
        write_file(store.path_for("standup", "2025-03-01"), "[{\"text\": oops");

        REQUIRE(store.load("standup", "2025-03-01").empty());
        REQUIRE(store.append(record("fresh")));

        auto records = store.load("standup", "2025-03-01");
        REQUIRE(records.size() == 1);
        REQUIRE(records[0].text == "fresh");
    }

    SECTION("NonArrayFileStartsOver") {
        write_file(store.path_for("standup", "2025-03-01"), "{\"text\": \"x\"}");
        REQUIRE(store.append(record("fresh")));
        REQUIRE(store.load("standup", "2025-03-01").size() == 1);
    }

    SECTION("UnreadableFileIsNotReplaced") {
        if (geteuid() == 0) SKIP("file permissions do not apply to root");

        REQUIRE(store.append(record("first")));
        REQUIRE(store.append(record("second")));
        auto path = store.path_for("standup", "2025-03-01");

        std::filesystem::permissions(path, std::filesystem::perms::none);
        auto result = store.append(record("third"));
        REQUIRE(store.load("standup", "2025-03-01").empty());
        std::filesystem::permissions(path, std::filesystem::perms::owner_read |
                                               std::filesystem::perms::owner_write);

        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error() == "cannot read " + path);

        auto records = store.load("standup", "2025-03-01");
        REQUIRE(records.size() == 2);
        REQUIRE(records[1].text == "second");
    }

    SECTION("MissingFileLoadsEmpty") {
        REQUIRE(store.load("nobody", "2025-01-01").empty());
    }

    SECTION("ConcurrentAppendsAreAllKept") {
        constexpr int THREADS = 8;
        constexpr int PER_THREAD = 10;

        std::vector<std::thread> threads;
        for (int t = 0; t < THREADS; t++) {
            threads.emplace_back([&, t] {
                for (int i = 0; i < PER_THREAD; i++) {
                    (void)store.append(record("t" + std::to_string(t) + "-" + std::to_string(i)));
                }
            });
        }
        for (auto& th : threads) th.join();

        REQUIRE(store.load("standup", "2025-03-01").size() == THREADS * PER_THREAD);
    }
}
