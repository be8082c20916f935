#include "transcript_store.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Room names come from the remote side; keep them to one path component.
std::string sanitize(const std::string& room) {
    std::string out;
    out.reserve(room.size());
    for (unsigned char c : room) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('_');
        }
    }
    if (out.empty() || out == "." || out == "..") out = "room";
    return out;
}

bool is_date(const std::string& s) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return false;
    for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

std::string record_date(const TranscriptRecord& record) {
    auto date = record.timestamp.substr(0, 10);
    if (is_date(date)) return date;
    return iso_timestamp_now().substr(0, 10);
}

// A missing file is an empty day. One that exists but cannot be read is
// an error, so an append never replaces it with a single record.
std::expected<json, std::string> read_array(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) return std::unexpected("cannot stat " + path + ": " + ec.message());
        return json::array();
    }

    std::ifstream f(path);
    if (!f.is_open()) return std::unexpected("cannot read " + path);

    try {
        auto j = json::parse(f);
        if (j.is_array()) return j;
        std::println(stderr, "store: {} is not a JSON array, starting over", path);
    } catch (const json::exception& e) {
        std::println(stderr, "store: {} is corrupt ({}), starting over", path, e.what());
    }
    return json::array();
}

} // namespace

TranscriptStore::TranscriptStore(std::string dir) : dir_(std::move(dir)) {}

std::string TranscriptStore::path_for(const std::string& room, const std::string& date) const {
    return (fs::path(dir_) / (sanitize(room) + "_" + date + ".json")).string();
}

std::mutex& TranscriptStore::lock_for(const std::string& path) {
    std::lock_guard lock(locks_mutex_);
    auto& m = file_locks_[path];
    if (!m) m = std::make_unique<std::mutex>();
    return *m;
}

std::expected<void, std::string> TranscriptStore::append(const TranscriptRecord& record) {
    if (!has_text(record.text)) {
        return std::unexpected("empty transcript");
    }

    auto path = path_for(record.room, record_date(record));
    std::lock_guard file_lock(lock_for(path));

    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        return std::unexpected("cannot create " + dir_ + ": " + ec.message());
    }

    auto existing = read_array(path);
    if (!existing) return std::unexpected(existing.error());
    auto records = std::move(*existing);
    records.push_back(record.to_json());

    auto tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            return std::unexpected("cannot write " + tmp_path);
        }
        out << records.dump(2, ' ', false, json::error_handler_t::replace) << '\n';
        if (!out.good()) {
            return std::unexpected("write failed: " + tmp_path);
        }
    }

    fs::rename(tmp_path, path, ec);
    if (ec) {
        auto err = "cannot replace " + path + ": " + ec.message();
        fs::remove(tmp_path, ec);
        return std::unexpected(err);
    }
    return {};
}

std::vector<TranscriptRecord> TranscriptStore::load(const std::string& room,
                                                    const std::string& date) const {
    std::vector<TranscriptRecord> out;
    auto records = read_array(path_for(room, date));
    if (!records) {
        std::println(stderr, "store: {}", records.error());
        return out;
    }
    for (auto& j : *records) {
        if (auto rec = TranscriptRecord::from_json(j)) {
            out.push_back(std::move(*rec));
        }
    }
    return out;
}
