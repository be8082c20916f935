#pragma once

#include "../messages.hpp"

#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Append-only log of final transcripts: one JSON array file per room per day,
// <dir>/<room>_<YYYY-MM-DD>.json.
class TranscriptStore {
public:
    explicit TranscriptStore(std::string dir);

    TranscriptStore(const TranscriptStore&) = delete;
    TranscriptStore& operator=(const TranscriptStore&) = delete;

    // Read-modify-write of the day file. Concurrent appends to the same file
    // are serialized; a corrupt file is replaced by a fresh array.
    std::expected<void, std::string> append(const TranscriptRecord& record);

    // date is YYYY-MM-DD. Missing or corrupt files yield an empty list.
    std::vector<TranscriptRecord> load(const std::string& room, const std::string& date) const;

    std::string path_for(const std::string& room, const std::string& date) const;

    const std::string& dir() const { return dir_; }

private:
    std::mutex& lock_for(const std::string& path);

    std::string dir_;

    std::mutex locks_mutex_;
    std::map<std::string, std::unique_ptr<std::mutex>> file_locks_;
};
