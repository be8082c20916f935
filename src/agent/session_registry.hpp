#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Composite key of one remote track: participant sid + track sid.
struct TrackId {
    std::string participant_sid;
    std::string track_sid;

    std::string str() const { return participant_sid + "_" + track_sid; }

    bool operator==(const TrackId&) const = default;
};

// Set of track ids that currently have a transcription session.
// All operations are safe to call from any thread.
//
// Each successful acquire hands out a lease. A session releases with its
// lease, so it cannot free an id that was re-acquired after a forced
// release.
class SessionRegistry {
public:
    using Lease = uint64_t;

    SessionRegistry() = default;

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Marks the id as held. Returns nullopt if it already was.
    std::optional<Lease> try_acquire(const std::string& id);

    // Unconditional. Releasing an id that is not held is a no-op.
    void release(const std::string& id);

    // Releases the id only while it is still held under this lease.
    // Returns false if the id was released or re-acquired in between.
    bool release(const std::string& id, Lease lease);

    bool contains(const std::string& id) const;
    size_t size() const;

    // Sorted copy of the held ids.
    std::vector<std::string> snapshot() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Lease> ids_;
    Lease next_lease_ = 1;
};
