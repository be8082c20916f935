#include "session_registry.hpp"

#include <algorithm>

std::optional<SessionRegistry::Lease> SessionRegistry::try_acquire(const std::string& id) {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = ids_.try_emplace(id, next_lease_);
    if (!inserted) return std::nullopt;
    return next_lease_++;
}

void SessionRegistry::release(const std::string& id) {
    std::lock_guard lock(mutex_);
    ids_.erase(id);
}

bool SessionRegistry::release(const std::string& id, Lease lease) {
    std::lock_guard lock(mutex_);
    auto it = ids_.find(id);
    if (it == ids_.end() || it->second != lease) return false;
    ids_.erase(it);
    return true;
}

bool SessionRegistry::contains(const std::string& id) const {
    std::lock_guard lock(mutex_);
    return ids_.contains(id);
}

size_t SessionRegistry::size() const {
    std::lock_guard lock(mutex_);
    return ids_.size();
}

std::vector<std::string> SessionRegistry::snapshot() const {
    std::vector<std::string> out;
    {
        std::lock_guard lock(mutex_);
        out.reserve(ids_.size());
        for (auto& [id, lease] : ids_) out.push_back(id);
    }
    std::ranges::sort(out);
    return out;
}
