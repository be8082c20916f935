#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <expected>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

// Thread-safe FIFO between one producer side and one consumer.
// The producer ends the sequence with close() or fail(); the consumer sees
// every value pushed before that, then the end marker or the error.
// A finished channel never reopens.
template <typename T>
class Channel {
public:
    using Item = std::expected<std::optional<T>, std::string>;

    Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Returns false if the channel was already closed or failed.
    bool push(T value) {
        {
            std::lock_guard lock(mutex_);
            if (finished_) return false;
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            if (finished_) return;
            finished_ = true;
        }
        cv_.notify_all();
    }

    // Values already queued are still delivered before the error.
    void fail(std::string error) {
        {
            std::lock_guard lock(mutex_);
            if (finished_) return;
            finished_ = true;
            error_ = std::move(error);
        }
        cv_.notify_all();
    }

    // Blocks until a value, the end of the sequence, or an error.
    Item next() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || finished_; });
        return take_locked();
    }

    // Same as next(), but a stop request ends the wait with nullopt.
    Item next(std::stop_token stoken) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait(lock, stoken, [this] { return !queue_.empty() || finished_; })) {
            return std::nullopt;
        }
        return take_locked();
    }

    bool finished() const {
        std::lock_guard lock(mutex_);
        return finished_;
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

private:
    Item take_locked() {
        if (!queue_.empty()) {
            T value = std::move(queue_.front());
            queue_.pop_front();
            return std::optional<T>(std::move(value));
        }
        if (error_) return std::unexpected(*error_);
        return std::nullopt;
    }

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<T> queue_;
    bool finished_ = false;
    std::optional<std::string> error_;
};
