#pragma once

#include <string>
#include <deque>
#include <unordered_map>
#include <chrono>
#include <mutex>

namespace chathub {

struct RateLimitResult {
    bool allowed;
    long long current;          // events inside the window after this check
    long long limit;
    long long reset_after_sec;  // wait hint when rejected, 0 when allowed
};

// Sliding-window admission log for a single subject. Not synchronized; callers guard it.
class SlidingWindow {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * Evicts timestamps at least `window` old, then admits the event if fewer than
     * `limit` remain. A rejection reports the time until the oldest retained event
     * leaves the window, never less than one second.
     */
    RateLimitResult check(int limit, Clock::time_point now,
                          Clock::duration window = std::chrono::seconds(60));

    size_t size() const { return stamps_.size(); }

private:
    std::deque<Clock::time_point> stamps_;
};

// Keyed sliding-window limiter. Entries live for the lifetime of the limiter so a
// reconnecting user keeps their window.
class RateLimiter {
public:
    using Clock = SlidingWindow::Clock;

    explicit RateLimiter(int limit, std::chrono::seconds window = std::chrono::seconds(60));
    ~RateLimiter() = default;

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    RateLimitResult check(const std::string& key);
    RateLimitResult check(const std::string& key, Clock::time_point now);

    int limit() const { return limit_; }
    size_t tracked_keys() const;

private:
    int limit_;
    std::chrono::seconds window_;
    std::unordered_map<std::string, SlidingWindow> windows_;
    mutable std::mutex mutex_;
};

}
