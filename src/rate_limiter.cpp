#include "rate_limiter.hpp"
#include <algorithm>

namespace chathub {

RateLimitResult SlidingWindow::check(int limit, Clock::time_point now, Clock::duration window) {
    while (!stamps_.empty() && now - stamps_.front() >= window) {
        stamps_.pop_front();
    }

    auto count = static_cast<long long>(stamps_.size());
    if (count >= limit) {
        auto window_sec = std::chrono::duration_cast<std::chrono::seconds>(window);
        if (stamps_.empty()) {
            return RateLimitResult{false, 0, limit, std::max<long long>(1, window_sec.count())};
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - stamps_.front());
        long long wait = std::max<long long>(1, (window_sec - elapsed).count());
        return RateLimitResult{false, count, limit, wait};
    }

    stamps_.push_back(now);
    return RateLimitResult{true, count + 1, limit, 0};
}

RateLimiter::RateLimiter(int limit, std::chrono::seconds window)
    : limit_(limit), window_(window)
{}

RateLimitResult RateLimiter::check(const std::string& key) {
    return check(key, Clock::now());
}

// One lock for the map; held only for the bookkeeping, never across I/O.
RateLimitResult RateLimiter::check(const std::string& key, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return windows_[key].check(limit_, now, window_);
}

size_t RateLimiter::tracked_keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return windows_.size();
}

}
