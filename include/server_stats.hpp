#pragma once

#include <string>
#include <atomic>
#include <chrono>
#include <cstdint>

namespace chathub {

// Process-lifetime counters for the chat server.
// Counters only ever increase; peak users is a running maximum.
class ServerStats {
public:
    using Clock = std::chrono::steady_clock;

    ServerStats() : started_at_(Clock::now()) {}

    ServerStats(const ServerStats&) = delete;
    ServerStats& operator=(const ServerStats&) = delete;

    void increment_messages() { messages_sent_.fetch_add(1, std::memory_order_relaxed); }

    // Counts an accepted connection and folds the current live count into the peak.
    void record_connection(uint64_t current_users);

    uint64_t messages_sent() const { return messages_sent_.load(std::memory_order_relaxed); }
    uint64_t connections_total() const { return connections_total_.load(std::memory_order_relaxed); }
    uint64_t peak_users() const { return peak_users_.load(std::memory_order_relaxed); }

    uint64_t uptime_seconds() const;

    // Messages per second over the whole uptime, rounded to two decimals. 0 during the first second.
    double messages_per_second() const;

    /**
     * Resident set size of this process in MiB, rounded to two decimals.
     * Sampled on demand from /proc; returns 0 where that is unavailable.
     */
    static double memory_mb();

    // Prometheus exposition format (text version 0.0.4).
    std::string collect_prometheus(uint64_t active_users) const;

private:
    Clock::time_point started_at_;
    std::atomic<uint64_t> messages_sent_{0};
    std::atomic<uint64_t> connections_total_{0};
    std::atomic<uint64_t> peak_users_{0};
};

// Rounds to two decimals for wire output.
double round2(double value);

}
