#include "server_stats.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace chathub {

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

void ServerStats::record_connection(uint64_t current_users) {
    connections_total_.fetch_add(1, std::memory_order_relaxed);

    uint64_t peak = peak_users_.load(std::memory_order_relaxed);
    while (current_users > peak &&
           !peak_users_.compare_exchange_weak(peak, current_users, std::memory_order_relaxed)) {
    }
}

uint64_t ServerStats::uptime_seconds() const {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(Clock::now() - started_at_).count());
}

double ServerStats::messages_per_second() const {
    uint64_t uptime = uptime_seconds();
    if (uptime == 0) return 0.0;
    return round2(static_cast<double>(messages_sent()) / static_cast<double>(uptime));
}

double ServerStats::memory_mb() {
    // statm: size resident shared text lib data dt (in pages)
    std::ifstream statm("/proc/self/statm");
    unsigned long long size_pages = 0;
    unsigned long long resident_pages = 0;
    if (!(statm >> size_pages >> resident_pages)) {
        return 0.0;
    }

    long page_size = sysconf(_SC_PAGESIZE);
    if (page_size <= 0) return 0.0;

    double bytes = static_cast<double>(resident_pages) * static_cast<double>(page_size);
    return round2(bytes / 1024.0 / 1024.0);
}

std::string ServerStats::collect_prometheus(uint64_t active_users) const {
    std::stringstream ss;

    ss << "# TYPE chathub_messages_sent_total counter\n";
    ss << "chathub_messages_sent_total " << messages_sent() << "\n";
    ss << "# TYPE chathub_connections_total counter\n";
    ss << "chathub_connections_total " << connections_total() << "\n";
    ss << "# TYPE chathub_peak_users gauge\n";
    ss << "chathub_peak_users " << peak_users() << "\n";
    ss << "# TYPE chathub_active_users gauge\n";
    ss << "chathub_active_users " << active_users << "\n";
    ss << "# TYPE chathub_uptime_seconds gauge\n";
    ss << "chathub_uptime_seconds " << uptime_seconds() << "\n";

    return ss.str();
}

}
