#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <atomic>
#include <cctype>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace chathub {

// Event logger for the chat server. Remote addresses are blinded with a rotating
// salted hash so log files never carry raw client IPs.
class Logger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARNING,
        ERROR
    };

    enum class EventType {
        CONNECTION_OPENED,
        CONNECTION_CLOSED,
        CONNECTION_REJECTED,
        RATE_LIMIT_HIT,
        INVALID_INPUT,
        DELIVERY_FAILED,
        AI_REQUEST,
        AI_FAILURE,
        LIFECYCLE
    };

    /**
     * Records an event if its level passes the configured threshold.
     * @param level Severity level of the event.
     * @param event The kind of event.
     * @param remote_addr Source address (blinded before logging), or "internal".
     * @param message Optional descriptive message (sanitized).
     */
    static void log(Level level, EventType event, const std::string& remote_addr,
                    const std::string& message = "") {
        if (!enabled(level)) return;

        std::string line = format(level, event, remote_addr, message);

        std::lock_guard<std::mutex> lock(output_mutex());
        if (level == Level::ERROR) {
            std::cerr << line << "\n";
        } else {
            std::cout << line << "\n";
        }
    }

    static void set_level(Level level) { threshold().store(static_cast<int>(level)); }

    static bool enabled(Level level) {
        return static_cast<int>(level) >= threshold().load(std::memory_order_relaxed);
    }

    // Maps "debug", "info", "warn"/"warning", "error" (any case). Unknown names map to WARNING.
    static Level parse_level(const std::string& name) {
        std::string lower;
        for (char c : name) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (lower == "debug" || lower == "trace") return Level::DEBUG;
        if (lower == "info") return Level::INFO;
        if (lower == "error") return Level::ERROR;
        return Level::WARNING;
    }

    static std::string format(Level level, EventType event, const std::string& remote_addr,
                              const std::string& message) {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] "
           << "ip=" << blind_address(remote_addr);

        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }
        return ss.str();
    }

    // Escapes quotes, backslashes and line breaks and drops non-printable bytes.
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

    // Salt is regenerated every 6 hours so old log lines cannot be joined with new ones.
    static std::string blind_address(const std::string& remote_addr) {
        if (remote_addr.empty() || remote_addr == "unknown" || remote_addr == "internal") {
            return remote_addr.empty() ? "unknown" : remote_addr;
        }

        std::string salt;
        {
            static std::mutex salt_mutex;
            static std::string log_salt;
            static std::chrono::steady_clock::time_point last_rotation;

            std::lock_guard<std::mutex> lock(salt_mutex);
            auto now_steady = std::chrono::steady_clock::now();
            if (log_salt.empty() ||
                std::chrono::duration_cast<std::chrono::hours>(now_steady - last_rotation).count() >= 6) {
                unsigned char b[32];
                if (RAND_bytes(b, sizeof(b)) != 1) {
                    return "anon_unavailable";
                }
                std::stringstream salt_ss;
                for (int i = 0; i < 32; i++) salt_ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
                log_salt = salt_ss.str();
                last_rotation = now_steady;
            }
            salt = log_salt;
        }

        std::string data = remote_addr + salt;
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

        std::stringstream hs;
        for (int i = 0; i < 6; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        return "anon_" + hs.str();
    }

private:
    static std::atomic<int>& threshold() {
        static std::atomic<int> level{static_cast<int>(Level::WARNING)};
        return level;
    }

    static std::mutex& output_mutex() {
        static std::mutex m;
        return m;
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::CONNECTION_OPENED: return "CONN_OPEN";
            case EventType::CONNECTION_CLOSED: return "CONN_CLOSE";
            case EventType::CONNECTION_REJECTED: return "CONN_REJECTED";
            case EventType::RATE_LIMIT_HIT: return "RATE_LIMIT";
            case EventType::INVALID_INPUT: return "INVALID_INPUT";
            case EventType::DELIVERY_FAILED: return "DELIVERY_FAILED";
            case EventType::AI_REQUEST: return "AI_REQUEST";
            case EventType::AI_FAILURE: return "AI_FAILURE";
            case EventType::LIFECYCLE: return "LIFECYCLE";
            default: return "UNKNOWN_EVENT";
        }
    }
};

}
