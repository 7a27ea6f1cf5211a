#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <atomic>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace probe {

// Process-wide line logger. Peer addresses are blinded (salted hash) before they are written.
class Logger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    // Sets the minimum level that is written.
    static void set_level(Level level) {
        threshold().store(static_cast<int>(level), std::memory_order_relaxed);
    }

    static Level level() {
        return static_cast<Level>(threshold().load(std::memory_order_relaxed));
    }

    static bool enabled(Level level) {
        return static_cast<int>(level) >= threshold().load(std::memory_order_relaxed);
    }

    /**
     * Maps a level name (DEBUG, INFO, WARNING/WARN, ERROR, CRITICAL/FATAL) to a Level.
     * Matching is case-insensitive.
     * @return false if the name is unknown; out is left untouched.
     */
    static bool parse_level(const std::string& name, Level& out) {
        std::string upper(name);
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

        if (upper == "DEBUG") { out = Level::DEBUG; return true; }
        if (upper == "INFO") { out = Level::INFO; return true; }
        if (upper == "WARNING" || upper == "WARN") { out = Level::WARNING; return true; }
        if (upper == "ERROR") { out = Level::ERROR; return true; }
        if (upper == "CRITICAL" || upper == "FATAL") { out = Level::CRITICAL; return true; }
        return false;
    }

    /**
     * Writes one log line if the level passes the threshold.
     * @param level Severity level of the event.
     * @param component Subsystem emitting the line (e.g. "http", "server").
     * @param message Descriptive message (will be sanitized).
     * @param remote_addr Peer address (will be blinded). Empty for internal events.
     */
    static void log(Level level, const std::string& component, const std::string& message,
                    const std::string& remote_addr = "") {
        if (!enabled(level)) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << component << "]";

        std::lock_guard<std::mutex> lock(output_mutex());

        if (!remote_addr.empty()) {
            ss << " ip=" << blind_address(remote_addr);
        }
        ss << " msg=\"" << sanitize_log_message(message) << "\"";

        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << ss.str() << "\n";
        } else {
            std::cout << ss.str() << "\n";
        }
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    // Replaces quotes, backslashes and line breaks, drops other non-printables.
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

private:
    static std::atomic<int>& threshold() {
        static std::atomic<int> value{static_cast<int>(Level::INFO)};
        return value;
    }

    static std::mutex& output_mutex() {
        static std::mutex mutex;
        return mutex;
    }

    // Caller holds output_mutex().
    // The blinding salt is random and rotated every 6 hours, so old log lines
    // cannot be linked to an address once the salt is gone.
    static std::string blind_address(const std::string& remote_addr) {
        static std::string log_salt;
        static std::chrono::steady_clock::time_point last_rotation;

        if (remote_addr == "unknown") {
            return remote_addr;
        }

        auto now_steady = std::chrono::steady_clock::now();
        if (log_salt.empty() ||
            std::chrono::duration_cast<std::chrono::hours>(now_steady - last_rotation).count() >= 6) {
            unsigned char b[32];
            if (RAND_bytes(b, sizeof(b)) != 1) {
                return "redacted";
            }
            std::stringstream salt_ss;
            for (int i = 0; i < 32; i++) {
                salt_ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b[i]);
            }
            log_salt = salt_ss.str();
            last_rotation = now_steady;
        }

        std::string data = remote_addr + log_salt;
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

        std::stringstream hs;
        for (int i = 0; i < 6; i++) {
            hs << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
        }
        return "anon_" + hs.str();
    }
};

} // namespace probe
