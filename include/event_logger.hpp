#pragma once

#include <string>
#include <iostream>
#include <cctype>
#include <chrono>
#include <ctime>
#include <exception>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace passgen {

// Structured service log. Peer addresses are blinded with a rotating salted hash.
// Phrases and derived passwords must never be passed in `message`.
class EventLogger {
public:
    enum class Level {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class EventType {
        REQUEST,
        INVALID_INPUT,
        INTERNAL_ERROR,
        CONNECTION_REJECTED,
        LIFECYCLE
    };

    /**
     * Records an event with a blinded peer identifier.
     * @param level Severity level of the event.
     * @param event The event category.
     * @param remote_addr The source IP address (blinded before logging), or "internal"/"unknown".
     * @param message Optional descriptive message (sanitized).
     */
    static void log(Level level, EventType event, const std::string& remote_addr,
                    const std::string& message = "") {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] "
           << "ip=" << blind_address(remote_addr, gmt);

        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }

        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << ss.str() << "\n";
        } else {
            std::cout << ss.str() << "\n";
        }
    }

    // Escapes quotes and line breaks and drops non-printable bytes.
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

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::REQUEST: return "REQUEST";
            case EventType::INVALID_INPUT: return "INVALID_INPUT";
            case EventType::INTERNAL_ERROR: return "INTERNAL_ERROR";
            case EventType::CONNECTION_REJECTED: return "CONN_REJECTED";
            case EventType::LIFECYCLE: return "LIFECYCLE";
            default: return "UNKNOWN_EVENT";
        }
    }

private:
    // Salt is regenerated every 6 hours so old log lines cannot be re-linked to addresses.
    static std::string blind_address(const std::string& remote_addr, const struct tm& gmt) {
        if (remote_addr == "unknown" || remote_addr == "internal") {
            return remote_addr;
        }

        static std::mutex salt_mutex;
        static std::string log_salt;
        static std::chrono::steady_clock::time_point last_rotation;

        std::string salt;
        {
            std::lock_guard<std::mutex> lock(salt_mutex);
            auto now_steady = std::chrono::steady_clock::now();
            if (log_salt.empty() ||
                std::chrono::duration_cast<std::chrono::hours>(now_steady - last_rotation).count() >= 6) {
                unsigned char b[32];
                if (RAND_bytes(b, sizeof(b)) != 1) {
                    std::cerr << "[CRITICAL] CSPRNG failure in EventLogger. Terminating instance for safety.\n";
                    std::terminate();
                }
                std::stringstream salt_ss;
                for (int i = 0; i < 32; i++) salt_ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
                log_salt = salt_ss.str();
                last_rotation = now_steady;

                std::cout << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S")
                          << " UTC] [INFO] [LIFECYCLE] msg=\"IP blinding salt rotated\"\n";
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
};

}
