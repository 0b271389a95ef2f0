#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <atomic>
#include <mutex>
#include <cctype>
#include <ctime>

namespace namesys {

// Logs name-system events as single-line records on stdout/stderr.
class EventLogger {
public:
    enum class Level {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };
    
    enum class EventType {
        RECORD_PUBLISHED,
        RECORD_ACCEPTED,
        RECORD_REJECTED,
        MALFORMED_MESSAGE,
        SUBSCRIBED,
        UNSUBSCRIBED,
        RESOLVE_TIMEOUT,
        TRANSPORT_ERROR,
        REPUBLISHED,
        LIFECYCLE
    };
    
    /**
     * Records a name-system event.
     * @param level Severity level of the event.
     * @param event The specific type of event.
     * @param peer Peer id or topic the event concerns ("internal" for node-wide events).
     * @param message Optional descriptive message (will be sanitized).
     */
    static void log(Level level, EventType event, const std::string& peer,
                   const std::string& message = "") {
        if (static_cast<int>(level) < min_level_ref().load()) return;

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        
        struct tm gmt;
        gmtime_r(&time_t, &gmt);
        
        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] "
           << "peer=" << sanitize_log_message(peer.empty() ? "internal" : peer);
        
        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }
        
        // Transport callbacks log from their own threads
        static std::mutex output_mutex;
        std::lock_guard<std::mutex> lock(output_mutex);
        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << ss.str() << "\n";
        } else {
            std::cout << ss.str() << "\n";
        }
    }

    // Suppresses records below the given level.
    static void set_min_level(Level level) {
        min_level_ref().store(static_cast<int>(level));
    }

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
    static std::atomic<int>& min_level_ref() {
        static std::atomic<int> min_level{static_cast<int>(Level::INFO)};
        return min_level;
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
            case EventType::RECORD_PUBLISHED: return "PUBLISHED";
            case EventType::RECORD_ACCEPTED: return "ACCEPTED";
            case EventType::RECORD_REJECTED: return "REJECTED";
            case EventType::MALFORMED_MESSAGE: return "MALFORMED";
            case EventType::SUBSCRIBED: return "SUBSCRIBED";
            case EventType::UNSUBSCRIBED: return "UNSUBSCRIBED";
            case EventType::RESOLVE_TIMEOUT: return "RESOLVE_TIMEOUT";
            case EventType::TRANSPORT_ERROR: return "TRANSPORT";
            case EventType::REPUBLISHED: return "REPUBLISHED";
            case EventType::LIFECYCLE: return "LIFECYCLE";
            default: return "UNKNOWN_EVENT";
        }
    }
};

}
