#pragma once

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

namespace stocksync {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

inline std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%FT%TZ");
    return ss.str();
}

/// Threshold read once from STOCKSYNC_LOG_LEVEL (debug, info, warn, error).
inline LogLevel log_threshold() {
    static const LogLevel threshold = [] {
        const char* env = std::getenv("STOCKSYNC_LOG_LEVEL");
        std::string level = env ? env : "info";
        if (level == "debug") return LogLevel::Debug;
        if (level == "warn") return LogLevel::Warn;
        if (level == "error") return LogLevel::Error;
        return LogLevel::Info;
    }();
    return threshold;
}

inline const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

inline void log_at(LogLevel level, const std::string& domain, const std::string& message,
                   const nlohmann::json& fields) {
    if (level < log_threshold()) return;

    nlohmann::json log_entry = {
        {"level", level_name(level)},
        {"message", message},
        {"domain", domain},
        {"timestamp", now_iso8601()}
    };
    for (auto& [key, value] : fields.items()) {
        log_entry[key] = value;
    }

    static std::mutex output_mutex;
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << log_entry.dump() << std::endl;
}

inline void log_debug(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log_at(LogLevel::Debug, domain, message, fields);
}

inline void log_info(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_at(LogLevel::Info, domain, message, fields);
}

inline void log_warn(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log_at(LogLevel::Warn, domain, message, fields);
}

inline void log_error(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log_at(LogLevel::Error, domain, message, fields);
}

}  // namespace stocksync
