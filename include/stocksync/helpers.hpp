#pragma once

#include <chrono>
#include <string>
#include "types.hpp"

namespace stocksync {

/**
 * Helper functions shared by the stores and the daemon.
 */
namespace helpers {

constexpr Millis kMillisPerDay = 24LL * 60 * 60 * 1000;

/**
 * Current wall-clock time in milliseconds since the epoch.
 */
Millis now_millis();

/**
 * Convert a time point to milliseconds since the epoch.
 */
inline Millis to_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

/**
 * Format milliseconds since the epoch as ISO-8601 UTC ("2026-10-19T08:30:00Z").
 */
std::string iso8601(Millis at);

/**
 * Generate a record id: prefix, underscore, 16 random hex characters.
 * @param prefix Record kind, e.g. "cmap", "cent", "sev"
 */
std::string generate_id(const std::string& prefix);

/**
 * Cutoff timestamp for a "last N days" window ending now.
 */
inline Millis days_ago(int days) {
    return now_millis() - static_cast<Millis>(days) * kMillisPerDay;
}

} // namespace helpers
} // namespace stocksync
