#include "stocksync/helpers.hpp"

#include <ctime>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace stocksync {
namespace helpers {

Millis now_millis() {
    return to_millis(std::chrono::system_clock::now());
}

std::string iso8601(Millis at) {
    std::time_t seconds = static_cast<std::time_t>(at / 1000);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%FT%TZ");
    return ss.str();
}

std::string generate_id(const std::string& prefix) {
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};

    uint64_t value;
    {
        std::lock_guard<std::mutex> lock(mutex);
        value = engine();
    }

    static const char hex_chars[] = "0123456789abcdef";
    std::string id = prefix;
    id.reserve(prefix.size() + 17);
    id.push_back('_');
    for (int shift = 60; shift >= 0; shift -= 4) {
        id.push_back(hex_chars[(value >> shift) & 0x0f]);
    }
    return id;
}

} // namespace helpers
} // namespace stocksync
