#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace stocksync {

using Quantity = int64_t;
/// Milliseconds since the Unix epoch.
using Millis = int64_t;

/// Largest quantity magnitude accepted from callers.
constexpr Quantity kMaxQuantityMagnitude = 1'000'000'000'000;

/**
 * Sets the advertised quantity of one listing on its platform.
 * Returns false when the platform rejects the update; may throw.
 */
using PushFn = std::function<bool(
    const std::string& platform, const std::string& listing_id, Quantity quantity)>;

enum class EventType {
    Sale,
    Restock,
    Adjustment,
    SyncPush,
    SyncPull,
    Error
};

/// Wire name stored in the event log ("sale", "sync_push", ...).
const char* to_string(EventType type);

/// Inverse of to_string; empty for unknown names.
std::optional<EventType> parse_event_type(const std::string& name);

struct ChannelEntry {
    std::string id;
    std::string platform;
    std::string listing_id;
    std::optional<std::string> platform_sku;
    Quantity quantity = 0;
    Quantity last_pushed_quantity = 0;
    std::optional<Millis> last_push_at;
};

struct ChannelMapping {
    std::string id;
    std::string sku;
    std::optional<std::string> product_id;
    std::vector<ChannelEntry> channels;
    Quantity total_quantity = 0;
    Quantity reserved_quantity = 0;
    /// Derived at load time from the current buffer stock; never stored.
    Quantity available_quantity = 0;
    bool sync_enabled = true;
    std::optional<Millis> last_sync_at;
    Millis created_at = 0;
};

struct SyncEvent {
    std::string id;
    std::string sku;
    EventType event_type = EventType::Adjustment;
    std::string platform;
    Quantity quantity_change = 0;
    Quantity previous_quantity = 0;
    Quantity new_quantity = 0;
    std::optional<std::string> details;
    bool oversell = false;
    Millis created_at = 0;
};

struct DaemonConfig {
    bool enabled = true;
    Millis interval_ms = 60'000;
    /// Allow-list of platforms; empty means every platform participates.
    std::vector<std::string> platforms;
    Quantity buffer_stock = 0;
    bool oversell_protection = true;
    std::optional<Quantity> max_quantity_per_channel;
};

/**
 * Partial daemon configuration. Unset fields keep the current value.
 */
struct DaemonConfigUpdate {
    std::optional<bool> enabled;
    std::optional<Millis> interval_ms;
    std::optional<std::vector<std::string>> platforms;
    std::optional<Quantity> buffer_stock;
    std::optional<bool> oversell_protection;
    std::optional<Quantity> max_quantity_per_channel;
    bool clear_max_quantity_per_channel = false;

    bool empty() const {
        return !enabled && !interval_ms && !platforms && !buffer_stock &&
               !oversell_protection && !max_quantity_per_channel &&
               !clear_max_quantity_per_channel;
    }
};

/// Apply an update on top of a base configuration.
DaemonConfig merge(DaemonConfig base, const DaemonConfigUpdate& update);

struct MappingFilter {
    bool sync_enabled_only = false;
    std::optional<int> limit;
    std::optional<int> offset;
};

struct EventFilter {
    std::optional<std::string> sku;
    std::optional<EventType> event_type;
    std::optional<int> since_days;
    std::optional<int> limit;
};

struct ChannelSyncResult {
    std::string platform;
    std::string listing_id;
    Quantity quantity = 0;
    bool success = false;
    /// False when the target already matched the last pushed quantity.
    bool pushed = false;
};

struct SyncResult {
    int synced = 0;
    int failed = 0;
    std::vector<ChannelSyncResult> channels;
};

struct CycleResult {
    int mappings_checked = 0;
    int mappings_synced = 0;
    int total_pushes = 0;
    /// Set when another cycle was still running.
    bool skipped = false;
};

struct DayCount {
    std::string date;
    int64_t count = 0;
};

struct SyncStats {
    int64_t total_syncs = 0;
    int64_t total_sales = 0;
    int64_t total_restocks = 0;
    int64_t total_adjustments = 0;
    int64_t total_pushes = 0;
    int64_t total_pulls = 0;
    int64_t total_errors = 0;
    int64_t oversell_incidents = 0;
    std::vector<DayCount> events_by_day;
    std::optional<Millis> last_run_at;
};

struct DaemonStatus {
    bool running = false;
    DaemonConfig config;
    int64_t total_cycles = 0;
    std::optional<Millis> last_run_at;
};

} // namespace stocksync
