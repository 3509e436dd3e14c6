#include "stocksync/types.hpp"

namespace stocksync {

const char* to_string(EventType type) {
    switch (type) {
        case EventType::Sale: return "sale";
        case EventType::Restock: return "restock";
        case EventType::Adjustment: return "adjustment";
        case EventType::SyncPush: return "sync_push";
        case EventType::SyncPull: return "sync_pull";
        case EventType::Error: return "error";
    }
    return "adjustment";
}

std::optional<EventType> parse_event_type(const std::string& name) {
    if (name == "sale") return EventType::Sale;
    if (name == "restock") return EventType::Restock;
    if (name == "adjustment") return EventType::Adjustment;
    if (name == "sync_push") return EventType::SyncPush;
    if (name == "sync_pull") return EventType::SyncPull;
    if (name == "error") return EventType::Error;
    return std::nullopt;
}

DaemonConfig merge(DaemonConfig base, const DaemonConfigUpdate& update) {
    if (update.enabled) base.enabled = *update.enabled;
    if (update.interval_ms) base.interval_ms = *update.interval_ms;
    if (update.platforms) base.platforms = *update.platforms;
    if (update.buffer_stock) base.buffer_stock = *update.buffer_stock;
    if (update.oversell_protection) base.oversell_protection = *update.oversell_protection;
    if (update.clear_max_quantity_per_channel) {
        base.max_quantity_per_channel.reset();
    } else if (update.max_quantity_per_channel) {
        base.max_quantity_per_channel = *update.max_quantity_per_channel;
    }
    return base;
}

} // namespace stocksync
