#include "proto_convert.hpp"

namespace stocksync {

v1::SyncEventType to_proto(EventType type) {
    switch (type) {
        case EventType::Sale: return v1::SYNC_EVENT_TYPE_SALE;
        case EventType::Restock: return v1::SYNC_EVENT_TYPE_RESTOCK;
        case EventType::Adjustment: return v1::SYNC_EVENT_TYPE_ADJUSTMENT;
        case EventType::SyncPush: return v1::SYNC_EVENT_TYPE_SYNC_PUSH;
        case EventType::SyncPull: return v1::SYNC_EVENT_TYPE_SYNC_PULL;
        case EventType::Error: return v1::SYNC_EVENT_TYPE_ERROR;
    }
    return v1::SYNC_EVENT_TYPE_UNSPECIFIED;
}

void to_proto(const ChannelEntry& entry, v1::ChannelEntry* out) {
    out->set_id(entry.id);
    out->set_platform(entry.platform);
    out->set_listing_id(entry.listing_id);
    if (entry.platform_sku) out->set_platform_sku(*entry.platform_sku);
    out->set_quantity(entry.quantity);
    out->set_last_pushed_quantity(entry.last_pushed_quantity);
    if (entry.last_push_at) out->set_last_push_at(*entry.last_push_at);
}

void to_proto(const ChannelMapping& mapping, v1::ChannelMapping* out) {
    out->set_id(mapping.id);
    out->set_sku(mapping.sku);
    if (mapping.product_id) out->set_product_id(*mapping.product_id);
    for (const auto& entry : mapping.channels) {
        to_proto(entry, out->add_channels());
    }
    out->set_total_quantity(mapping.total_quantity);
    out->set_reserved_quantity(mapping.reserved_quantity);
    out->set_available_quantity(mapping.available_quantity);
    out->set_sync_enabled(mapping.sync_enabled);
    if (mapping.last_sync_at) out->set_last_sync_at(*mapping.last_sync_at);
    out->set_created_at(mapping.created_at);
}

void to_proto(const SyncEvent& event, v1::SyncEvent* out) {
    out->set_id(event.id);
    out->set_sku(event.sku);
    out->set_event_type(to_proto(event.event_type));
    out->set_platform(event.platform);
    out->set_quantity_change(event.quantity_change);
    out->set_previous_quantity(event.previous_quantity);
    out->set_new_quantity(event.new_quantity);
    if (event.details) out->set_details(*event.details);
    out->set_oversell(event.oversell);
    out->set_created_at(event.created_at);
}

void to_proto(const DaemonConfig& config, v1::DaemonConfig* out) {
    out->set_enabled(config.enabled);
    out->set_interval_ms(config.interval_ms);
    for (const auto& platform : config.platforms) {
        out->add_platforms(platform);
    }
    out->set_buffer_stock(config.buffer_stock);
    out->set_oversell_protection(config.oversell_protection);
    if (config.max_quantity_per_channel) {
        out->set_max_quantity_per_channel(*config.max_quantity_per_channel);
    }
}

void to_proto(const SyncResult& result, v1::SyncResult* out) {
    out->set_synced(result.synced);
    out->set_failed(result.failed);
    for (const auto& channel : result.channels) {
        auto* c = out->add_channels();
        c->set_platform(channel.platform);
        c->set_listing_id(channel.listing_id);
        c->set_quantity(channel.quantity);
        c->set_success(channel.success);
        c->set_pushed(channel.pushed);
    }
}

void to_proto(const CycleResult& result, v1::CycleResult* out) {
    out->set_mappings_checked(result.mappings_checked);
    out->set_mappings_synced(result.mappings_synced);
    out->set_total_pushes(result.total_pushes);
    out->set_skipped(result.skipped);
}

void to_proto(const SyncStats& stats, v1::SyncStats* out) {
    out->set_total_syncs(stats.total_syncs);
    out->set_total_sales(stats.total_sales);
    out->set_total_restocks(stats.total_restocks);
    out->set_total_adjustments(stats.total_adjustments);
    out->set_total_pushes(stats.total_pushes);
    out->set_total_pulls(stats.total_pulls);
    out->set_total_errors(stats.total_errors);
    out->set_oversell_incidents(stats.oversell_incidents);
    for (const auto& day : stats.events_by_day) {
        auto* d = out->add_events_by_day();
        d->set_date(day.date);
        d->set_count(day.count);
    }
    if (stats.last_run_at) out->set_last_run_at(*stats.last_run_at);
}

void to_proto(const DaemonStatus& status, v1::DaemonStatus* out) {
    out->set_running(status.running);
    to_proto(status.config, out->mutable_config());
    out->set_total_cycles(status.total_cycles);
    if (status.last_run_at) out->set_last_run_at(*status.last_run_at);
}

} // namespace stocksync
