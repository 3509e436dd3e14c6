#include "stocksync/distribution.hpp"
#include "stocksync/errors.hpp"
#include "stocksync/helpers.hpp"
#include "stocksync/logging.hpp"
#include "stocksync/validation.hpp"
#include <algorithm>

namespace stocksync {

namespace {

bool platform_allowed(const DaemonConfig& config, const std::string& platform) {
    return config.platforms.empty() ||
           std::find(config.platforms.begin(), config.platforms.end(), platform) !=
               config.platforms.end();
}

std::string channel_label(const ChannelEntry& entry) {
    return entry.platform + "/" + entry.listing_id;
}

} // anonymous namespace

std::vector<ChannelTarget> compute_targets(const ChannelMapping& mapping,
                                           const DaemonConfig& config) {
    std::vector<ChannelTarget> targets;
    for (const auto& entry : mapping.channels) {
        if (platform_allowed(config, entry.platform)) {
            targets.push_back(ChannelTarget{entry, 0});
        }
    }
    if (targets.empty()) {
        return targets;
    }

    Quantity available = MappingStore::available_quantity(
        mapping.total_quantity, mapping.reserved_quantity, config.buffer_stock);
    Quantity effective = config.oversell_protection && available <= 0 ? 0 : available;

    auto count = static_cast<Quantity>(targets.size());
    Quantity per_channel = effective / count;
    Quantity remainder = effective % count;

    for (Quantity i = 0; i < count; ++i) {
        Quantity share = per_channel + (i < remainder ? 1 : 0);
        if (config.max_quantity_per_channel) {
            share = std::min(share, *config.max_quantity_per_channel);
        }
        targets[static_cast<size_t>(i)].target = share;
    }
    return targets;
}

bool has_drift(const std::vector<ChannelTarget>& targets) {
    return std::any_of(targets.begin(), targets.end(), [](const ChannelTarget& t) {
        return t.target != t.entry.last_pushed_quantity;
    });
}

SyncResult DistributionEngine::sync_to_channels(const std::string& sku, const PushFn& push,
                                                const std::optional<DaemonConfigUpdate>& override_config) {
    DaemonConfig config = config_.load();
    if (override_config) {
        config = merge(config, *override_config);
        ConfigStore::validate(config);
    }
    return sync_with_config(sku, push, config);
}

SyncResult DistributionEngine::sync_with_config(const std::string& sku, const PushFn& push,
                                                const DaemonConfig& config) {
    auto sku_lock = locks_.lock(sku);
    ChannelMapping mapping = mappings_.require_mapping(sku);

    SyncResult result;
    auto targets = compute_targets(mapping, config);
    if (targets.empty()) {
        log_debug("distribution", "no_channels_to_sync", {{"sku", sku}});
        return result;
    }

    for (const auto& target : targets) {
        ChannelSyncResult channel = push_channel(sku, target, push);
        if (channel.success) {
            ++result.synced;
        } else {
            ++result.failed;
        }
        result.channels.push_back(channel);
    }

    mappings_.touch_last_sync(mapping.id, helpers::now_millis());

    log_info("distribution", "sku_synced", {
        {"sku", sku},
        {"synced", result.synced},
        {"failed", result.failed},
        {"available", MappingStore::available_quantity(
            mapping.total_quantity, mapping.reserved_quantity, config.buffer_stock)}
    });
    return result;
}

ChannelSyncResult DistributionEngine::push_channel(const std::string& sku,
                                                   const ChannelTarget& target,
                                                   const PushFn& push) {
    const ChannelEntry& entry = target.entry;
    ChannelSyncResult result;
    result.platform = entry.platform;
    result.listing_id = entry.listing_id;
    result.quantity = target.target;

    if (target.target == entry.last_pushed_quantity) {
        result.success = true;
        return result;
    }

    result.pushed = true;
    std::optional<std::string> failure;
    try {
        if (!push(entry.platform, entry.listing_id, target.target)) {
            failure = "Push rejected for " + channel_label(entry) + " (" +
                      std::to_string(target.target) + " units)";
        }
    } catch (const std::exception& e) {
        failure = std::string("Push error: ") + e.what();
    } catch (...) {
        failure = std::string("Push error: unknown exception");
    }

    SyncEvent event;
    event.sku = sku;
    event.platform = entry.platform;

    if (failure) {
        log_error("distribution", "push_failed", {
            {"sku", sku},
            {"platform", entry.platform},
            {"listing_id", entry.listing_id},
            {"quantity", target.target},
            {"error", *failure}
        });
        event.event_type = EventType::Error;
        event.quantity_change = 0;
        event.previous_quantity = entry.last_pushed_quantity;
        event.new_quantity = entry.last_pushed_quantity;
        event.details = failure;
        audit_.append(event);
        return result;
    }

    Millis now = helpers::now_millis();
    event.event_type = EventType::SyncPush;
    event.quantity_change = target.target - entry.last_pushed_quantity;
    event.previous_quantity = entry.last_pushed_quantity;
    event.new_quantity = target.target;
    event.details = "Pushed " + std::to_string(target.target) + " units to " + channel_label(entry);
    event.created_at = now;
    {
        Database::Transaction tx(db_);
        mappings_.record_push(entry.id, target.target, now);
        audit_.append(event);
        tx.commit();
    }

    result.success = true;
    return result;
}

ChannelEntry DistributionEngine::report_channel_quantity(const std::string& platform,
                                                         const std::string& listing_id,
                                                         Quantity observed) {
    validation::require_not_empty(platform, "platform");
    validation::require_not_empty(listing_id, "listingId");
    validation::require_non_negative(observed, "observedQuantity");

    auto location = mappings_.find_channel(platform, listing_id);
    if (!location) {
        throw NotFoundError("Channel entry not found: " + platform + "/" + listing_id);
    }

    auto sku_lock = locks_.lock(location->sku);
    ChannelMapping mapping = mappings_.require_mapping(location->sku);
    auto current = std::find_if(mapping.channels.begin(), mapping.channels.end(),
        [&](const ChannelEntry& e) { return e.id == location->entry.id; });
    if (current == mapping.channels.end()) {
        throw NotFoundError("Channel entry not found: " + platform + "/" + listing_id);
    }
    ChannelEntry entry = *current;

    // Channels outside the allow-list are not distributed to; their last
    // computed quantity stands in for the target.
    Quantity target = entry.quantity;
    for (const auto& t : compute_targets(mapping, config_.load())) {
        if (t.entry.id == entry.id) {
            target = t.target;
            break;
        }
    }

    SyncEvent pull;
    pull.sku = mapping.sku;
    pull.event_type = EventType::SyncPull;
    pull.platform = platform;
    pull.quantity_change = observed - entry.last_pushed_quantity;
    pull.previous_quantity = entry.last_pushed_quantity;
    pull.new_quantity = observed;
    pull.details = "Observed " + std::to_string(observed) + " units on " + channel_label(entry);

    bool oversold = observed > target;
    {
        Database::Transaction tx(db_);
        mappings_.set_last_pushed(entry.id, observed);
        audit_.append(pull);
        if (oversold) {
            SyncEvent incident;
            incident.sku = mapping.sku;
            incident.event_type = EventType::Error;
            incident.platform = platform;
            incident.quantity_change = observed - target;
            incident.previous_quantity = target;
            incident.new_quantity = observed;
            incident.details = "Oversell: " + channel_label(entry) + " advertises " +
                               std::to_string(observed) + " units, target is " +
                               std::to_string(target);
            incident.oversell = true;
            audit_.append(incident);
        }
        tx.commit();
    }

    if (oversold) {
        log_warn("distribution", "oversell_detected", {
            {"sku", mapping.sku},
            {"platform", platform},
            {"listing_id", listing_id},
            {"observed", observed},
            {"target", target}
        });
    } else {
        log_debug("distribution", "channel_quantity_reported", {
            {"sku", mapping.sku}, {"platform", platform},
            {"listing_id", listing_id}, {"observed", observed}
        });
    }

    entry.last_pushed_quantity = observed;
    return entry;
}

} // namespace stocksync
