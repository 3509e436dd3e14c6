#pragma once

#include <optional>
#include <string>
#include <vector>
#include "audit_log.hpp"
#include "config_store.hpp"
#include "database.hpp"
#include "mapping_store.hpp"
#include "sku_locks.hpp"
#include "types.hpp"

namespace stocksync {

/**
 * The quantity one channel should advertise.
 */
struct ChannelTarget {
    ChannelEntry entry;
    Quantity target = 0;
};

/**
 * Compute per-channel targets for a mapping under a configuration.
 *
 * Channels outside the platform allow-list are dropped. The available
 * quantity (total - reserved - buffer, floored at 0; 0 under oversell
 * protection when nothing is available) is split evenly, the remainder
 * going one unit at a time to channels in link order, and each share is
 * clamped to max_quantity_per_channel when set.
 *
 * Used by both the distribution pass and the daemon's drift check.
 */
std::vector<ChannelTarget> compute_targets(const ChannelMapping& mapping,
                                           const DaemonConfig& config);

/**
 * True if any target differs from its channel's last pushed quantity.
 */
bool has_drift(const std::vector<ChannelTarget>& targets);

/**
 * Pushes computed targets to channels whose last pushed quantity differs,
 * and ingests quantities observed on the platforms.
 */
class DistributionEngine {
public:
    DistributionEngine(Database& db, MappingStore& mappings, AuditLog& audit,
                       const ConfigStore& config, SkuLockTable& locks)
        : db_(db), mappings_(mappings), audit_(audit), config_(config), locks_(locks) {}

    /**
     * One distribution pass using the persisted configuration, optionally
     * overridden for this call only.
     * @throws NotFoundError if the SKU is not mapped
     */
    SyncResult sync_to_channels(const std::string& sku, const PushFn& push,
                                const std::optional<DaemonConfigUpdate>& override_config = std::nullopt);

    /**
     * One distribution pass under an explicit configuration.
     *
     * Push failures never escape: a false return or an exception from push
     * is recorded as an error event and counted in SyncResult::failed.
     */
    SyncResult sync_with_config(const std::string& sku, const PushFn& push,
                                const DaemonConfig& config);

    /**
     * Record the quantity a platform actually advertises for a listing.
     *
     * Appends a sync_pull event and stores the observation as the last
     * pushed quantity, so the next drift check re-pushes the target. An
     * observation above the channel's target is also logged as an oversell
     * error event.
     *
     * @return The updated channel entry
     * @throws NotFoundError if the listing is not linked
     * @throws InvalidQuantityError if observed is negative
     */
    ChannelEntry report_channel_quantity(const std::string& platform,
                                         const std::string& listing_id,
                                         Quantity observed);

private:
    ChannelSyncResult push_channel(const std::string& sku, const ChannelTarget& target,
                                   const PushFn& push);

    Database& db_;
    MappingStore& mappings_;
    AuditLog& audit_;
    const ConfigStore& config_;
    SkuLockTable& locks_;
};

} // namespace stocksync
