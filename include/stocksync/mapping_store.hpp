#pragma once

#include <optional>
#include <string>
#include <vector>
#include "config_store.hpp"
#include "database.hpp"
#include "types.hpp"

namespace stocksync {

/**
 * A channel entry together with the SKU of the mapping that owns it.
 */
struct ChannelLocation {
    std::string sku;
    std::string mapping_id;
    ChannelEntry entry;
};

/**
 * Durable SKU -> counters -> linked listings.
 *
 * Public operations validate their inputs and throw SyncError subclasses.
 * The row primitives at the bottom are used by the ledger and distribution
 * engine inside their own transactions and never open one themselves.
 */
class MappingStore {
public:
    MappingStore(Database& db, const ConfigStore& config)
        : db_(db), config_(config) {}

    /**
     * Create a mapping for a new SKU.
     * @throws InvalidArgumentError if sku is empty
     * @throws InvalidQuantityError if initial_quantity is negative
     * @throws DuplicateSkuError if the SKU is already mapped
     */
    ChannelMapping create_mapping(const std::string& sku,
                                  const std::optional<std::string>& product_id = std::nullopt,
                                  Quantity initial_quantity = 0);

    /**
     * Link a platform listing to a mapped SKU. The entry starts at 0 / 0.
     * @throws NotFoundError if the SKU is not mapped
     * @throws DuplicateChannelError if the listing is already linked anywhere
     */
    ChannelEntry add_channel(const std::string& sku,
                             const std::string& platform,
                             const std::string& listing_id,
                             const std::optional<std::string>& platform_sku = std::nullopt);

    /**
     * Unlink a listing.
     * @return The removed entry and its owning SKU
     * @throws NotFoundError if no entry exists for the pair
     */
    ChannelLocation remove_channel(const std::string& platform, const std::string& listing_id);

    /**
     * Mapping with channels in link order and the current available quantity.
     */
    std::optional<ChannelMapping> get_mapping(const std::string& sku) const;

    /**
     * Like get_mapping, but throws NotFoundError instead of returning empty.
     */
    ChannelMapping require_mapping(const std::string& sku) const;

    /**
     * Mappings, most recently created first.
     */
    std::vector<ChannelMapping> list_mappings(const MappingFilter& filter = {}) const;

    ChannelMapping set_sync_enabled(const std::string& sku, bool enabled);

    /**
     * Order-pipeline hook for units held back from distribution. Appends no
     * audit event.
     * @throws InvalidQuantityError if quantity is negative
     */
    ChannelMapping set_reserved_quantity(const std::string& sku, Quantity quantity);

    std::optional<ChannelLocation> find_channel(const std::string& platform,
                                                const std::string& listing_id) const;

    // Row primitives; callers hold the SKU lock and a transaction.
    void update_total(const std::string& mapping_id, Quantity total);
    void record_push(const std::string& entry_id, Quantity quantity, Millis at);
    void set_last_pushed(const std::string& entry_id, Quantity quantity);
    void touch_last_sync(const std::string& mapping_id, Millis at);

    /**
     * max(0, total - reserved - buffer_stock).
     */
    static Quantity available_quantity(Quantity total, Quantity reserved, Quantity buffer_stock);

private:
    ChannelMapping load_row(Statement& stmt, Quantity buffer_stock) const;
    std::vector<ChannelEntry> load_channels(const std::string& mapping_id) const;

    Database& db_;
    const ConfigStore& config_;
};

} // namespace stocksync
