#include "stocksync/mapping_store.hpp"
#include "stocksync/errors.hpp"
#include "stocksync/helpers.hpp"
#include "stocksync/logging.hpp"
#include "stocksync/validation.hpp"
#include <algorithm>

namespace stocksync {

namespace {

constexpr const char* kMappingColumns =
    "id, sku, product_id, total_quantity, reserved_quantity, sync_enabled, "
    "last_sync_at, created_at";

constexpr const char* kEntryColumns =
    "id, platform, listing_id, platform_sku, quantity, last_pushed_quantity, last_push_at";

ChannelEntry read_entry(const Statement& stmt, int first) {
    ChannelEntry entry;
    entry.id = stmt.column_text(first);
    entry.platform = stmt.column_text(first + 1);
    entry.listing_id = stmt.column_text(first + 2);
    entry.platform_sku = stmt.column_optional_text(first + 3);
    entry.quantity = stmt.column_int64(first + 4);
    entry.last_pushed_quantity = stmt.column_int64(first + 5);
    entry.last_push_at = stmt.column_optional_int64(first + 6);
    return entry;
}

} // anonymous namespace

Quantity MappingStore::available_quantity(Quantity total, Quantity reserved,
                                          Quantity buffer_stock) {
    return std::max<Quantity>(0, total - reserved - buffer_stock);
}

ChannelMapping MappingStore::load_row(Statement& stmt, Quantity buffer_stock) const {
    ChannelMapping mapping;
    mapping.id = stmt.column_text(0);
    mapping.sku = stmt.column_text(1);
    mapping.product_id = stmt.column_optional_text(2);
    mapping.total_quantity = stmt.column_int64(3);
    mapping.reserved_quantity = stmt.column_int64(4);
    mapping.sync_enabled = stmt.column_int64(5) != 0;
    mapping.last_sync_at = stmt.column_optional_int64(6);
    mapping.created_at = stmt.column_int64(7);
    mapping.available_quantity = available_quantity(
        mapping.total_quantity, mapping.reserved_quantity, buffer_stock);
    return mapping;
}

std::vector<ChannelEntry> MappingStore::load_channels(const std::string& mapping_id) const {
    auto stmt = db_.prepare(std::string("SELECT ") + kEntryColumns +
                            " FROM channel_entries WHERE mapping_id = ? ORDER BY rowid");
    stmt.bind(1, mapping_id);

    std::vector<ChannelEntry> channels;
    while (stmt.step()) {
        channels.push_back(read_entry(stmt, 0));
    }
    return channels;
}

ChannelMapping MappingStore::create_mapping(const std::string& sku,
                                            const std::optional<std::string>& product_id,
                                            Quantity initial_quantity) {
    validation::require_not_empty(sku, "sku");
    validation::require_non_negative(initial_quantity, "initialQuantity");

    auto guard = db_.lock();
    if (get_mapping(sku)) {
        throw DuplicateSkuError(sku);
    }

    std::string id = helpers::generate_id("cmap");
    auto stmt = db_.prepare(
        "INSERT INTO channel_mappings "
        "(id, sku, product_id, total_quantity, reserved_quantity, sync_enabled, created_at) "
        "VALUES (?, ?, ?, ?, 0, 1, ?)");
    stmt.bind(1, id)
        .bind(2, sku)
        .bind(3, product_id)
        .bind(4, initial_quantity)
        .bind(5, helpers::now_millis());
    try {
        stmt.run();
    } catch (const ConstraintError&) {
        throw DuplicateSkuError(sku);
    }

    log_info("mapping", "mapping_created",
        {{"sku", sku}, {"mapping_id", id}, {"total_quantity", initial_quantity}});
    return require_mapping(sku);
}

ChannelEntry MappingStore::add_channel(const std::string& sku,
                                       const std::string& platform,
                                       const std::string& listing_id,
                                       const std::optional<std::string>& platform_sku) {
    validation::require_not_empty(sku, "sku");
    validation::require_not_empty(platform, "platform");
    validation::require_not_empty(listing_id, "listingId");

    auto guard = db_.lock();
    ChannelMapping mapping = require_mapping(sku);
    if (find_channel(platform, listing_id)) {
        throw DuplicateChannelError(platform, listing_id);
    }

    ChannelEntry entry;
    entry.id = helpers::generate_id("cent");
    entry.platform = platform;
    entry.listing_id = listing_id;
    entry.platform_sku = platform_sku;

    auto stmt = db_.prepare(
        "INSERT INTO channel_entries "
        "(id, mapping_id, platform, listing_id, platform_sku, quantity, last_pushed_quantity) "
        "VALUES (?, ?, ?, ?, ?, 0, 0)");
    stmt.bind(1, entry.id)
        .bind(2, mapping.id)
        .bind(3, platform)
        .bind(4, listing_id)
        .bind(5, platform_sku);
    try {
        stmt.run();
    } catch (const ConstraintError&) {
        throw DuplicateChannelError(platform, listing_id);
    }

    log_info("mapping", "channel_added",
        {{"sku", sku}, {"platform", platform}, {"listing_id", listing_id}});
    return entry;
}

ChannelLocation MappingStore::remove_channel(const std::string& platform,
                                             const std::string& listing_id) {
    auto guard = db_.lock();
    auto location = find_channel(platform, listing_id);
    if (!location) {
        throw NotFoundError("Channel entry not found: " + platform + "/" + listing_id);
    }

    auto stmt = db_.prepare("DELETE FROM channel_entries WHERE id = ?");
    stmt.bind(1, location->entry.id);
    stmt.run();

    log_info("mapping", "channel_removed",
        {{"sku", location->sku}, {"platform", platform}, {"listing_id", listing_id}});
    return *location;
}

std::optional<ChannelMapping> MappingStore::get_mapping(const std::string& sku) const {
    Quantity buffer_stock = config_.load().buffer_stock;

    auto guard = db_.lock();
    auto stmt = db_.prepare(std::string("SELECT ") + kMappingColumns +
                            " FROM channel_mappings WHERE sku = ?");
    stmt.bind(1, sku);
    if (!stmt.step()) {
        return std::nullopt;
    }
    ChannelMapping mapping = load_row(stmt, buffer_stock);
    mapping.channels = load_channels(mapping.id);
    return mapping;
}

ChannelMapping MappingStore::require_mapping(const std::string& sku) const {
    auto mapping = get_mapping(sku);
    if (!mapping) {
        throw NotFoundError("No channel mapping found for SKU: " + sku);
    }
    return *mapping;
}

std::vector<ChannelMapping> MappingStore::list_mappings(const MappingFilter& filter) const {
    Quantity buffer_stock = config_.load().buffer_stock;

    std::string sql = std::string("SELECT ") + kMappingColumns + " FROM channel_mappings";
    if (filter.sync_enabled_only) {
        sql += " WHERE sync_enabled = 1";
    }
    sql += " ORDER BY created_at DESC, rowid DESC LIMIT ? OFFSET ?";

    int64_t limit = filter.limit ? std::max(1, *filter.limit) : -1;
    int64_t offset = filter.offset ? std::max(0, *filter.offset) : 0;

    auto guard = db_.lock();
    auto stmt = db_.prepare(sql);
    stmt.bind(1, limit).bind(2, offset);

    std::vector<ChannelMapping> mappings;
    while (stmt.step()) {
        mappings.push_back(load_row(stmt, buffer_stock));
    }
    for (auto& mapping : mappings) {
        mapping.channels = load_channels(mapping.id);
    }
    return mappings;
}

ChannelMapping MappingStore::set_sync_enabled(const std::string& sku, bool enabled) {
    auto guard = db_.lock();
    ChannelMapping mapping = require_mapping(sku);

    auto stmt = db_.prepare("UPDATE channel_mappings SET sync_enabled = ? WHERE id = ?");
    stmt.bind(1, enabled).bind(2, mapping.id);
    stmt.run();

    log_info("mapping", "sync_enabled_changed", {{"sku", sku}, {"sync_enabled", enabled}});
    return require_mapping(sku);
}

ChannelMapping MappingStore::set_reserved_quantity(const std::string& sku, Quantity quantity) {
    validation::require_non_negative(quantity, "reservedQuantity");

    auto guard = db_.lock();
    ChannelMapping mapping = require_mapping(sku);

    auto stmt = db_.prepare("UPDATE channel_mappings SET reserved_quantity = ? WHERE id = ?");
    stmt.bind(1, quantity).bind(2, mapping.id);
    stmt.run();

    log_debug("mapping", "reserved_quantity_changed",
        {{"sku", sku}, {"reserved_quantity", quantity}});
    return require_mapping(sku);
}

std::optional<ChannelLocation> MappingStore::find_channel(const std::string& platform,
                                                          const std::string& listing_id) const {
    auto guard = db_.lock();
    auto stmt = db_.prepare(
        "SELECT m.sku, m.id, e.id, e.platform, e.listing_id, e.platform_sku, e.quantity, "
        "e.last_pushed_quantity, e.last_push_at "
        "FROM channel_entries e JOIN channel_mappings m ON m.id = e.mapping_id "
        "WHERE e.platform = ? AND e.listing_id = ?");
    stmt.bind(1, platform).bind(2, listing_id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    ChannelLocation location;
    location.sku = stmt.column_text(0);
    location.mapping_id = stmt.column_text(1);
    location.entry = read_entry(stmt, 2);
    return location;
}

void MappingStore::update_total(const std::string& mapping_id, Quantity total) {
    auto guard = db_.lock();
    auto stmt = db_.prepare("UPDATE channel_mappings SET total_quantity = ? WHERE id = ?");
    stmt.bind(1, total).bind(2, mapping_id);
    stmt.run();
}

void MappingStore::record_push(const std::string& entry_id, Quantity quantity, Millis at) {
    auto guard = db_.lock();
    auto stmt = db_.prepare(
        "UPDATE channel_entries SET quantity = ?, last_pushed_quantity = ?, last_push_at = ? "
        "WHERE id = ?");
    stmt.bind(1, quantity).bind(2, quantity).bind(3, at).bind(4, entry_id);
    stmt.run();
}

void MappingStore::set_last_pushed(const std::string& entry_id, Quantity quantity) {
    auto guard = db_.lock();
    auto stmt = db_.prepare("UPDATE channel_entries SET last_pushed_quantity = ? WHERE id = ?");
    stmt.bind(1, quantity).bind(2, entry_id);
    stmt.run();
}

void MappingStore::touch_last_sync(const std::string& mapping_id, Millis at) {
    auto guard = db_.lock();
    auto stmt = db_.prepare("UPDATE channel_mappings SET last_sync_at = ? WHERE id = ?");
    stmt.bind(1, at).bind(2, mapping_id);
    stmt.run();
}

} // namespace stocksync
