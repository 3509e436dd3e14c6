#include "stocksync/ledger.hpp"
#include "stocksync/logging.hpp"
#include "stocksync/validation.hpp"
#include <algorithm>

namespace stocksync {

ChannelMapping Ledger::adjust_inventory(const std::string& sku, Quantity delta,
                                        const std::string& reason,
                                        const std::optional<std::string>& platform) {
    validation::require_not_empty(sku, "sku");
    validation::require_finite(delta, "delta");

    auto sku_lock = locks_.lock(sku);
    ChannelMapping mapping;
    {
        Database::Transaction tx(db_);
        mapping = mappings_.require_mapping(sku);

        Quantity previous = mapping.total_quantity;
        Quantity updated = std::max<Quantity>(0, previous + delta);
        mappings_.update_total(mapping.id, updated);

        SyncEvent event;
        event.sku = sku;
        event.event_type = delta < 0 ? EventType::Sale
                         : delta > 0 ? EventType::Restock
                                     : EventType::Adjustment;
        event.platform = platform.value_or(kDefaultPlatform);
        event.quantity_change = delta;
        event.previous_quantity = previous;
        event.new_quantity = updated;
        event.details = reason;
        audit_.append(event);

        tx.commit();

        log_info("ledger", "inventory_updated", {
            {"sku", sku},
            {"event_type", to_string(event.event_type)},
            {"platform", event.platform},
            {"previous", previous},
            {"new", updated}
        });
    }
    return mappings_.require_mapping(sku);
}

ChannelMapping Ledger::record_sale(const std::string& sku, const std::string& platform,
                                   Quantity quantity) {
    validation::require_not_empty(platform, "platform");
    validation::require_positive(quantity, "quantity");
    return adjust_inventory(sku, -quantity,
                            "Sale of " + std::to_string(quantity) + " units", platform);
}

ChannelMapping Ledger::record_restock(const std::string& sku, Quantity quantity) {
    validation::require_positive(quantity, "quantity");
    return adjust_inventory(sku, quantity,
                            "Restock of " + std::to_string(quantity) + " units",
                            std::string(kRestockPlatform));
}

} // namespace stocksync
