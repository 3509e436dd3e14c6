#pragma once

#include <optional>
#include <string>
#include "audit_log.hpp"
#include "database.hpp"
#include "mapping_store.hpp"
#include "sku_locks.hpp"
#include "types.hpp"

namespace stocksync {

/**
 * Applies signed quantity deltas to a mapping's total and records one
 * audit event per change, both in a single transaction.
 */
class Ledger {
public:
    static constexpr const char* kDefaultPlatform = "system";
    static constexpr const char* kRestockPlatform = "warehouse";

    Ledger(Database& db, MappingStore& mappings, AuditLog& audit, SkuLockTable& locks)
        : db_(db), mappings_(mappings), audit_(audit), locks_(locks) {}

    /**
     * Apply delta to the SKU's total, flooring at zero.
     *
     * The event type is sale for negative deltas, restock for positive ones
     * and adjustment for zero.
     *
     * @return The refreshed mapping
     * @throws NotFoundError if the SKU is not mapped
     * @throws InvalidQuantityError if |delta| exceeds the supported magnitude
     */
    ChannelMapping adjust_inventory(const std::string& sku, Quantity delta,
                                    const std::string& reason,
                                    const std::optional<std::string>& platform = std::nullopt);

    /**
     * Decrease by quantity with reason "Sale of N units".
     * @throws InvalidQuantityError if quantity <= 0
     */
    ChannelMapping record_sale(const std::string& sku, const std::string& platform,
                               Quantity quantity);

    /**
     * Increase by quantity from the warehouse with reason "Restock of N units".
     * @throws InvalidQuantityError if quantity <= 0
     */
    ChannelMapping record_restock(const std::string& sku, Quantity quantity);

private:
    Database& db_;
    MappingStore& mappings_;
    AuditLog& audit_;
    SkuLockTable& locks_;
};

} // namespace stocksync
