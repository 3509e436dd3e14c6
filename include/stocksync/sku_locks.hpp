#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace stocksync {

/**
 * One mutex per SKU. Ledger adjustments, distribution passes and pull
 * reports for the same SKU serialise on it; different SKUs do not contend.
 *
 * Entries are never evicted: mappings are never deleted, so the table is
 * bounded by the number of SKUs.
 */
class SkuLockTable {
public:
    std::unique_lock<std::mutex> lock(const std::string& sku) {
        std::shared_ptr<std::mutex> sku_mutex;
        {
            std::lock_guard<std::mutex> guard(table_mutex_);
            auto& slot = mutexes_[sku];
            if (!slot) slot = std::make_shared<std::mutex>();
            sku_mutex = slot;
        }
        return std::unique_lock<std::mutex>(*sku_mutex);
    }

private:
    std::mutex table_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> mutexes_;
};

} // namespace stocksync
