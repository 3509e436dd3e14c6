#pragma once

#include <string>
#include "audit_log.hpp"
#include "config_store.hpp"
#include "daemon.hpp"
#include "database.hpp"
#include "distribution.hpp"
#include "ledger.hpp"
#include "mapping_store.hpp"
#include "sku_locks.hpp"

namespace stocksync {

/**
 * Owns one database and every component wired on top of it.
 *
 * Example:
 *   SyncEngine engine(":memory:");
 *   engine.mappings().create_mapping("SKU-1", std::nullopt, 10);
 *   engine.mappings().add_channel("SKU-1", "ebay", "E1");
 *   engine.distribution().sync_to_channels("SKU-1", dry_run_push_fn());
 */
class SyncEngine {
public:
    explicit SyncEngine(const std::string& db_path, DaemonOptions options = DaemonOptions{})
        : db_(db_path),
          config_(db_),
          mappings_(db_, config_),
          audit_(db_, config_),
          ledger_(db_, mappings_, audit_, locks_),
          distribution_(db_, mappings_, audit_, config_, locks_),
          daemon_(mappings_, distribution_, config_, options) {}

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    Database& database() { return db_; }
    ConfigStore& config() { return config_; }
    MappingStore& mappings() { return mappings_; }
    AuditLog& audit() { return audit_; }
    Ledger& ledger() { return ledger_; }
    DistributionEngine& distribution() { return distribution_; }
    ReconciliationDaemon& daemon() { return daemon_; }

private:
    Database db_;
    SkuLockTable locks_;
    ConfigStore config_;
    MappingStore mappings_;
    AuditLog audit_;
    Ledger ledger_;
    DistributionEngine distribution_;
    ReconciliationDaemon daemon_;
};

} // namespace stocksync
