#pragma once

#include <optional>
#include <vector>
#include "config_store.hpp"
#include "database.hpp"
#include "types.hpp"

namespace stocksync {

/**
 * Append-only log of quantity-affecting events, with filtered queries and
 * aggregate statistics.
 */
class AuditLog {
public:
    static constexpr int kDefaultEventLimit = 200;
    static constexpr int kMaxEventLimit = 1000;
    static constexpr int kDefaultStatsDays = 30;

    AuditLog(Database& db, const ConfigStore& config)
        : db_(db), config_(config) {}

    /**
     * Append an event. The id and created_at of the draft are assigned here
     * when empty / zero.
     * @return The stored event
     */
    SyncEvent append(SyncEvent event);

    /**
     * Events matching the filter, newest first. The limit defaults to 200
     * and is clamped to [1, 1000].
     */
    std::vector<SyncEvent> events(const EventFilter& filter = {}) const;

    /**
     * Aggregate statistics over the last since_days days (default 30).
     */
    SyncStats stats(std::optional<int> since_days = std::nullopt) const;

private:
    Database& db_;
    const ConfigStore& config_;
};

} // namespace stocksync
