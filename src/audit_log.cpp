#include "stocksync/audit_log.hpp"
#include "stocksync/helpers.hpp"
#include <algorithm>
#include <string>

namespace stocksync {

SyncEvent AuditLog::append(SyncEvent event) {
    if (event.id.empty()) {
        event.id = helpers::generate_id("sev");
    }
    if (event.created_at == 0) {
        event.created_at = helpers::now_millis();
    }

    auto guard = db_.lock();
    auto stmt = db_.prepare(
        "INSERT INTO sync_events "
        "(id, sku, event_type, platform, quantity_change, previous_quantity, new_quantity, "
        "details, oversell, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    stmt.bind(1, event.id)
        .bind(2, event.sku)
        .bind(3, to_string(event.event_type))
        .bind(4, event.platform)
        .bind(5, event.quantity_change)
        .bind(6, event.previous_quantity)
        .bind(7, event.new_quantity)
        .bind(8, event.details)
        .bind(9, event.oversell)
        .bind(10, event.created_at);
    stmt.run();
    return event;
}

std::vector<SyncEvent> AuditLog::events(const EventFilter& filter) const {
    std::string sql =
        "SELECT id, sku, event_type, platform, quantity_change, previous_quantity, "
        "new_quantity, details, oversell, created_at FROM sync_events WHERE 1 = 1";
    if (filter.sku) sql += " AND sku = ?";
    if (filter.event_type) sql += " AND event_type = ?";
    if (filter.since_days) sql += " AND created_at >= ?";
    sql += " ORDER BY created_at DESC, rowid DESC LIMIT ?";

    int limit = std::clamp(filter.limit.value_or(kDefaultEventLimit), 1, kMaxEventLimit);

    auto guard = db_.lock();
    auto stmt = db_.prepare(sql);
    int index = 1;
    if (filter.sku) stmt.bind(index++, *filter.sku);
    if (filter.event_type) stmt.bind(index++, to_string(*filter.event_type));
    if (filter.since_days) stmt.bind(index++, helpers::days_ago(*filter.since_days));
    stmt.bind(index, limit);

    std::vector<SyncEvent> result;
    while (stmt.step()) {
        SyncEvent event;
        event.id = stmt.column_text(0);
        event.sku = stmt.column_text(1);
        event.event_type = parse_event_type(stmt.column_text(2)).value_or(EventType::Adjustment);
        event.platform = stmt.column_text(3);
        event.quantity_change = stmt.column_int64(4);
        event.previous_quantity = stmt.column_int64(5);
        event.new_quantity = stmt.column_int64(6);
        event.details = stmt.column_optional_text(7);
        event.oversell = stmt.column_int64(8) != 0;
        event.created_at = stmt.column_int64(9);
        result.push_back(std::move(event));
    }
    return result;
}

SyncStats AuditLog::stats(std::optional<int> since_days) const {
    Millis since = helpers::days_ago(since_days.value_or(kDefaultStatsDays));
    SyncStats stats;

    auto guard = db_.lock();
    {
        auto stmt = db_.prepare(
            "SELECT event_type, COUNT(*), SUM(oversell) FROM sync_events "
            "WHERE created_at >= ? GROUP BY event_type");
        stmt.bind(1, since);
        while (stmt.step()) {
            auto type = parse_event_type(stmt.column_text(0));
            int64_t count = stmt.column_int64(1);
            if (!type) continue;
            switch (*type) {
                case EventType::Sale: stats.total_sales = count; break;
                case EventType::Restock: stats.total_restocks = count; break;
                case EventType::Adjustment: stats.total_adjustments = count; break;
                case EventType::SyncPush: stats.total_pushes = count; break;
                case EventType::SyncPull: stats.total_pulls = count; break;
                case EventType::Error:
                    stats.total_errors = count;
                    stats.oversell_incidents = stmt.column_int64(2);
                    break;
            }
        }
    }
    {
        auto stmt = db_.prepare(
            "SELECT strftime('%Y-%m-%d', created_at / 1000, 'unixepoch') AS day, COUNT(*) "
            "FROM sync_events WHERE created_at >= ? GROUP BY day ORDER BY day DESC");
        stmt.bind(1, since);
        while (stmt.step()) {
            stats.events_by_day.push_back(DayCount{stmt.column_text(0), stmt.column_int64(1)});
        }
    }

    stats.total_syncs = config_.total_cycles();
    stats.last_run_at = config_.last_run_at();
    return stats;
}

} // namespace stocksync
