#include <gtest/gtest.h>
#include <string>
#include "stocksync/engine.hpp"
#include "stocksync/helpers.hpp"

using namespace stocksync;

class AuditLogTest : public ::testing::Test {
protected:
    SyncEvent event(const std::string& sku, EventType type, Millis created_at,
                    bool oversell = false) {
        SyncEvent e;
        e.sku = sku;
        e.event_type = type;
        e.platform = "ebay";
        e.created_at = created_at;
        e.oversell = oversell;
        return e;
    }

    SyncEngine engine{":memory:"};
    AuditLog& audit = engine.audit();
};

// =============================================================================
// append Tests
// =============================================================================

TEST_F(AuditLogTest, Append_ShouldAssignIdAndTimestamp) {
    SyncEvent draft;
    draft.sku = "SKU-1";
    draft.event_type = EventType::Restock;
    draft.platform = "warehouse";
    draft.quantity_change = 5;
    draft.new_quantity = 5;

    auto stored = audit.append(draft);

    EXPECT_EQ(stored.id.rfind("sev_", 0), 0u);
    EXPECT_GT(stored.created_at, 0);
    auto events = audit.events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].id, stored.id);
    EXPECT_EQ(events[0].event_type, EventType::Restock);
    EXPECT_FALSE(events[0].details.has_value());
}

// =============================================================================
// getEvents Tests
// =============================================================================

TEST_F(AuditLogTest, Events_ShouldReturnNewestFirst) {
    Millis now = helpers::now_millis();
    audit.append(event("SKU-1", EventType::Sale, now - 3000));
    audit.append(event("SKU-1", EventType::Restock, now - 1000));
    audit.append(event("SKU-1", EventType::Adjustment, now - 2000));

    auto events = audit.events();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].event_type, EventType::Restock);
    EXPECT_EQ(events[1].event_type, EventType::Adjustment);
    EXPECT_EQ(events[2].event_type, EventType::Sale);
}

TEST_F(AuditLogTest, Events_ShouldFilterBySkuTypeAndAge) {
    // Given events across SKUs, types and days
    Millis now = helpers::now_millis();
    audit.append(event("SKU-1", EventType::Sale, now));
    audit.append(event("SKU-2", EventType::Sale, now));
    audit.append(event("SKU-1", EventType::SyncPush, now));
    audit.append(event("SKU-1", EventType::Sale, now - 10 * helpers::kMillisPerDay));

    // Then each filter narrows the result
    EventFilter by_sku;
    by_sku.sku = "SKU-1";
    EXPECT_EQ(audit.events(by_sku).size(), 3u);

    EventFilter by_type;
    by_type.sku = "SKU-1";
    by_type.event_type = EventType::Sale;
    EXPECT_EQ(audit.events(by_type).size(), 2u);

    EventFilter recent;
    recent.event_type = EventType::Sale;
    recent.since_days = 7;
    EXPECT_EQ(audit.events(recent).size(), 2u);
}

TEST_F(AuditLogTest, Events_ShouldClampTheLimit) {
    Millis now = helpers::now_millis();
    for (int i = 0; i < 5; ++i) {
        audit.append(event("SKU-1", EventType::Sale, now - i));
    }

    EventFilter zero;
    zero.limit = 0;
    EXPECT_EQ(audit.events(zero).size(), 1u);

    EventFilter two;
    two.limit = 2;
    EXPECT_EQ(audit.events(two).size(), 2u);

    EventFilter huge;
    huge.limit = 5000;
    EXPECT_EQ(audit.events(huge).size(), 5u);
}

TEST_F(AuditLogTest, Events_DefaultLimit_ShouldBeTwoHundred) {
    Millis now = helpers::now_millis();
    for (int i = 0; i < 205; ++i) {
        audit.append(event("SKU-1", EventType::SyncPush, now - i));
    }
    EXPECT_EQ(audit.events().size(), 200u);
}

// =============================================================================
// getStats Tests
// =============================================================================

TEST_F(AuditLogTest, Stats_ShouldCountEachTypeInWindow) {
    // Given a mix of events, one outside the default window
    Millis now = helpers::now_millis();
    audit.append(event("SKU-1", EventType::Sale, now));
    audit.append(event("SKU-1", EventType::Sale, now));
    audit.append(event("SKU-1", EventType::Restock, now));
    audit.append(event("SKU-1", EventType::Adjustment, now));
    audit.append(event("SKU-1", EventType::SyncPush, now));
    audit.append(event("SKU-1", EventType::SyncPull, now));
    audit.append(event("SKU-1", EventType::Error, now));
    audit.append(event("SKU-1", EventType::Error, now, true));
    audit.append(event("SKU-1", EventType::Sale, now - 40 * helpers::kMillisPerDay));

    auto stats = audit.stats();

    EXPECT_EQ(stats.total_sales, 2);
    EXPECT_EQ(stats.total_restocks, 1);
    EXPECT_EQ(stats.total_adjustments, 1);
    EXPECT_EQ(stats.total_pushes, 1);
    EXPECT_EQ(stats.total_pulls, 1);
    EXPECT_EQ(stats.total_errors, 2);
    EXPECT_EQ(stats.oversell_incidents, 1);
    EXPECT_EQ(stats.total_syncs, 0);
    EXPECT_FALSE(stats.last_run_at.has_value());

    // And a wider window includes the old sale
    EXPECT_EQ(audit.stats(60).total_sales, 3);
}

TEST_F(AuditLogTest, Stats_ShouldGroupByUtcDayNewestFirst) {
    Millis now = helpers::now_millis();
    Millis yesterday = now - helpers::kMillisPerDay;
    audit.append(event("SKU-1", EventType::Sale, now));
    audit.append(event("SKU-1", EventType::Sale, now));
    audit.append(event("SKU-1", EventType::Sale, yesterday));

    auto stats = audit.stats();

    ASSERT_EQ(stats.events_by_day.size(), 2u);
    EXPECT_EQ(stats.events_by_day[0].date, helpers::iso8601(now).substr(0, 10));
    EXPECT_EQ(stats.events_by_day[0].count, 2);
    EXPECT_EQ(stats.events_by_day[1].date, helpers::iso8601(yesterday).substr(0, 10));
    EXPECT_EQ(stats.events_by_day[1].count, 1);
}

TEST_F(AuditLogTest, Stats_ShouldIncludeTheDaemonCycleCounter) {
    engine.config().record_cycle(1234);

    auto stats = audit.stats();

    EXPECT_EQ(stats.total_syncs, 1);
    EXPECT_EQ(stats.last_run_at, std::optional<Millis>(1234));
}

// =============================================================================
// Audit completeness
// =============================================================================

TEST_F(AuditLogTest, EveryQuantityChange_ShouldLeaveOneEvent) {
    // Given a linked SKU
    engine.mappings().create_mapping("SKU-1", std::nullopt, 10);
    engine.mappings().add_channel("SKU-1", "ebay", "E1");
    engine.mappings().add_channel("SKU-1", "amazon", "A1");
    PushFn accept_ebay_only = [](const std::string& platform, const std::string&, Quantity) {
        return platform == "ebay";
    };

    // When stock moves and is distributed
    engine.ledger().record_sale("SKU-1", "ebay", 2);
    engine.ledger().record_restock("SKU-1", 1);
    engine.distribution().sync_to_channels("SKU-1", accept_ebay_only);

    // Then two ledger events, one push and one error were recorded
    auto stats = audit.stats();
    EXPECT_EQ(stats.total_sales, 1);
    EXPECT_EQ(stats.total_restocks, 1);
    EXPECT_EQ(stats.total_pushes, 1);
    EXPECT_EQ(stats.total_errors, 1);
    EXPECT_EQ(stats.oversell_incidents, 0);
}
