#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>
#include "stocksync/engine.hpp"
#include "stocksync/errors.hpp"

using namespace stocksync;

class LedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine.mappings().create_mapping("SKU-1", std::nullopt, 10);
    }

    SyncEngine engine{":memory:"};
    Ledger& ledger = engine.ledger();
};

// =============================================================================
// adjustInventory Tests
// =============================================================================

TEST_F(LedgerTest, AdjustInventory_NegativeDelta_ShouldRecordSale) {
    // When I apply -3
    auto mapping = ledger.adjust_inventory("SKU-1", -3, "manual correction");

    // Then the total drops and one sale event is appended
    EXPECT_EQ(mapping.total_quantity, 7);
    auto events = engine.audit().events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event_type, EventType::Sale);
    EXPECT_EQ(events[0].platform, "system");
    EXPECT_EQ(events[0].quantity_change, -3);
    EXPECT_EQ(events[0].previous_quantity, 10);
    EXPECT_EQ(events[0].new_quantity, 7);
    EXPECT_EQ(events[0].details, std::optional<std::string>("manual correction"));
    EXPECT_EQ(events[0].id.rfind("sev_", 0), 0u);
}

TEST_F(LedgerTest, AdjustInventory_PositiveDelta_ShouldRecordRestock) {
    auto mapping = ledger.adjust_inventory("SKU-1", 5, "found stock", std::string("shopify"));

    EXPECT_EQ(mapping.total_quantity, 15);
    auto events = engine.audit().events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event_type, EventType::Restock);
    EXPECT_EQ(events[0].platform, "shopify");
}

TEST_F(LedgerTest, AdjustInventory_ZeroDelta_ShouldRecordAdjustment) {
    auto mapping = ledger.adjust_inventory("SKU-1", 0, "count verified");

    EXPECT_EQ(mapping.total_quantity, 10);
    auto events = engine.audit().events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event_type, EventType::Adjustment);
    EXPECT_EQ(events[0].quantity_change, 0);
}

TEST_F(LedgerTest, AdjustInventory_OverLargeNegativeDelta_ShouldFloorAtZero) {
    // When I apply a delta larger than the stock
    auto mapping = ledger.adjust_inventory("SKU-1", -25, "write-off");

    // Then the total floors at 0 and the event keeps the requested delta
    EXPECT_EQ(mapping.total_quantity, 0);
    auto events = engine.audit().events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].quantity_change, -25);
    EXPECT_EQ(events[0].new_quantity, 0);
}

TEST_F(LedgerTest, AdjustInventory_UnknownSku_ShouldThrowNotFoundAndAppendNothing) {
    EXPECT_THROW(ledger.adjust_inventory("NOPE", 1, "x"), NotFoundError);
    EXPECT_TRUE(engine.audit().events().empty());
}

TEST_F(LedgerTest, AdjustInventory_NonFiniteDelta_ShouldThrowInvalidQuantity) {
    EXPECT_THROW(ledger.adjust_inventory("SKU-1", kMaxQuantityMagnitude + 1, "x"),
                 InvalidQuantityError);
    EXPECT_EQ(engine.mappings().require_mapping("SKU-1").total_quantity, 10);
}

// =============================================================================
// recordSale / recordRestock Tests
// =============================================================================

TEST_F(LedgerTest, RecordSale_ShouldDecrementWithSaleReason) {
    auto mapping = ledger.record_sale("SKU-1", "ebay", 4);

    EXPECT_EQ(mapping.total_quantity, 6);
    auto events = engine.audit().events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event_type, EventType::Sale);
    EXPECT_EQ(events[0].platform, "ebay");
    EXPECT_EQ(events[0].details, std::optional<std::string>("Sale of 4 units"));
}

TEST_F(LedgerTest, RecordRestock_ShouldIncrementFromWarehouse) {
    auto mapping = ledger.record_restock("SKU-1", 6);

    EXPECT_EQ(mapping.total_quantity, 16);
    auto events = engine.audit().events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].event_type, EventType::Restock);
    EXPECT_EQ(events[0].platform, "warehouse");
    EXPECT_EQ(events[0].details, std::optional<std::string>("Restock of 6 units"));
}

TEST_F(LedgerTest, SugarForms_NonPositiveQuantity_ShouldThrowInvalidQuantity) {
    EXPECT_THROW(ledger.record_sale("SKU-1", "ebay", 0), InvalidQuantityError);
    EXPECT_THROW(ledger.record_sale("SKU-1", "ebay", -2), InvalidQuantityError);
    EXPECT_THROW(ledger.record_restock("SKU-1", 0), InvalidQuantityError);
    EXPECT_TRUE(engine.audit().events().empty());
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_F(LedgerTest, ConcurrentAdjustments_SameSku_ShouldNotLoseUpdates) {
    // Given a SKU with plenty of stock
    ledger.adjust_inventory("SKU-1", 990, "bulk restock");

    // When eight threads each sell 10 units one at a time
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this] {
            for (int i = 0; i < 10; ++i) {
                ledger.record_sale("SKU-1", "ebay", 1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // Then every sale landed and was audited
    EXPECT_EQ(engine.mappings().require_mapping("SKU-1").total_quantity, 1000 - 80);
    EventFilter sales;
    sales.event_type = EventType::Sale;
    sales.limit = 1000;
    EXPECT_EQ(engine.audit().events(sales).size(), 80u);
}
