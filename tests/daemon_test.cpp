#include <gtest/gtest.h>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "stocksync/engine.hpp"
#include "stocksync/errors.hpp"

using namespace stocksync;
using namespace std::chrono_literals;

// =============================================================================
// Thread-safe recording push function
// =============================================================================

class SharedPublisher {
public:
    PushFn fn() {
        return [this](const std::string& platform, const std::string& listing_id, Quantity quantity) {
            std::lock_guard<std::mutex> lock(mutex_);
            last_[platform + "/" + listing_id] = quantity;
            ++calls_;
            changed_.notify_all();
            return true;
        };
    }

    int calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    bool wait_for_quantity(const std::string& key, Quantity expected,
                           std::chrono::milliseconds timeout = 5s) {
        std::unique_lock<std::mutex> lock(mutex_);
        return changed_.wait_for(lock, timeout, [&] {
            auto it = last_.find(key);
            return it != last_.end() && it->second == expected;
        });
    }

private:
    std::mutex mutex_;
    std::condition_variable changed_;
    std::map<std::string, Quantity> last_;
    int calls_ = 0;
};

class DaemonTest : public ::testing::Test {
protected:
    static DaemonOptions fast() {
        DaemonOptions options;
        options.min_interval = 10ms;
        return options;
    }

    void link(const std::string& sku, Quantity total, const std::string& platform) {
        engine.mappings().create_mapping(sku, std::nullopt, total);
        engine.mappings().add_channel(sku, platform, platform + "-" + sku);
    }

    static DaemonConfigUpdate every_millisecond() {
        DaemonConfigUpdate update;
        update.interval_ms = 1;
        return update;
    }

    SharedPublisher publisher;
    SyncEngine engine{":memory:", fast()};
    ReconciliationDaemon& daemon = engine.daemon();
};

// =============================================================================
// Lifecycle Tests
// =============================================================================

TEST_F(DaemonTest, Start_ShouldRunFirstCycleAndPersistEnabled) {
    // Given one mapping that has never been pushed
    link("SKU-1", 6, "ebay");

    // When I start the daemon with overrides
    DaemonConfigUpdate overrides;
    overrides.buffer_stock = 1;
    auto started = daemon.start(publisher.fn(), overrides);

    // Then the first cycle already reconciled it
    EXPECT_TRUE(daemon.is_running());
    EXPECT_EQ(started.first_cycle.mappings_checked, 1);
    EXPECT_EQ(started.first_cycle.mappings_synced, 1);
    EXPECT_EQ(started.first_cycle.total_pushes, 1);
    EXPECT_TRUE(publisher.wait_for_quantity("ebay/ebay-SKU-1", 5, 0ms));

    // And the merged configuration is persisted as enabled
    auto persisted = engine.config().load();
    EXPECT_TRUE(persisted.enabled);
    EXPECT_EQ(persisted.buffer_stock, 1);
    EXPECT_EQ(started.config.buffer_stock, 1);

    EXPECT_TRUE(daemon.stop());
}

TEST_F(DaemonTest, Start_WhenRunning_ShouldThrowDaemonAlreadyRunning) {
    daemon.start(publisher.fn());

    EXPECT_THROW(daemon.start(publisher.fn()), DaemonAlreadyRunningError);
    EXPECT_TRUE(daemon.is_running());

    daemon.stop();
}

TEST_F(DaemonTest, Start_InvalidOverride_ShouldThrowAndStayStopped) {
    DaemonConfigUpdate overrides;
    overrides.interval_ms = 0;

    EXPECT_THROW(daemon.start(publisher.fn(), overrides), InvalidArgumentError);
    EXPECT_FALSE(daemon.is_running());
}

TEST_F(DaemonTest, Restart_ShouldReplaceTheRunningLoop) {
    daemon.start(publisher.fn());

    DaemonConfigUpdate overrides;
    overrides.buffer_stock = 3;
    auto restarted = daemon.restart(publisher.fn(), overrides);

    EXPECT_TRUE(daemon.is_running());
    EXPECT_EQ(restarted.config.buffer_stock, 3);
    EXPECT_EQ(engine.config().load().buffer_stock, 3);

    daemon.stop();
}

TEST_F(DaemonTest, Stop_ShouldBeIdempotentAndPersistDisabled) {
    daemon.start(publisher.fn());

    EXPECT_TRUE(daemon.stop());
    EXPECT_FALSE(daemon.is_running());
    EXPECT_FALSE(engine.config().load().enabled);

    EXPECT_FALSE(daemon.stop());
}

TEST_F(DaemonTest, Stop_ThenStart_ShouldRunAgain) {
    daemon.start(publisher.fn());
    daemon.stop();

    EXPECT_NO_THROW(daemon.start(publisher.fn()));
    EXPECT_TRUE(daemon.is_running());
    daemon.stop();
}

TEST_F(DaemonTest, Status_ShouldReportRunningConfigAndCycles) {
    link("SKU-1", 2, "ebay");
    daemon.start(publisher.fn());

    auto status = daemon.status();
    EXPECT_TRUE(status.running);
    EXPECT_TRUE(status.config.enabled);
    EXPECT_GE(status.total_cycles, 1);
    EXPECT_TRUE(status.last_run_at.has_value());

    daemon.stop();
    EXPECT_FALSE(daemon.status().running);
}

// =============================================================================
// Cycle Tests
// =============================================================================

TEST_F(DaemonTest, RunCycle_ShouldOnlySyncDriftedMappings) {
    // Given two mappings, one already converged
    link("SKU-1", 4, "ebay");
    link("SKU-2", 4, "amazon");
    engine.distribution().sync_to_channels("SKU-1", publisher.fn());
    int calls_before = publisher.calls();

    // When a cycle runs
    auto result = daemon.run_cycle(publisher.fn(), engine.config().load());

    // Then only the drifted one is pushed
    EXPECT_EQ(result.mappings_checked, 2);
    EXPECT_EQ(result.mappings_synced, 1);
    EXPECT_EQ(result.total_pushes, 1);
    EXPECT_EQ(publisher.calls(), calls_before + 1);
    EXPECT_TRUE(publisher.wait_for_quantity("amazon/amazon-SKU-2", 4, 0ms));
}

TEST_F(DaemonTest, RunCycle_ShouldIgnoreDisabledMappings) {
    link("SKU-1", 4, "ebay");
    engine.mappings().set_sync_enabled("SKU-1", false);

    auto result = daemon.run_cycle(publisher.fn(), engine.config().load());

    EXPECT_EQ(result.mappings_checked, 0);
    EXPECT_EQ(publisher.calls(), 0);
}

TEST_F(DaemonTest, RunCycle_ConvergedMappings_ShouldPushNothing) {
    link("SKU-1", 4, "ebay");
    daemon.run_cycle(publisher.fn(), engine.config().load());
    int calls_before = publisher.calls();

    auto result = daemon.run_cycle(publisher.fn(), engine.config().load());

    EXPECT_EQ(result.mappings_checked, 1);
    EXPECT_EQ(result.mappings_synced, 0);
    EXPECT_EQ(publisher.calls(), calls_before);
}

TEST_F(DaemonTest, RunCycle_ShouldIncrementTheCycleCounter) {
    daemon.run_cycle(publisher.fn(), engine.config().load());
    daemon.run_cycle(publisher.fn(), engine.config().load());

    EXPECT_EQ(engine.config().total_cycles(), 2);
    EXPECT_EQ(engine.audit().stats().total_syncs, 2);
}

TEST_F(DaemonTest, RunCycle_PushThrowingNonStandardException_ShouldCompleteTheCycle) {
    link("SKU-1", 4, "ebay");
    link("SKU-2", 4, "amazon");
    PushFn odd_push = [](const std::string&, const std::string&, Quantity) -> bool {
        throw 42;
    };

    CycleResult result;
    EXPECT_NO_THROW(result = daemon.run_cycle(odd_push, engine.config().load()));

    EXPECT_EQ(result.mappings_checked, 2);
    EXPECT_EQ(result.mappings_synced, 2);
    EXPECT_EQ(engine.config().total_cycles(), 1);
    EXPECT_EQ(engine.audit().stats().total_errors, 2);
}

TEST_F(DaemonTest, OverlappingCycle_ShouldBeSkipped) {
    // Given a cycle blocked inside its push call
    link("SKU-1", 4, "ebay");
    std::mutex mutex;
    std::condition_variable cv;
    bool entered = false;
    bool release = false;
    PushFn blocking = [&](const std::string&, const std::string&, Quantity) {
        std::unique_lock<std::mutex> lock(mutex);
        entered = true;
        cv.notify_all();
        cv.wait(lock, [&] { return release; });
        return true;
    };
    std::thread first([&] { daemon.run_cycle(blocking, engine.config().load()); });
    {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [&] { return entered; });
    }

    // When another cycle is invoked
    auto overlapping = daemon.run_cycle(publisher.fn(), engine.config().load());

    // Then it is skipped without touching anything
    EXPECT_TRUE(overlapping.skipped);
    EXPECT_EQ(overlapping.mappings_checked, 0);
    EXPECT_EQ(publisher.calls(), 0);

    {
        std::lock_guard<std::mutex> lock(mutex);
        release = true;
    }
    cv.notify_all();
    first.join();
    EXPECT_EQ(engine.config().total_cycles(), 1);
}

TEST_F(DaemonTest, Worker_ShouldReconcileAfterASale) {
    // Given a running daemon ticking at the floor interval
    link("SKU-1", 10, "ebay");
    daemon.start(publisher.fn(), every_millisecond());
    ASSERT_TRUE(publisher.wait_for_quantity("ebay/ebay-SKU-1", 10, 0ms));

    // When units sell
    engine.ledger().record_sale("SKU-1", "ebay", 3);

    // Then a later tick pushes the new target
    EXPECT_TRUE(publisher.wait_for_quantity("ebay/ebay-SKU-1", 7));
    daemon.stop();
}
