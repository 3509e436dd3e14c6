#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include "config_store.hpp"
#include "distribution.hpp"
#include "mapping_store.hpp"
#include "types.hpp"

namespace stocksync {

struct DaemonOptions {
    /// Lower bound on the tick interval, whatever the configuration says.
    std::chrono::milliseconds min_interval{5000};
};

/**
 * Result of arming the daemon: the persisted effective configuration and
 * the first cycle, which runs synchronously.
 */
struct DaemonStart {
    DaemonConfig config;
    CycleResult first_cycle;
};

/**
 * Background reconciliation loop. Owned by the process entry point; at most
 * one worker thread per instance.
 *
 * Each cycle scans sync-enabled mappings and runs a distribution pass only
 * for mappings whose computed targets differ from what was last pushed.
 */
class ReconciliationDaemon {
public:
    ReconciliationDaemon(MappingStore& mappings, DistributionEngine& distribution,
                         ConfigStore& config);
    ReconciliationDaemon(MappingStore& mappings, DistributionEngine& distribution,
                         ConfigStore& config, DaemonOptions options);

    /// Stops the worker without changing the persisted enabled flag.
    ~ReconciliationDaemon();

    ReconciliationDaemon(const ReconciliationDaemon&) = delete;
    ReconciliationDaemon& operator=(const ReconciliationDaemon&) = delete;

    /**
     * Persist the merged configuration with enabled = true, run one cycle
     * and arm the worker.
     * @throws DaemonAlreadyRunningError if the worker is already armed
     * @throws InvalidArgumentError if the merged configuration is invalid
     */
    DaemonStart start(PushFn push, const DaemonConfigUpdate& overrides = {});

    /**
     * Stop any running worker, then start.
     */
    DaemonStart restart(PushFn push, const DaemonConfigUpdate& overrides = {});

    /**
     * Cancel future ticks, wait for an in-flight cycle and persist
     * enabled = false. Idempotent.
     * @return true if a worker was running
     */
    bool stop();

    bool is_running() const { return running_.load(); }

    /**
     * One reconciliation cycle. Returns a result with skipped set when
     * another cycle is still in progress.
     */
    CycleResult run_cycle(const PushFn& push, const DaemonConfig& config);

    DaemonStatus status() const;

private:
    DaemonStart start_locked(PushFn push, const DaemonConfigUpdate& overrides);
    bool halt_locked();
    void run_loop();

    MappingStore& mappings_;
    DistributionEngine& distribution_;
    ConfigStore& config_;
    DaemonOptions options_;

    std::mutex lifecycle_mutex_;
    std::thread worker_;
    PushFn push_;
    std::atomic<bool> running_{false};
    std::atomic<bool> cycle_in_progress_{false};

    std::mutex wake_mutex_;
    std::condition_variable wake_;
    bool stop_requested_ = false;
};

} // namespace stocksync
