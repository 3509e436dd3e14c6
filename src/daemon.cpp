#include "stocksync/daemon.hpp"
#include "stocksync/errors.hpp"
#include "stocksync/helpers.hpp"
#include "stocksync/logging.hpp"
#include <algorithm>
#include <utility>

namespace stocksync {

namespace {

class CycleGuard {
public:
    explicit CycleGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~CycleGuard() { flag_.store(false); }

private:
    std::atomic<bool>& flag_;
};

} // anonymous namespace

ReconciliationDaemon::ReconciliationDaemon(MappingStore& mappings,
                                           DistributionEngine& distribution,
                                           ConfigStore& config)
    : ReconciliationDaemon(mappings, distribution, config, DaemonOptions{}) {}

ReconciliationDaemon::ReconciliationDaemon(MappingStore& mappings,
                                           DistributionEngine& distribution,
                                           ConfigStore& config, DaemonOptions options)
    : mappings_(mappings), distribution_(distribution), config_(config), options_(options) {}

ReconciliationDaemon::~ReconciliationDaemon() {
    std::lock_guard<std::mutex> guard(lifecycle_mutex_);
    halt_locked();
}

DaemonStart ReconciliationDaemon::start(PushFn push, const DaemonConfigUpdate& overrides) {
    std::lock_guard<std::mutex> guard(lifecycle_mutex_);
    if (worker_.joinable()) {
        throw DaemonAlreadyRunningError();
    }
    return start_locked(std::move(push), overrides);
}

DaemonStart ReconciliationDaemon::restart(PushFn push, const DaemonConfigUpdate& overrides) {
    std::lock_guard<std::mutex> guard(lifecycle_mutex_);
    if (worker_.joinable()) {
        log_warn("daemon", "sync_daemon_replaced");
        halt_locked();
    }
    return start_locked(std::move(push), overrides);
}

DaemonStart ReconciliationDaemon::start_locked(PushFn push, const DaemonConfigUpdate& overrides) {
    DaemonConfig config = merge(config_.load(), overrides);
    config.enabled = true;
    config_.save(config);

    DaemonStart started;
    started.config = config;
    started.first_cycle = run_cycle(push, config);

    push_ = std::move(push);
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stop_requested_ = false;
    }
    running_.store(true);
    worker_ = std::thread(&ReconciliationDaemon::run_loop, this);

    auto interval = std::max(std::chrono::milliseconds(config.interval_ms), options_.min_interval);
    log_info("daemon", "sync_daemon_started", {
        {"interval_ms", interval.count()},
        {"buffer_stock", config.buffer_stock},
        {"oversell_protection", config.oversell_protection},
        {"platforms", config.platforms}
    });
    return started;
}

bool ReconciliationDaemon::stop() {
    std::lock_guard<std::mutex> guard(lifecycle_mutex_);
    bool was_running = halt_locked();

    DaemonConfig config = config_.load();
    config.enabled = false;
    config_.save(config);

    if (was_running) {
        log_info("daemon", "sync_daemon_stopped");
    }
    return was_running;
}

bool ReconciliationDaemon::halt_locked() {
    if (!worker_.joinable()) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stop_requested_ = true;
    }
    wake_.notify_all();
    worker_.join();
    running_.store(false);
    return true;
}

void ReconciliationDaemon::run_loop() {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    while (!stop_requested_) {
        DaemonConfig config = config_.load();
        auto interval = std::max(std::chrono::milliseconds(config.interval_ms),
                                 options_.min_interval);
        if (wake_.wait_for(lock, interval, [this] { return stop_requested_; })) {
            break;
        }

        lock.unlock();
        try {
            run_cycle(push_, config_.load());
        } catch (const std::exception& e) {
            log_error("daemon", "sync_cycle_failed", {{"error", e.what()}});
        } catch (...) {
            log_error("daemon", "sync_cycle_failed", {{"error", "unknown exception"}});
        }
        lock.lock();
    }
}

CycleResult ReconciliationDaemon::run_cycle(const PushFn& push, const DaemonConfig& config) {
    CycleResult result;
    bool expected = false;
    if (!cycle_in_progress_.compare_exchange_strong(expected, true)) {
        log_warn("daemon", "sync_cycle_skipped", {{"reason", "previous cycle still running"}});
        result.skipped = true;
        return result;
    }
    CycleGuard in_progress(cycle_in_progress_);

    MappingFilter filter;
    filter.sync_enabled_only = true;
    for (const auto& mapping : mappings_.list_mappings(filter)) {
        ++result.mappings_checked;
        try {
            if (!has_drift(compute_targets(mapping, config))) {
                continue;
            }
            SyncResult synced = distribution_.sync_with_config(mapping.sku, push, config);
            ++result.mappings_synced;
            result.total_pushes += static_cast<int>(std::count_if(
                synced.channels.begin(), synced.channels.end(),
                [](const ChannelSyncResult& c) { return c.pushed; }));
        } catch (const std::exception& e) {
            log_error("daemon", "mapping_sync_failed", {{"sku", mapping.sku}, {"error", e.what()}});
        } catch (...) {
            log_error("daemon", "mapping_sync_failed",
                {{"sku", mapping.sku}, {"error", "unknown exception"}});
        }
    }

    config_.record_cycle(helpers::now_millis());

    log_info("daemon", "sync_cycle_complete", {
        {"mappings_checked", result.mappings_checked},
        {"mappings_synced", result.mappings_synced},
        {"total_pushes", result.total_pushes}
    });
    return result;
}

DaemonStatus ReconciliationDaemon::status() const {
    DaemonStatus status;
    status.running = running_.load();
    status.config = config_.load();
    status.total_cycles = config_.total_cycles();
    status.last_run_at = config_.last_run_at();
    return status;
}

} // namespace stocksync
