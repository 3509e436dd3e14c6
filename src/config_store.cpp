#include "stocksync/config_store.hpp"
#include "stocksync/errors.hpp"
#include "stocksync/helpers.hpp"
#include "stocksync/logging.hpp"
#include <string>

namespace stocksync {

void to_json(nlohmann::json& j, const DaemonConfig& config) {
    j = nlohmann::json{
        {"enabled", config.enabled},
        {"intervalMs", config.interval_ms},
        {"platforms", config.platforms},
        {"bufferStock", config.buffer_stock},
        {"oversellProtection", config.oversell_protection},
        {"maxQuantityPerChannel", nullptr}
    };
    if (config.max_quantity_per_channel) {
        j["maxQuantityPerChannel"] = *config.max_quantity_per_channel;
    }
}

// Keys absent from the stored object keep their defaults.
void from_json(const nlohmann::json& j, DaemonConfig& config) {
    if (j.contains("enabled")) j.at("enabled").get_to(config.enabled);
    if (j.contains("intervalMs")) j.at("intervalMs").get_to(config.interval_ms);
    if (j.contains("platforms")) j.at("platforms").get_to(config.platforms);
    if (j.contains("bufferStock")) j.at("bufferStock").get_to(config.buffer_stock);
    if (j.contains("oversellProtection")) j.at("oversellProtection").get_to(config.oversell_protection);
    if (j.contains("maxQuantityPerChannel")) {
        const auto& cap = j.at("maxQuantityPerChannel");
        if (cap.is_null()) {
            config.max_quantity_per_channel.reset();
        } else {
            config.max_quantity_per_channel = cap.get<Quantity>();
        }
    }
}

DaemonConfig ConfigStore::parse(const std::string& text) {
    try {
        auto j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            throw ConfigurationError("daemon config is not a JSON object");
        }
        DaemonConfig config = j.get<DaemonConfig>();
        validate(config);
        return config;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("malformed daemon config: ") + e.what());
    } catch (const InvalidArgumentError& e) {
        throw ConfigurationError(std::string("invalid daemon config: ") + e.what());
    }
}

void ConfigStore::validate(const DaemonConfig& config) {
    if (config.interval_ms <= 0) {
        throw InvalidArgumentError("intervalMs must be positive");
    }
    if (config.interval_ms > kMaxIntervalMs) {
        throw InvalidArgumentError("intervalMs must not exceed " +
                                   std::to_string(kMaxIntervalMs));
    }
    if (config.buffer_stock < 0 || config.buffer_stock > kMaxQuantityMagnitude) {
        throw InvalidArgumentError("bufferStock must be between 0 and " +
                                   std::to_string(kMaxQuantityMagnitude));
    }
    if (config.max_quantity_per_channel &&
        (*config.max_quantity_per_channel < 0 ||
         *config.max_quantity_per_channel > kMaxQuantityMagnitude)) {
        throw InvalidArgumentError("maxQuantityPerChannel must be between 0 and " +
                                   std::to_string(kMaxQuantityMagnitude));
    }
}

DaemonConfig ConfigStore::load() const {
    auto guard = db_.lock();
    auto stmt = db_.prepare("SELECT config FROM sync_daemon_config WHERE id = ?");
    stmt.bind(1, kConfigId);
    if (!stmt.step()) {
        return DaemonConfig{};
    }
    try {
        return parse(stmt.column_text(0));
    } catch (const ConfigurationError& e) {
        log_warn("config", "daemon_config_fallback_to_defaults", {{"error", e.what()}});
        return DaemonConfig{};
    }
}

void ConfigStore::save(const DaemonConfig& config) {
    validate(config);
    nlohmann::json j = config;

    auto guard = db_.lock();
    auto stmt = db_.prepare(
        "INSERT INTO sync_daemon_config (id, config, enabled, total_syncs, created_at) "
        "VALUES (?, ?, ?, 0, ?) "
        "ON CONFLICT(id) DO UPDATE SET config = excluded.config, enabled = excluded.enabled");
    stmt.bind(1, kConfigId)
        .bind(2, j.dump())
        .bind(3, config.enabled)
        .bind(4, helpers::now_millis());
    stmt.run();
}

DaemonConfig ConfigStore::update(const DaemonConfigUpdate& update) {
    auto guard = db_.lock();
    DaemonConfig merged = merge(load(), update);
    save(merged);
    log_info("config", "daemon_config_updated", {{"config", nlohmann::json(merged)}});
    return merged;
}

void ConfigStore::record_cycle(Millis at) {
    auto guard = db_.lock();
    DaemonConfig current = load();
    nlohmann::json j = current;

    auto stmt = db_.prepare(
        "INSERT INTO sync_daemon_config (id, config, enabled, last_run_at, total_syncs, created_at) "
        "VALUES (?, ?, ?, ?, 1, ?) "
        "ON CONFLICT(id) DO UPDATE SET last_run_at = excluded.last_run_at, "
        "total_syncs = total_syncs + 1");
    stmt.bind(1, kConfigId)
        .bind(2, j.dump())
        .bind(3, current.enabled)
        .bind(4, at)
        .bind(5, at);
    stmt.run();
}

int64_t ConfigStore::total_cycles() const {
    auto guard = db_.lock();
    auto stmt = db_.prepare("SELECT total_syncs FROM sync_daemon_config WHERE id = ?");
    stmt.bind(1, kConfigId);
    return stmt.step() ? stmt.column_int64(0) : 0;
}

std::optional<Millis> ConfigStore::last_run_at() const {
    auto guard = db_.lock();
    auto stmt = db_.prepare("SELECT last_run_at FROM sync_daemon_config WHERE id = ?");
    stmt.bind(1, kConfigId);
    if (!stmt.step()) return std::nullopt;
    return stmt.column_optional_int64(0);
}

} // namespace stocksync
