#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "database.hpp"
#include "types.hpp"

namespace stocksync {

void to_json(nlohmann::json& j, const DaemonConfig& config);
void from_json(const nlohmann::json& j, DaemonConfig& config);

/**
 * Persisted singleton daemon configuration (row id "default") and the
 * daemon's lifetime cycle counter.
 */
class ConfigStore {
public:
    static constexpr const char* kConfigId = "default";
    /// Longest accepted tick interval (24 h).
    static constexpr Millis kMaxIntervalMs = 24LL * 60 * 60 * 1000;

    explicit ConfigStore(Database& db) : db_(db) {}

    /**
     * Load the persisted configuration. A missing row yields defaults; a
     * malformed one is logged and also yields defaults.
     */
    DaemonConfig load() const;

    /**
     * Insert or replace the persisted configuration.
     * @throws InvalidArgumentError if a field is out of range
     */
    void save(const DaemonConfig& config);

    /**
     * Merge an update into the persisted configuration and save it.
     * @return The merged configuration
     */
    DaemonConfig update(const DaemonConfigUpdate& update);

    /**
     * Count one completed reconciliation cycle.
     */
    void record_cycle(Millis at);

    int64_t total_cycles() const;
    std::optional<Millis> last_run_at() const;

    /**
     * Throws InvalidArgumentError unless every field is in range.
     */
    static void validate(const DaemonConfig& config);

private:
    /// Throws ConfigurationError when the stored JSON cannot be used.
    static DaemonConfig parse(const std::string& text);

    Database& db_;
};

} // namespace stocksync
