#include "inventory_sync_service.hpp"
#include "proto_convert.hpp"
#include "stocksync/errors.hpp"
#include "stocksync/logging.hpp"
#include <grpcpp/grpcpp.h>
#include <cmath>
#include <utility>

namespace stocksync {

namespace {

template <typename T>
std::optional<T> optional_field(bool present, T value) {
    return present ? std::optional<T>(std::move(value)) : std::nullopt;
}

} // anonymous namespace

class InventorySyncService final : public v1::InventorySync::Service {
public:
    InventorySyncService(SyncEngine& engine, PushFn push)
        : engine_(engine), push_(std::move(push)) {}

    grpc::Status CreateMapping(grpc::ServerContext*, const v1::CreateMappingRequest* request,
                               v1::ChannelMapping* response) override {
        return guarded("create_mapping", [&] {
            auto mapping = engine_.mappings().create_mapping(
                request->sku(),
                optional_field(request->has_product_id(), request->product_id()),
                request->has_total_quantity() ? request->total_quantity() : 0);
            to_proto(mapping, response);
        });
    }

    grpc::Status AddChannel(grpc::ServerContext*, const v1::AddChannelRequest* request,
                            v1::ChannelEntry* response) override {
        return guarded("add_channel", [&] {
            auto entry = engine_.mappings().add_channel(
                request->sku(), request->platform(), request->listing_id(),
                optional_field(request->has_platform_sku(), request->platform_sku()));
            to_proto(entry, response);
        });
    }

    grpc::Status RemoveChannel(grpc::ServerContext*, const v1::RemoveChannelRequest* request,
                               v1::RemoveChannelResponse* response) override {
        return guarded("remove_channel", [&] {
            auto removed = engine_.mappings().remove_channel(request->platform(),
                                                             request->listing_id());
            response->set_removed(true);
            response->set_platform(removed.entry.platform);
            response->set_listing_id(removed.entry.listing_id);
        });
    }

    grpc::Status GetMapping(grpc::ServerContext*, const v1::GetMappingRequest* request,
                            v1::ChannelMapping* response) override {
        return guarded("get_mapping", [&] {
            to_proto(engine_.mappings().require_mapping(request->sku()), response);
        });
    }

    grpc::Status ListMappings(grpc::ServerContext*, const v1::ListMappingsRequest* request,
                              v1::ListMappingsResponse* response) override {
        return guarded("list_mappings", [&] {
            MappingFilter filter;
            filter.sync_enabled_only = request->sync_enabled_only();
            filter.limit = optional_field(request->has_limit(), request->limit());
            filter.offset = optional_field(request->has_offset(), request->offset());

            auto mappings = engine_.mappings().list_mappings(filter);
            response->set_count(static_cast<int32_t>(mappings.size()));
            response->set_daemon_running(engine_.daemon().is_running());
            to_proto(engine_.config().load(), response->mutable_config());
            for (const auto& mapping : mappings) {
                to_proto(mapping, response->add_mappings());
            }
        });
    }

    grpc::Status SetSyncEnabled(grpc::ServerContext*, const v1::SetSyncEnabledRequest* request,
                                v1::ChannelMapping* response) override {
        return guarded("set_sync_enabled", [&] {
            to_proto(engine_.mappings().set_sync_enabled(request->sku(), request->enabled()),
                     response);
        });
    }

    grpc::Status AdjustInventory(grpc::ServerContext*, const v1::AdjustInventoryRequest* request,
                                 v1::ChannelMapping* response) override {
        return guarded("adjust_inventory", [&] {
            auto mapping = engine_.ledger().adjust_inventory(
                request->sku(), request->delta(), request->reason(),
                optional_field(request->has_platform(), request->platform()));
            to_proto(mapping, response);
        });
    }

    grpc::Status RecordSale(grpc::ServerContext*, const v1::RecordSaleRequest* request,
                            v1::ChannelMapping* response) override {
        return guarded("record_sale", [&] {
            to_proto(engine_.ledger().record_sale(request->sku(), request->platform(),
                                                  request->quantity()),
                     response);
        });
    }

    grpc::Status RecordRestock(grpc::ServerContext*, const v1::RecordRestockRequest* request,
                               v1::ChannelMapping* response) override {
        return guarded("record_restock", [&] {
            to_proto(engine_.ledger().record_restock(request->sku(), request->quantity()),
                     response);
        });
    }

    grpc::Status SyncNow(grpc::ServerContext*, const v1::SyncNowRequest* request,
                         v1::SyncResult* response) override {
        return guarded("sync_now", [&] {
            to_proto(engine_.distribution().sync_to_channels(request->sku(), push_), response);
        });
    }

    grpc::Status ReportChannelQuantity(grpc::ServerContext*,
                                       const v1::ReportChannelQuantityRequest* request,
                                       v1::ChannelEntry* response) override {
        return guarded("report_channel_quantity", [&] {
            to_proto(engine_.distribution().report_channel_quantity(
                         request->platform(), request->listing_id(), request->quantity()),
                     response);
        });
    }

    grpc::Status StartDaemon(grpc::ServerContext*, const v1::StartDaemonRequest* request,
                             v1::StartDaemonResponse* response) override {
        return guarded("start_daemon", [&] {
            DaemonConfigUpdate overrides;
            if (request->has_interval_minutes()) {
                overrides.interval_ms = interval_from_minutes(request->interval_minutes());
            }
            if (request->has_buffer_stock()) overrides.buffer_stock = request->buffer_stock();
            if (request->has_oversell_protection()) {
                overrides.oversell_protection = request->oversell_protection();
            }
            if (request->has_max_per_channel()) {
                overrides.max_quantity_per_channel = request->max_per_channel();
            }
            if (request->set_platforms() || request->platforms_size() > 0) {
                overrides.platforms = std::vector<std::string>(request->platforms().begin(),
                                                               request->platforms().end());
            }

            auto started = engine_.daemon().start(push_, overrides);

            MappingFilter enabled_only;
            enabled_only.sync_enabled_only = true;
            response->set_started(true);
            response->set_enabled_mappings(
                static_cast<int32_t>(engine_.mappings().list_mappings(enabled_only).size()));
            to_proto(started.config, response->mutable_config());
            to_proto(started.first_cycle, response->mutable_first_cycle());
        });
    }

    grpc::Status StopDaemon(grpc::ServerContext*, const v1::StopDaemonRequest*,
                            v1::StopDaemonResponse* response) override {
        return guarded("stop_daemon", [&] {
            bool was_running = engine_.daemon().stop();
            response->set_stopped(true);
            response->set_was_running(was_running);
        });
    }

    grpc::Status GetDaemonStatus(grpc::ServerContext*, const v1::GetDaemonStatusRequest*,
                                 v1::DaemonStatus* response) override {
        return guarded("get_daemon_status", [&] {
            to_proto(engine_.daemon().status(), response);
        });
    }

    grpc::Status UpdateDaemonConfig(grpc::ServerContext*,
                                    const v1::UpdateDaemonConfigRequest* request,
                                    v1::DaemonConfig* response) override {
        return guarded("update_daemon_config", [&] {
            DaemonConfigUpdate update;
            update.enabled = optional_field(request->has_enabled(), request->enabled());
            update.interval_ms = optional_field(request->has_interval_ms(), request->interval_ms());
            update.buffer_stock = optional_field(request->has_buffer_stock(), request->buffer_stock());
            update.oversell_protection = optional_field(request->has_oversell_protection(),
                                                        request->oversell_protection());
            update.max_quantity_per_channel = optional_field(
                request->has_max_quantity_per_channel(), request->max_quantity_per_channel());
            update.clear_max_quantity_per_channel = request->clear_max_quantity_per_channel();
            if (request->set_platforms() || request->platforms_size() > 0) {
                update.platforms = std::vector<std::string>(request->platforms().begin(),
                                                            request->platforms().end());
            }
            to_proto(engine_.config().update(update), response);
        });
    }

    grpc::Status GetEvents(grpc::ServerContext*, const v1::GetEventsRequest* request,
                           v1::GetEventsResponse* response) override {
        return guarded("get_events", [&] {
            EventFilter filter;
            filter.sku = optional_field(request->has_sku(), request->sku());
            if (request->has_event_type()) {
                auto type = parse_event_type(request->event_type());
                if (!type) {
                    throw InvalidArgumentError("Unknown event type: " + request->event_type());
                }
                filter.event_type = type;
            }
            if (request->has_days()) filter.since_days = positive_days(request->days());
            filter.limit = optional_field(request->has_limit(), request->limit());

            auto events = engine_.audit().events(filter);
            response->set_count(static_cast<int32_t>(events.size()));
            for (const auto& event : events) {
                to_proto(event, response->add_events());
            }
        });
    }

    grpc::Status GetStats(grpc::ServerContext*, const v1::GetStatsRequest* request,
                          v1::GetStatsResponse* response) override {
        return guarded("get_stats", [&] {
            std::optional<int> days;
            if (request->has_days()) days = positive_days(request->days());
            response->set_daemon_running(engine_.daemon().is_running());
            to_proto(engine_.config().load(), response->mutable_config());
            to_proto(engine_.audit().stats(days), response->mutable_stats());
        });
    }

private:
    template <typename Fn>
    grpc::Status guarded(const char* operation, Fn&& fn) {
        try {
            fn();
            return grpc::Status::OK;
        } catch (const SyncError& e) {
            log_warn("inventory_sync", "request_rejected",
                {{"operation", operation}, {"error", e.what()}});
            return e.to_grpc_status();
        } catch (const std::exception& e) {
            log_error("inventory_sync", "request_failed",
                {{"operation", operation}, {"error", e.what()}});
            return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
        }
    }

    static Millis interval_from_minutes(double minutes) {
        if (!std::isfinite(minutes) || minutes <= 0) {
            throw InvalidArgumentError("interval_minutes must be a positive number");
        }
        if (minutes * 60'000.0 > static_cast<double>(ConfigStore::kMaxIntervalMs)) {
            throw InvalidArgumentError("interval_minutes must not exceed 1440");
        }
        auto millis = static_cast<Millis>(std::llround(minutes * 60'000.0));
        if (millis <= 0) {
            throw InvalidArgumentError("interval_minutes must be at least one millisecond");
        }
        return millis;
    }

    static int positive_days(int32_t days) {
        if (days <= 0) {
            throw InvalidArgumentError("days must be a positive number");
        }
        return days;
    }

    SyncEngine& engine_;
    PushFn push_;
};

std::unique_ptr<v1::InventorySync::Service> create_inventory_sync_service(SyncEngine& engine,
                                                                          PushFn push) {
    return std::make_unique<InventorySyncService>(engine, std::move(push));
}

} // namespace stocksync
