#include "inventory_sync_service.hpp"
#include "stocksync/engine.hpp"
#include "stocksync/errors.hpp"
#include "stocksync/logging.hpp"
#include "stocksync/publisher_client.hpp"
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <cstdlib>
#include <memory>
#include <string>

namespace {

struct ServerConfig {
    std::string port = "50610";
    std::string db_path = "stocksync.db";
    std::string publisher_endpoint;
    bool autostart = false;
};

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value && *value ? value : fallback;
}

bool starts_with(const std::string& arg, const std::string& prefix) {
    return arg.compare(0, prefix.size(), prefix) == 0;
}

ServerConfig parse_config(int argc, char** argv) {
    ServerConfig config;
    config.port = env_or("STOCKSYNC_PORT", config.port);
    config.db_path = env_or("STOCKSYNC_DB", config.db_path);
    config.publisher_endpoint = env_or("STOCKSYNC_PUBLISHER_ENDPOINT", "");
    config.autostart = env_or("STOCKSYNC_DAEMON_AUTOSTART", "0") == "1";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (starts_with(arg, "--port=")) {
            config.port = arg.substr(7);
        } else if (starts_with(arg, "--db=")) {
            config.db_path = arg.substr(5);
        } else if (starts_with(arg, "--publisher=")) {
            config.publisher_endpoint = arg.substr(12);
        } else if (arg == "--autostart") {
            config.autostart = true;
        } else {
            stocksync::log_warn("server", "unknown_argument", {{"argument", arg}});
        }
    }
    return config;
}

} // anonymous namespace

int main(int argc, char** argv) {
    ServerConfig config = parse_config(argc, argv);
    std::string server_address = "0.0.0.0:" + config.port;

    try {
        // Must outlive the engine: the daemon holds its push function.
        std::unique_ptr<stocksync::PublisherClient> publisher;
        stocksync::SyncEngine engine(config.db_path);

        stocksync::PushFn push;
        if (config.publisher_endpoint.empty()) {
            stocksync::log_warn("server", "publisher_not_configured", {{"mode", "dry_run"}});
            push = stocksync::dry_run_push_fn();
        } else {
            publisher = stocksync::PublisherClient::connect(config.publisher_endpoint);
            push = publisher->as_push_fn();
        }

        if (config.autostart && engine.config().load().enabled) {
            auto started = engine.daemon().start(push);
            stocksync::log_info("server", "daemon_resumed",
                {{"mappings_synced", started.first_cycle.mappings_synced}});
        }

        grpc::EnableDefaultHealthCheckService(true);

        auto service = stocksync::create_inventory_sync_service(engine, push);

        grpc::ServerBuilder builder;
        builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
        builder.RegisterService(service.get());

        std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
        if (!server) {
            stocksync::log_error("server", "server_start_failed", {{"address", server_address}});
            return 1;
        }

        stocksync::log_info("server", "inventory_sync_server_started", {
            {"port", config.port},
            {"db", config.db_path},
            {"publisher", config.publisher_endpoint.empty() ? "dry_run" : config.publisher_endpoint}
        });

        server->Wait();
    } catch (const stocksync::SyncError& e) {
        stocksync::log_error("server", "startup_failed", {{"error", e.what()}});
        return 1;
    }

    return 0;
}
