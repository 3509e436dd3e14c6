#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>
#include "stocksync/listing_publisher.grpc.pb.h"
#include "stocksync/listing_publisher.pb.h"
#include "types.hpp"

namespace stocksync {

/**
 * Client for the host's ListingPublisher service, the push function the
 * server binary hands to the distribution engine and the daemon.
 *
 * Example:
 *   auto publisher = PublisherClient::connect("localhost:50611");
 *   DistributionEngine engine(...);
 *   engine.sync_to_channels("SKU-1", publisher->as_push_fn());
 */
class PublisherClient {
public:
    static constexpr std::chrono::milliseconds kDefaultDeadline{10000};

    /**
     * Connect to a publisher at the given endpoint.
     *
     * @param endpoint Server endpoint (e.g., "localhost:50611" or "http://host:port")
     * @param deadline Per-call deadline
     */
    static std::unique_ptr<PublisherClient> connect(const std::string& endpoint,
                                                    std::chrono::milliseconds deadline = kDefaultDeadline) {
        auto channel = grpc::CreateChannel(format_endpoint(endpoint),
                                           grpc::InsecureChannelCredentials());
        return std::make_unique<PublisherClient>(channel, deadline);
    }

    PublisherClient(std::shared_ptr<grpc::Channel> channel, std::chrono::milliseconds deadline)
        : stub_(v1::ListingPublisher::NewStub(channel)), deadline_(deadline) {}

    /**
     * Set the advertised quantity of one listing.
     *
     * @return true if the publisher accepted the update
     * @throws PublisherError if the call fails or times out
     */
    bool set_quantity(const std::string& platform, const std::string& listing_id,
                      Quantity quantity);

    /**
     * Bind this client as a push function. The client must outlive it.
     */
    PushFn as_push_fn() {
        return [this](const std::string& platform, const std::string& listing_id,
                      Quantity quantity) {
            return set_quantity(platform, listing_id, quantity);
        };
    }

    /**
     * Strip an http:// or https:// prefix for gRPC.
     */
    static std::string format_endpoint(const std::string& endpoint) {
        auto pos = endpoint.find("://");
        if (pos == std::string::npos) {
            return endpoint;
        }
        return endpoint.substr(pos + 3);
    }

private:
    std::unique_ptr<v1::ListingPublisher::Stub> stub_;
    std::chrono::milliseconds deadline_;
};

/**
 * Push function used when no publisher is configured: logs the update and
 * reports success.
 */
PushFn dry_run_push_fn();

} // namespace stocksync
