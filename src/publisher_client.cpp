#include "stocksync/publisher_client.hpp"
#include "stocksync/errors.hpp"
#include "stocksync/logging.hpp"

namespace stocksync {

bool PublisherClient::set_quantity(const std::string& platform, const std::string& listing_id,
                                   Quantity quantity) {
    v1::SetQuantityRequest request;
    request.set_platform(platform);
    request.set_listing_id(listing_id);
    request.set_quantity(quantity);

    v1::SetQuantityResponse response;
    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + deadline_);

    auto status = stub_->SetQuantity(&context, request, &response);
    if (!status.ok()) {
        throw PublisherError(status.error_message(), status.error_code());
    }
    if (!response.accepted()) {
        log_warn("publisher", "quantity_rejected", {
            {"platform", platform},
            {"listing_id", listing_id},
            {"quantity", quantity},
            {"reason", response.message()}
        });
    }
    return response.accepted();
}

PushFn dry_run_push_fn() {
    return [](const std::string& platform, const std::string& listing_id, Quantity quantity) {
        log_info("publisher", "dry_run_push", {
            {"platform", platform},
            {"listing_id", listing_id},
            {"quantity", quantity}
        });
        return true;
    };
}

} // namespace stocksync
