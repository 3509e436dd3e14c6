#pragma once

#include <memory>
#include "stocksync/engine.hpp"
#include "stocksync/inventory_sync.grpc.pb.h"
#include "stocksync/types.hpp"

namespace stocksync {

/**
 * Create the InventorySync service over an engine.
 *
 * @param engine Components backing every RPC; must outlive the service
 * @param push Push function used by SyncNow and StartDaemon
 */
std::unique_ptr<v1::InventorySync::Service> create_inventory_sync_service(SyncEngine& engine,
                                                                          PushFn push);

} // namespace stocksync
