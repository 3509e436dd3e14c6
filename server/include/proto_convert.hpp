#pragma once

#include "stocksync/types.hpp"
#include "stocksync/types.pb.h"

namespace stocksync {

/// Domain -> wire conversions for the command surface.
void to_proto(const ChannelEntry& entry, v1::ChannelEntry* out);
void to_proto(const ChannelMapping& mapping, v1::ChannelMapping* out);
void to_proto(const SyncEvent& event, v1::SyncEvent* out);
void to_proto(const DaemonConfig& config, v1::DaemonConfig* out);
void to_proto(const SyncResult& result, v1::SyncResult* out);
void to_proto(const CycleResult& result, v1::CycleResult* out);
void to_proto(const SyncStats& stats, v1::SyncStats* out);
void to_proto(const DaemonStatus& status, v1::DaemonStatus* out);

v1::SyncEventType to_proto(EventType type);

} // namespace stocksync
