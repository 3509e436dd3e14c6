#pragma once

/**
 * stocksync: multi-channel inventory sync engine.
 *
 * Main include file - includes all public headers.
 */

// Error types
#include "errors.hpp"

// Domain types and helper utilities
#include "types.hpp"
#include "helpers.hpp"
#include "validation.hpp"
#include "logging.hpp"

// Persistence
#include "database.hpp"
#include "config_store.hpp"
#include "mapping_store.hpp"
#include "audit_log.hpp"

// Engine
#include "sku_locks.hpp"
#include "ledger.hpp"
#include "distribution.hpp"
#include "daemon.hpp"
#include "engine.hpp"

// Host push function
#include "publisher_client.hpp"
