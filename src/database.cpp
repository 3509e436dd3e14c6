#include "stocksync/database.hpp"
#include "stocksync/errors.hpp"
#include "stocksync/logging.hpp"
#include <sqlite3.h>
#include <utility>

namespace stocksync {

namespace {

constexpr const char* kSchema = R"sql(
  CREATE TABLE IF NOT EXISTS channel_mappings (
    id TEXT PRIMARY KEY,
    sku TEXT NOT NULL,
    product_id TEXT,
    total_quantity INTEGER NOT NULL DEFAULT 0,
    reserved_quantity INTEGER NOT NULL DEFAULT 0,
    sync_enabled INTEGER NOT NULL DEFAULT 1,
    last_sync_at INTEGER,
    created_at INTEGER NOT NULL
  );
  CREATE UNIQUE INDEX IF NOT EXISTS idx_channel_mappings_sku ON channel_mappings(sku);

  CREATE TABLE IF NOT EXISTS channel_entries (
    id TEXT PRIMARY KEY,
    mapping_id TEXT NOT NULL,
    platform TEXT NOT NULL,
    listing_id TEXT NOT NULL,
    platform_sku TEXT,
    quantity INTEGER NOT NULL DEFAULT 0,
    last_pushed_quantity INTEGER NOT NULL DEFAULT 0,
    last_push_at INTEGER,
    FOREIGN KEY (mapping_id) REFERENCES channel_mappings(id)
  );
  CREATE INDEX IF NOT EXISTS idx_channel_entries_mapping ON channel_entries(mapping_id);
  CREATE UNIQUE INDEX IF NOT EXISTS idx_channel_entries_platform_listing
    ON channel_entries(platform, listing_id);

  CREATE TABLE IF NOT EXISTS sync_events (
    id TEXT PRIMARY KEY,
    sku TEXT NOT NULL,
    event_type TEXT NOT NULL,
    platform TEXT NOT NULL,
    quantity_change INTEGER NOT NULL,
    previous_quantity INTEGER NOT NULL,
    new_quantity INTEGER NOT NULL,
    details TEXT,
    oversell INTEGER NOT NULL DEFAULT 0,
    created_at INTEGER NOT NULL
  );
  CREATE INDEX IF NOT EXISTS idx_sync_events_sku ON sync_events(sku);
  CREATE INDEX IF NOT EXISTS idx_sync_events_created ON sync_events(created_at);

  CREATE TABLE IF NOT EXISTS sync_daemon_config (
    id TEXT PRIMARY KEY DEFAULT 'default',
    config TEXT NOT NULL,
    enabled INTEGER NOT NULL DEFAULT 1,
    last_run_at INTEGER,
    total_syncs INTEGER NOT NULL DEFAULT 0,
    created_at INTEGER NOT NULL
  );
)sql";

[[noreturn]] void throw_storage_error(sqlite3* db, int rc, const std::string& context) {
    std::string message = context + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        throw ConstraintError(message, rc);
    }
    throw StorageError(message, rc);
}

} // anonymous namespace

// =============================================================================
// Statement
// =============================================================================

Statement::Statement(Database& db, const std::string& sql) : db_(db) {
    int rc = sqlite3_prepare_v2(db_.handle(), sql.c_str(), -1, &stmt_, nullptr);
    if (rc != SQLITE_OK) {
        throw_storage_error(db_.handle(), rc, "prepare failed");
    }
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement& Statement::bind(int index, const std::string& value) {
    int rc = sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) throw_storage_error(db_.handle(), rc, "bind failed");
    return *this;
}

Statement& Statement::bind(int index, const char* value) {
    return bind(index, std::string(value));
}

Statement& Statement::bind(int index, int64_t value) {
    int rc = sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
    if (rc != SQLITE_OK) throw_storage_error(db_.handle(), rc, "bind failed");
    return *this;
}

Statement& Statement::bind(int index, const std::optional<std::string>& value) {
    return value ? bind(index, *value) : bind_null(index);
}

Statement& Statement::bind(int index, const std::optional<int64_t>& value) {
    return value ? bind(index, *value) : bind_null(index);
}

Statement& Statement::bind_null(int index) {
    int rc = sqlite3_bind_null(stmt_, index);
    if (rc != SQLITE_OK) throw_storage_error(db_.handle(), rc, "bind failed");
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw_storage_error(db_.handle(), rc, "step failed");
}

void Statement::run() {
    while (step()) {
    }
}

int64_t Statement::column_int64(int column) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, column));
}

std::string Statement::column_text(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::optional<std::string> Statement::column_optional_text(int column) const {
    if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) return std::nullopt;
    return column_text(column);
}

std::optional<int64_t> Statement::column_optional_int64(int column) const {
    if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) return std::nullopt;
    return column_int64(column);
}

// =============================================================================
// Database
// =============================================================================

Database::Database(const std::string& path) : path_(path) {
    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string message = "cannot open database " + path + ": " +
                              (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError(message, rc);
    }
    sqlite3_busy_timeout(db_, 5000);
    exec("PRAGMA foreign_keys = ON;");
    migrate();
}

Database::~Database() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void Database::exec(const std::string& sql) {
    auto guard = lock();
    char* error = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error);
    if (rc != SQLITE_OK) {
        std::string message = error ? error : sqlite3_errstr(rc);
        sqlite3_free(error);
        if ((rc & 0xff) == SQLITE_CONSTRAINT) throw ConstraintError(message, rc);
        throw StorageError(message, rc);
    }
}

void Database::migrate() {
    exec(kSchema);
}

// =============================================================================
// Transaction
// =============================================================================

Database::Transaction::Transaction(Database& db) : db_(db), lock_(db.lock()) {
    db_.exec("BEGIN IMMEDIATE;");
}

Database::Transaction::~Transaction() {
    if (!done_) {
        int rc = sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) {
            log_error("database", "rollback_failed",
                {{"path", db_.path()}, {"error", sqlite3_errstr(rc)}});
        }
    }
}

void Database::Transaction::commit() {
    db_.exec("COMMIT;");
    done_ = true;
}

} // namespace stocksync
