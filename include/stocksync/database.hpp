#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace stocksync {

class Database;

/**
 * Prepared statement. Parameters are 1-based, columns 0-based.
 * Must be used while the owning Database's lock is held.
 */
class Statement {
public:
    Statement(Database& db, const std::string& sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&&) = delete;

    Statement& bind(int index, const std::string& value);
    Statement& bind(int index, const char* value);
    Statement& bind(int index, int64_t value);
    Statement& bind(int index, int value) { return bind(index, static_cast<int64_t>(value)); }
    Statement& bind(int index, bool value) { return bind(index, static_cast<int64_t>(value ? 1 : 0)); }
    Statement& bind(int index, const std::optional<std::string>& value);
    Statement& bind(int index, const std::optional<int64_t>& value);
    Statement& bind_null(int index);

    /**
     * Advance to the next row.
     * @return true if a row is available, false when done
     * @throws ConstraintError on UNIQUE / FOREIGN KEY violations
     * @throws StorageError on any other failure
     */
    bool step();

    /**
     * Execute a statement that returns no rows.
     */
    void run();

    int64_t column_int64(int column) const;
    std::string column_text(int column) const;
    std::optional<std::string> column_optional_text(int column) const;
    std::optional<int64_t> column_optional_int64(int column) const;

private:
    Database& db_;
    sqlite3_stmt* stmt_ = nullptr;
};

/**
 * Shared SQLite connection holding the four sync tables.
 *
 * One connection is shared by request threads and the daemon thread; every
 * caller takes lock() for the duration of its statements. The lock is
 * recursive so store methods can nest inside a Transaction.
 */
class Database {
public:
    /**
     * Open (or create) the database and apply the schema.
     * @param path File path, or ":memory:" for a private in-memory database
     * @throws StorageError if the database cannot be opened
     */
    explicit Database(const std::string& path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    std::unique_lock<std::recursive_mutex> lock() {
        return std::unique_lock<std::recursive_mutex>(mutex_);
    }

    /**
     * Execute one or more statements that take no parameters.
     */
    void exec(const std::string& sql);

    Statement prepare(const std::string& sql) { return Statement(*this, sql); }

    sqlite3* handle() { return db_; }
    const std::string& path() const { return path_; }

    /**
     * BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless
     * commit() was called. Holds the database lock for its lifetime.
     */
    class Transaction {
    public:
        explicit Transaction(Database& db);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

    private:
        Database& db_;
        std::unique_lock<std::recursive_mutex> lock_;
        bool done_ = false;
    };

private:
    void migrate();

    std::string path_;
    sqlite3* db_ = nullptr;
    std::recursive_mutex mutex_;
};

} // namespace stocksync
