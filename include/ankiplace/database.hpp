#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace ankiplace {

enum class AccessMode {
    ReadWrite, // creates the file if missing
    ReadOnly,
};

class Statement;

/*
 * RAII owner of one SQLite connection.
 *
 * Every SQLite result code is checked: SQLITE_BUSY and SQLITE_LOCKED
 * throw StoreBusy, everything else throws StoreError.
 * Not thread-safe: one thread uses a connection at a time.
 */
class Database {
public:
    // Opens the file; throws StoreError if it cannot be opened
    Database(const std::string& path, AccessMode mode);

    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    Database(Database&&) = delete;
    Database& operator=(Database&&) = delete;

    // Runs one or more statements that return no rows
    void exec(const char* sql);

    Statement prepare(std::string_view sql);

    // Runs PRAGMA quick_check; throws StoreError unless the file is sound
    void verify_integrity();

    // Rows modified by the most recent INSERT/UPDATE/DELETE
    int changes() const noexcept;

    // False in autocommit mode, i.e. when no transaction is open
    bool in_transaction() const noexcept;

    AccessMode mode() const noexcept { return mode_; }
    const std::string& path() const noexcept { return path_; }

    // Translates a failed result code into StoreBusy or StoreError
    [[noreturn]] void raise(int rc, std::string_view context) const;

private:
    sqlite3* db_{nullptr};
    std::string path_;
    AccessMode mode_;
};

/*
 * RAII prepared statement. Parameter indexes are 1-based,
 * column indexes 0-based, as in the SQLite C API.
 */
class Statement {
public:
    Statement(Database& db, sqlite3_stmt* stmt) noexcept;
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;

    Statement& bind(int index, int value);
    Statement& bind(int index, std::int64_t value);
    Statement& bind(int index, double value);
    Statement& bind(int index, std::string_view value);
    Statement& bind_null(int index);

    // Advances to the next row; false once the statement is done
    bool step();

    // Runs a statement that returns no rows
    void run();

    void reset();

    bool column_is_null(int column) const;
    std::int64_t column_int64(int column) const;
    double column_double(int column) const;
    std::string column_text(int column) const;
    std::optional<std::string> column_optional_text(int column) const;

private:
    Database* db_;
    sqlite3_stmt* stmt_;
};

/*
 * Transaction scope. Rolls back on destruction unless committed.
 * Immediate takes the write lock at BEGIN, Deferred on first access.
 */
class Transaction {
public:
    enum class Kind { Deferred, Immediate };

    Transaction(Database& db, Kind kind);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    // Throws StoreBusy if readers still hold the file; the transaction
    // stays open and commit() may be called again
    void commit();

    void rollback();

    bool active() const noexcept { return active_; }

private:
    Database& db_;
    bool active_{false};
};

} // namespace ankiplace
