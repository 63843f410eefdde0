#include "ankiplace/database.hpp"
#include "ankiplace/errors.hpp"
#include "ankiplace/logging.hpp"

#include <sqlite3.h>

#include <utility>

namespace ankiplace {

Database::Database(const std::string& path, AccessMode mode)
    : path_(path), mode_(mode) {
    int flags = mode == AccessMode::ReadWrite
        ? SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE
        : SQLITE_OPEN_READONLY;

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        // sqlite3_open_v2 may hand back a handle even on failure
        std::string message = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("cannot open store '" + path + "': " + message, rc);
    }

    sqlite3_extended_result_codes(db_, 1);
    // No implicit waiting: busy is reported immediately and retried by the caller
    sqlite3_busy_timeout(db_, 0);

    if (mode == AccessMode::ReadWrite) {
        try {
            // Rollback journal: committed state lives in the main file only,
            // and a successful COMMIT has been fsynced
            exec("PRAGMA journal_mode=DELETE;");
            exec("PRAGMA synchronous=FULL;");
        } catch (...) {
            sqlite3_close(db_);
            db_ = nullptr;
            throw;
        }
    }
}

Database::~Database() {
    if (db_) {
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK)
            log_error("Store", "close failed for '" + path_ + "': " + sqlite3_errstr(rc));
    }
}

void Database::exec(const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (err)
        sqlite3_free(err);
    if (rc != SQLITE_OK)
        raise(rc, sql);
}

Statement Database::prepare(std::string_view sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        raise(rc, sql);
    }
    return Statement{*this, stmt};
}

void Database::verify_integrity() {
    Statement check = prepare("PRAGMA quick_check;");
    std::string problems;
    while (check.step()) {
        std::string line = check.column_text(0);
        if (line == "ok")
            continue;
        if (!problems.empty())
            problems += "; ";
        problems += line;
    }
    if (!problems.empty())
        throw StoreError("store '" + path_ + "' failed integrity check: " + problems, SQLITE_CORRUPT);
}

int Database::changes() const noexcept {
    return sqlite3_changes(db_);
}

bool Database::in_transaction() const noexcept {
    return sqlite3_get_autocommit(db_) == 0;
}

void Database::raise(int rc, std::string_view context) const {
    int primary = rc & 0xff;
    std::string detail = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    std::string message = std::string{context} + ": " + detail;
    if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED)
        throw StoreBusy(message);
    throw StoreError(message, rc);
}


Statement::Statement(Database& db, sqlite3_stmt* stmt) noexcept
    : db_(&db), stmt_(stmt) {}

Statement::~Statement() {
    if (stmt_)
        sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(std::exchange(other.stmt_, nullptr)) {}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_)
            sqlite3_finalize(stmt_);
        db_ = other.db_;
        stmt_ = std::exchange(other.stmt_, nullptr);
    }
    return *this;
}

Statement& Statement::bind(int index, int value) {
    return bind(index, static_cast<std::int64_t>(value));
}

Statement& Statement::bind(int index, std::int64_t value) {
    int rc = sqlite3_bind_int64(stmt_, index, value);
    if (rc != SQLITE_OK)
        db_->raise(rc, "bind");
    return *this;
}

Statement& Statement::bind(int index, double value) {
    int rc = sqlite3_bind_double(stmt_, index, value);
    if (rc != SQLITE_OK)
        db_->raise(rc, "bind");
    return *this;
}

Statement& Statement::bind(int index, std::string_view value) {
    int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK)
        db_->raise(rc, "bind");
    return *this;
}

Statement& Statement::bind_null(int index) {
    int rc = sqlite3_bind_null(stmt_, index);
    if (rc != SQLITE_OK)
        db_->raise(rc, "bind");
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW)
        return true;
    if (rc == SQLITE_DONE)
        return false;
    db_->raise(rc, sqlite3_sql(stmt_));
}

void Statement::run() {
    while (step()) {
    }
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

bool Statement::column_is_null(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

std::int64_t Statement::column_int64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Statement::column_double(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::column_text(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    if (!text)
        return {};
    int size = sqlite3_column_bytes(stmt_, column);
    return std::string{reinterpret_cast<const char*>(text), static_cast<size_t>(size)};
}

std::optional<std::string> Statement::column_optional_text(int column) const {
    if (column_is_null(column))
        return std::nullopt;
    return column_text(column);
}


Transaction::Transaction(Database& db, Kind kind) : db_(db) {
    db_.exec(kind == Kind::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
    active_ = true;
}

Transaction::~Transaction() {
    try {
        rollback();
    } catch (const std::exception& e) {
        log_error("Store", std::string{"rollback failed: "} + e.what());
    }
}

void Transaction::commit() {
    try {
        db_.exec("COMMIT;");
    } catch (const StoreBusy&) {
        throw; // still open, commit() can be retried
    } catch (const StoreError&) {
        // SQLite rolls back on its own after some failures (I/O, disk full)
        if (!db_.in_transaction())
            active_ = false;
        throw;
    }
    active_ = false;
}

void Transaction::rollback() {
    if (!active_)
        return;
    active_ = false;
    if (db_.in_transaction())
        db_.exec("ROLLBACK;");
}

} // namespace ankiplace
