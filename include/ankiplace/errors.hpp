#pragma once

#include <stdexcept>
#include <string>

namespace ankiplace {

// Presented credential does not match the session secret. Never retried.
class Unauthorized : public std::runtime_error {
public:
    explicit Unauthorized(const std::string& msg) : std::runtime_error(msg) {}
};

// Store contention outlasted the retry budget, or the writer is shutting down.
// Retryable by the caller.
class Unavailable : public std::runtime_error {
public:
    explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {}
};

// Operation abandoned before it started. Retryable by the caller.
class DeadlineExceeded : public std::runtime_error {
public:
    explicit DeadlineExceeded(const std::string& msg) : std::runtime_error(msg) {}
};

// Non-transient store failure: corruption, constraint violation, disk full...
class StoreError : public std::runtime_error {
public:
    StoreError(const std::string& msg, int code = 0)
        : std::runtime_error(msg), code_(code) {}

    // SQLite result code, 0 when the failure did not come from SQLite
    int code() const noexcept { return code_; }

private:
    int code_;
};

/*
 * The file lock is held by another connection (SQLITE_BUSY / SQLITE_LOCKED).
 * Transient: recovered by the write serializer and the read pool with
 * backoff, never propagated to the gateway.
 * Deliberately not a StoreError so a catch of StoreError never swallows it.
 */
class StoreBusy : public std::runtime_error {
public:
    explicit StoreBusy(const std::string& msg) : std::runtime_error(msg) {}
};

// Validation or domain outcome carrying the HTTP status to answer with.
class RequestError : public std::runtime_error {
public:
    RequestError(int status, const std::string& detail)
        : std::runtime_error(detail), status_(status) {}

    int status() const noexcept { return status_; }

private:
    int status_;
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace ankiplace
