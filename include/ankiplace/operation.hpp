#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace ankiplace {

class Database;

using Clock = std::chrono::steady_clock;

/*
 * Unit of work against the durable store.
 * id is caller-supplied and only used for tracing.
 * An operation that has not started by its deadline is abandoned
 * with DeadlineExceeded; one that has started always finishes.
 */
struct ReadOperation {
    std::string id;
    Clock::time_point deadline;
    std::function<void(Database&)> run; // must not mutate
};

struct WriteOperation {
    std::string id;
    Clock::time_point deadline;
    // Runs inside BEGIN IMMEDIATE ... COMMIT. May run more than once if
    // the store is busy, so it must not have side effects outside the store.
    std::function<void(Database&)> apply;
};

struct ReadResult {
    int attempts{0};
};

// Returned only once the commit is durable
struct CommitResult {
    std::uint64_t sequence{0}; // position in the total write order, from 1
    int attempts{0};
};

// Read side of the store, implemented by ReadPool
class Reader {
public:
    virtual ~Reader() = default;
    virtual ReadResult query(const ReadOperation& op) = 0;
};

// Write side of the store, implemented by WriteSerializer
class Writer {
public:
    virtual ~Writer() = default;
    virtual CommitResult submit(WriteOperation op) = 0;
};

} // namespace ankiplace
