#pragma once

#include "ankiplace/database.hpp"
#include "ankiplace/durable_store.hpp"
#include "ankiplace/operation.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace ankiplace {

/*
 * Fixed set of read-only connections shared by concurrent readers.
 *
 * Each query runs in its own read transaction, so it sees one committed
 * snapshot and never a write still in progress. While the writer holds
 * the file lock to commit, the query is retried with short backoff until
 * its deadline.
 */
class ReadPool : public Reader {
public:
    struct Options {
        size_t connections{4};
        std::chrono::milliseconds initial_backoff{1};
        std::chrono::milliseconds max_backoff{50};
    };

    // Opens every connection up front; throws StoreError if one fails
    ReadPool(const DurableStore& store, Options options);
    explicit ReadPool(const DurableStore& store);

    ReadPool(const ReadPool&) = delete;
    ReadPool& operator=(const ReadPool&) = delete;

    // Waits for a free connection until the deadline, then runs op.
    // Throws DeadlineExceeded or StoreError, or whatever op throws.
    ReadResult query(const ReadOperation& op) override;

    size_t size() const noexcept { return size_; }

private:
    class Lease;

    std::unique_ptr<Database> acquire(const ReadOperation& op);
    void release(std::unique_ptr<Database> db);

    Options options_;
    size_t size_;
    std::mutex mutex_;
    std::condition_variable available_;
    std::vector<std::unique_ptr<Database>> idle_;
};

} // namespace ankiplace
