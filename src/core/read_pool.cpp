#include "ankiplace/read_pool.hpp"
#include "ankiplace/errors.hpp"

#include <algorithm>
#include <thread>

namespace ankiplace {

// Returns the connection to the pool on every exit path
class ReadPool::Lease {
public:
    Lease(ReadPool& pool, std::unique_ptr<Database> db)
        : pool_(pool), db_(std::move(db)) {}

    ~Lease() { pool_.release(std::move(db_)); }

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    Database& operator*() const { return *db_; }

private:
    ReadPool& pool_;
    std::unique_ptr<Database> db_;
};

ReadPool::ReadPool(const DurableStore& store, Options options)
    : options_(options), size_(std::max<size_t>(options.connections, 1)) {
    idle_.reserve(size_);
    for (size_t i = 0; i < size_; i++)
        idle_.push_back(store.open_reader());
}

ReadPool::ReadPool(const DurableStore& store) : ReadPool(store, Options{}) {}

ReadResult ReadPool::query(const ReadOperation& op) {
    Lease db{*this, acquire(op)};
    auto backoff = options_.initial_backoff;

    for (int attempt = 1;; attempt++) {
        try {
            Transaction tx{*db, Transaction::Kind::Deferred};
            op.run(*db);
            tx.commit();
            return ReadResult{attempt};
        } catch (const StoreBusy&) {
            // The writer is inside its commit window
            if (Clock::now() + backoff >= op.deadline)
                throw DeadlineExceeded("read " + op.id + " could not reach the store before its deadline");
            std::this_thread::sleep_for(backoff);
            backoff = std::min(backoff * 2, options_.max_backoff);
        }
    }
}

std::unique_ptr<Database> ReadPool::acquire(const ReadOperation& op) {
    if (Clock::now() >= op.deadline)
        throw DeadlineExceeded("read " + op.id + " expired before it started");

    std::unique_lock lock(mutex_);
    // The predicate wins over the timeout, so check the clock again afterwards
    if (!available_.wait_until(lock, op.deadline, [this]() { return !idle_.empty(); }) ||
        Clock::now() >= op.deadline)
        throw DeadlineExceeded("read " + op.id + " found no free connection before its deadline");

    auto db = std::move(idle_.back());
    idle_.pop_back();
    return db;
}

void ReadPool::release(std::unique_ptr<Database> db) {
    {
        std::lock_guard lock(mutex_);
        idle_.push_back(std::move(db));
    }
    available_.notify_one();
}

} // namespace ankiplace
