#pragma once

#include "ankiplace/database.hpp"
#include "ankiplace/operation.hpp"
#include "ankiplace/task_deque.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace ankiplace {

/*
 * Funnels every mutating operation through one writer thread.
 *
 * Operations are applied strictly in submission order, one at a time,
 * each in its own BEGIN IMMEDIATE ... COMMIT. The next operation does
 * not start before the previous COMMIT or ROLLBACK has returned.
 *
 * A busy store (another connection holding the file lock) is retried on
 * the same operation with exponential backoff, up to max_attempts, then
 * reported as Unavailable. Any other failure is reported at once and the
 * queue moves on.
 */
class WriteSerializer : public Writer {
public:
    struct Options {
        int max_attempts{8};
        std::chrono::milliseconds initial_backoff{5};
        std::chrono::milliseconds max_backoff{500};
        std::chrono::milliseconds shutdown_grace{5000};
    };

    // db must stay alive, and untouched by anyone else, until shutdown()
    WriteSerializer(Database& db, Options options);
    explicit WriteSerializer(Database& db);

    // Calls shutdown() with the configured grace period
    ~WriteSerializer() override;

    WriteSerializer(const WriteSerializer&) = delete;
    WriteSerializer& operator=(const WriteSerializer&) = delete;

    // Blocks the calling thread until op is durably committed or failed.
    // Throws DeadlineExceeded, Unavailable, StoreError, or whatever op throws.
    CommitResult submit(WriteOperation op) override;

    // Refuses new submissions, gives queued ones up to grace to finish,
    // fails the rest with Unavailable and joins the writer thread.
    void shutdown(std::chrono::milliseconds grace);
    void shutdown();

    // Operations accepted but not started yet
    size_t pending() const { return queue_.size(); }

private:
    struct Task;

    void writer_loop(std::stop_token stop_token);
    void run(Task& task);
    CommitResult apply(const WriteOperation& op);

    Database& db_;
    Options options_;
    TaskDeque<std::shared_ptr<Task>> queue_;
    std::uint64_t committed_{0}; // writer thread only

    std::mutex shutdown_mutex_;
    bool shut_down_{false};

    std::jthread writer_; // last: started once everything above exists
};

} // namespace ankiplace
