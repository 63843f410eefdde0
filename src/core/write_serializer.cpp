#include "ankiplace/write_serializer.hpp"
#include "ankiplace/errors.hpp"
#include "ankiplace/logging.hpp"

#include <algorithm>
#include <atomic>
#include <future>

namespace ankiplace {

struct WriteSerializer::Task {
    enum State { Pending, Running, Abandoned };

    WriteOperation op;
    std::atomic<int> state{Pending};
    std::promise<CommitResult> result;
};

WriteSerializer::WriteSerializer(Database& db, Options options)
    : db_(db), options_(options) {
    writer_ = std::jthread([this](std::stop_token stop_token) {
        writer_loop(stop_token);
    });
}

WriteSerializer::WriteSerializer(Database& db) : WriteSerializer(db, Options{}) {}

WriteSerializer::~WriteSerializer() {
    shutdown();
}

CommitResult WriteSerializer::submit(WriteOperation op) {
    if (Clock::now() >= op.deadline)
        throw DeadlineExceeded("write " + op.id + " expired before it was queued");

    auto task = std::make_shared<Task>();
    task->op = std::move(op);
    auto future = task->result.get_future();
    const auto deadline = task->op.deadline;
    const std::string id = task->op.id;

    if (!queue_.push_back(task))
        throw Unavailable("store is shutting down");

    if (future.wait_until(deadline) == std::future_status::timeout) {
        int expected = Task::Pending;
        if (task->state.compare_exchange_strong(expected, Task::Abandoned))
            throw DeadlineExceeded("write " + id + " not started before its deadline");
        // Already applying: it is allowed to finish
    }
    return future.get();
}

void WriteSerializer::shutdown() {
    shutdown(options_.shutdown_grace);
}

void WriteSerializer::shutdown(std::chrono::milliseconds grace) {
    {
        std::lock_guard lock(shutdown_mutex_);
        if (shut_down_)
            return;
        shut_down_ = true;
    }

    queue_.close();
    if (!queue_.wait_until_empty(grace))
        log_warn("Writer", std::to_string(queue_.size()) + " writes still queued after grace period");

    // Finishes the operation in progress, starts no other
    writer_.request_stop();
    if (writer_.joinable())
        writer_.join();

    for (auto& task : queue_.drain()) {
        int expected = Task::Pending;
        if (task->state.compare_exchange_strong(expected, Task::Abandoned)) {
            task->result.set_exception(std::make_exception_ptr(
                Unavailable("store shut down before write " + task->op.id + " started")));
        }
    }
    log_info("Writer", "stopped after " + std::to_string(committed_) + " commits");
}

void WriteSerializer::writer_loop(std::stop_token stop_token) {
    while (!stop_token.stop_requested()) {
        auto task = queue_.wait_and_pop_front(stop_token);
        if (!task)
            break;
        run(**task);
    }
}

void WriteSerializer::run(Task& task) {
    if (Clock::now() >= task.op.deadline) {
        int expected = Task::Pending;
        if (task.state.compare_exchange_strong(expected, Task::Abandoned)) {
            task.result.set_exception(std::make_exception_ptr(
                DeadlineExceeded("write " + task.op.id + " not started before its deadline")));
        }
        return;
    }

    int expected = Task::Pending;
    if (!task.state.compare_exchange_strong(expected, Task::Running))
        return; // submitter gave up on it

    try {
        task.result.set_value(apply(task.op));
    } catch (const StoreError& e) {
        log_error("Writer", "write " + task.op.id + " failed: " + e.what());
        task.result.set_exception(std::current_exception());
    } catch (...) {
        // Domain and availability outcomes belong to the submitter
        task.result.set_exception(std::current_exception());
    }
}

CommitResult WriteSerializer::apply(const WriteOperation& op) {
    int attempts = 0;
    auto backoff = options_.initial_backoff;

    auto back_off_or_give_up = [&](const StoreBusy& busy) {
        if (attempts >= options_.max_attempts) {
            throw Unavailable("store busy after " + std::to_string(attempts) +
                              " attempts: " + busy.what());
        }
        std::this_thread::sleep_for(backoff);
        backoff = std::min(backoff * 2, options_.max_backoff);
    };

    while (true) {
        attempts++;
        try {
            Transaction tx{db_, Transaction::Kind::Immediate};
            op.apply(db_);
            while (true) {
                try {
                    tx.commit();
                    break;
                } catch (const StoreBusy& busy) {
                    // Readers still hold the file; the transaction stays open
                    back_off_or_give_up(busy);
                    attempts++;
                }
            }
            return CommitResult{++committed_, attempts};
        } catch (const StoreBusy& busy) {
            // Rolled back by the transaction scope, apply again
            back_off_or_give_up(busy);
        }
    }
}

} // namespace ankiplace
