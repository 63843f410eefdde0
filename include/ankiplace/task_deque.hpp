#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <vector>

namespace ankiplace {

/*
 * Closable FIFO shared between producers and consumer threads.
 * Items come out in exactly the order they went in.
 * Once closed, push_back() refuses new items while already queued
 * items can still be popped or drained.
 */
template <typename T>
class TaskDeque {
public:
    // Push a new task into the deque
    // Returns false (and drops nothing already queued) once closed
    bool push_back(T task) {
        {
            std::lock_guard lock(deque_mutex_);
            if (closed_)
                return false;
            deque_.push_back(std::move(task));
        }
        cv_.notify_one();
        return true;
    }

    // Pop a task (blocks if the deque is empty)
    // Returns std::nullopt if stop is requested, or if the deque is
    // closed and empty
    std::optional<T> wait_and_pop_front(std::stop_token stop_token) {
        std::unique_lock lock(deque_mutex_);
        // C++20 wait: stays asleep until data exists, close, OR stop is requested
        bool success = cv_.wait(lock, stop_token, [this]() {
            return !deque_.empty() || closed_;
        });

        if (!success || stop_token.stop_requested() || deque_.empty()) {
            return std::nullopt;
        }

        T task = std::move(deque_.front());
        deque_.pop_front();
        if (deque_.empty())
            drained_cv_.notify_all();
        return task;
    }

    // Refuse further pushes and wake every waiting consumer
    void close() {
        {
            std::lock_guard lock(deque_mutex_);
            closed_ = true;
        }
        cv_.notify_all();
        drained_cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard lock(deque_mutex_);
        return closed_;
    }

    // Blocks until the deque is empty or the timeout expires
    template <typename Rep, typename Period>
    bool wait_until_empty(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock lock(deque_mutex_);
        return drained_cv_.wait_for(lock, timeout, [this]() {
            return deque_.empty();
        });
    }

    // Removes and returns everything still queued, oldest first
    std::vector<T> drain() {
        std::vector<T> out;
        {
            std::lock_guard lock(deque_mutex_);
            out.reserve(deque_.size());
            for (auto& task : deque_)
                out.push_back(std::move(task));
            deque_.clear();
        }
        drained_cv_.notify_all();
        return out;
    }

    bool empty() const {
        std::lock_guard lock(deque_mutex_);
        return deque_.empty();
    }

    size_t size() const {
        std::lock_guard lock(deque_mutex_);
        return deque_.size();
    }

private:
    std::deque<T> deque_;
    bool closed_{false};
    mutable std::mutex deque_mutex_;
    std::condition_variable_any cv_;
    std::condition_variable drained_cv_;
};

} // namespace ankiplace
