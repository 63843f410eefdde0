#pragma once

#include "ankiplace/unique_fd.hpp"


namespace ankiplace {

/*
 * Self-pipe used to wake the reactor out of poll()
 * from worker threads and from signal handlers.
 */
class Waker {
public:
    // Throws std::runtime_error if the pipe cannot be created
    Waker();

    int read_fd() const;

    // Async-signal-safe: a single write() to the pipe
    void notify();

    // Drains pending wake-ups
    void clear();

private:
    UniqueFd read_end_;
    UniqueFd write_end_;
};

} // namespace ankiplace
