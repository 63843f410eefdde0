#pragma once

#include "ankiplace/unique_fd.hpp"

#include <string>

namespace ankiplace {

/*
 * Exclusive advisory lock (flock) on "<store path>.lock".
 *
 * The single-writer guarantee only holds inside one process, so a second
 * process pointed at the same store refuses to start. The lock file
 * carries no state. The lock is released when the object is destroyed
 * or the process dies.
 */
class InstanceLock {
public:
    // Throws StoreError if another process holds the lock
    explicit InstanceLock(const std::string& store_path);

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    const std::string& path() const noexcept { return lock_path_; }

private:
    std::string lock_path_;
    UniqueFd fd_;
};

} // namespace ankiplace
