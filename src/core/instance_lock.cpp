#include "ankiplace/instance_lock.hpp"
#include "ankiplace/durable_store.hpp"
#include "ankiplace/errors.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>

namespace ankiplace {

InstanceLock::InstanceLock(const std::string& store_path)
    : lock_path_(store_path + ".lock") {
    // The lock file sits beside the store, so its directory must exist first
    ensure_parent_directory(store_path);
    int fd = ::open(lock_path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd == -1)
        throw StoreError("cannot open lock file '" + lock_path_ + "': " + std::strerror(errno));
    fd_ = UniqueFd{fd};

    // Non-blocking: a second instance fails fast instead of queueing up
    if (::flock(fd_.fd(), LOCK_EX | LOCK_NB) == -1) {
        if (errno == EWOULDBLOCK)
            throw StoreError("store '" + store_path + "' is already in use by another process");
        throw StoreError("cannot lock '" + lock_path_ + "': " + std::strerror(errno));
    }
}

} // namespace ankiplace
