
#include "ankiplace/unique_fd.hpp"

#include <fcntl.h>
#include <unistd.h> // close()


namespace ankiplace {


UniqueFd::UniqueFd() noexcept: fd_(-1) {}

UniqueFd::UniqueFd(int fd) noexcept: fd_(fd) {}

UniqueFd::~UniqueFd() {
    reset();
}

UniqueFd::UniqueFd(UniqueFd&& other) noexcept: fd_(other.fd_) {
    other.fd_ = -1;
}

UniqueFd& UniqueFd::operator=(UniqueFd&& other) noexcept {
    if (this != &other) {
        reset();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

bool UniqueFd::valid() const noexcept {
    return fd_ != -1;
}

int UniqueFd::fd() const noexcept {
    return fd_;
}

void UniqueFd::reset() noexcept {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool UniqueFd::set_nonblocking() noexcept {
    int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags == -1)
        return false;
    return ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) != -1;
}

} // namespace ankiplace
