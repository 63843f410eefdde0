
#include "waker.hpp"

#include <fcntl.h>
#include <stdexcept>
#include <unistd.h>


namespace ankiplace {

Waker::Waker() {
    int pipe_fds[2];
    if (::pipe2(pipe_fds, O_CLOEXEC) == -1)
        throw std::runtime_error("Failed to create self-pipe");
    read_end_ = UniqueFd{pipe_fds[0]};
    write_end_ = UniqueFd{pipe_fds[1]};
    // Set both ends to non-blocking
    if (!read_end_.set_nonblocking() || !write_end_.set_nonblocking())
        throw std::runtime_error("Failed to make self-pipe non-blocking");
}

int Waker::read_fd() const {
    return read_end_.fd();
}

void Waker::notify() {
    char c = 'x';
    // A full pipe already guarantees a wake-up, so EAGAIN is fine
    [[maybe_unused]] ssize_t n = ::write(write_end_.fd(), &c, 1);
}

void Waker::clear() {
    char buf[16];
    while (::read(read_end_.fd(), buf, sizeof(buf)) > 0);
}

} // namespace ankiplace
