#pragma once


namespace ankiplace {

/*
 * RAII owner of a POSIX file descriptor
 *
 * Used for the listening socket, client sockets, the waker pipe and
 * the instance lock file. Closes the descriptor on destruction.
 * Move-only
 */
class UniqueFd {
public:
    // Constructs an invalid descriptor
    UniqueFd() noexcept;

    // Takes ownership of an existing file descriptor
    explicit UniqueFd(int fd) noexcept;

    // Closes the descriptor if valid
    ~UniqueFd();

    // Non-copyable
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    // Movable
    UniqueFd(UniqueFd&& other) noexcept;
    UniqueFd& operator=(UniqueFd&& other) noexcept;

    // Returns true if a valid descriptor is owned
    bool valid() const noexcept;

    int fd() const noexcept;

    // Closes now instead of at destruction
    void reset() noexcept;

    // Sets O_NONBLOCK, returns false if fcntl fails
    bool set_nonblocking() noexcept;

private:
    int fd_;
};

} // namespace ankiplace
