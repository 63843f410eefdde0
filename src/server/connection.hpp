#pragma once

#include "ankiplace/unique_fd.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace ankiplace {

class IOError : public std::runtime_error {
public:
    explicit IOError(const std::string& msg) : std::runtime_error(msg) {}
};

class BufferOverflowError : public IOError {
    using IOError::IOError;
};

/*
 * Represents a single client connection.
 *
 * The reactor owns reading; a worker appends the response.
 * At most one request per connection is with the workers at a time,
 * so responses leave in request order.
 */
class Connection {
public:
    explicit Connection(UniqueFd socket) : socket_(std::move(socket)) {}

    // append response to outbox
    void append_response(std::string data);

    // Write to client. Return true if there is still data left to send
    bool write_from_outbox();

    // returns false if client disconnected
    bool read_to_inbox();

    // Removes and returns the first complete request, if one has arrived.
    // Throws ProtocolError when the inbox can never hold a valid request.
    std::optional<std::string> try_get_message();

    // A request from this connection is being handled by a worker
    bool in_flight() const noexcept { return in_flight_; }
    void set_in_flight(bool value) noexcept { in_flight_ = value; }

    // Close once the outbox has been flushed; no further requests are read
    void close_after_flush() noexcept { closing_ = true; }
    bool closing() const noexcept { return closing_; }

    int fd() const noexcept { return socket_.fd(); }

    // only used in tests to confirm partial reads/writes
    bool inbox_has_data() const;
    bool outbox_has_data() const;

private:
    static constexpr size_t MAX_INBOX_SIZE = 1024 * 1024 * 2; // 2MB limit
    UniqueFd socket_;
    std::string server_inbox_;
    std::string server_outbox_;
    mutable std::mutex outbox_mutex_;
    std::atomic<bool> in_flight_{false};
    std::atomic<bool> closing_{false};

};

} // namespace ankiplace
