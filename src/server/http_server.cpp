#include "http_server.hpp"
#include "ankiplace/logging.hpp"

#include <stdexcept>     // std::runtime_error
#include <sys/socket.h>  // socket(), bind(), listen()
#include <netinet/in.h>  // sockaddr_in
#include <arpa/inet.h>   // htons()
#include <cerrno>
#include <csignal>

#include <string>

namespace ankiplace {


void Task::execute(Gateway& gateway) {
    if (auto client = connection.lock()) {
        HttpResponse response = gateway.handle(request);
        client->append_response(Protocol::format(response, !client->closing()));
        client->set_in_flight(false);
        if (on_complete)
            on_complete();
    } else {
        // The Reactor already deleted this connection
        log_info("Worker", "Skipping task: client already disconnected");
    }
}


HttpServer::~HttpServer() {
    stop();
    workers_.clear(); // joins before the members they use go away
    if (s_this_server == this)
        s_this_server = nullptr;
}

uint16_t HttpServer::listen(uint16_t port) {
    if (listen_socket_.valid())
        throw std::runtime_error("Server is already listening");

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd == -1)
        throw std::runtime_error("Failed to create socket");

    listen_socket_ = UniqueFd(fd);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port); // Converts port to network byte order

    int opt = 1;
    if (setsockopt(listen_socket_.fd(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) == -1)
        throw std::runtime_error("setsockopt(SO_REUSEADDR) failed");

    if (::bind(listen_socket_.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1)
        throw std::runtime_error("Bind failed on port " + std::to_string(port));

    if (::listen(listen_socket_.fd(), SOMAXCONN) == -1)
        throw std::runtime_error("Listen failed");

    // Port 0 means the kernel picked one
    socklen_t len = sizeof(addr);
    if (::getsockname(listen_socket_.fd(), reinterpret_cast<sockaddr*>(&addr), &len) == -1)
        throw std::runtime_error("getsockname failed");
    port_ = ntohs(addr.sin_port);
    return port_;
}

void HttpServer::start(uint16_t port) {
    listen(port);
    log_info("Server", "Listening on port " + std::to_string(port_));
    run();
}

void HttpServer::install_signal_handlers() {
    s_this_server = this;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

void HttpServer::run() {
    if (!listen_socket_.valid())
        throw std::runtime_error("Server is not listening");
    if (running_.exchange(true))
        throw std::runtime_error("Server is already running");

    std::signal(SIGPIPE, SIG_IGN); // ignore SIGPIPE

    poll_fds_.push_back({listen_socket_.fd(), POLLIN, 0}); // The server listening socket
    poll_fds_.push_back({waker_.read_fd(), POLLIN, 0}); // The read-end of the self-pipe

    setup_workers();
    try {
        run_reactor();
    } catch (const std::exception& e) {
        log_error("Server", std::string{"reactor stopped: "} + e.what());
        stop();
    }

    // Workers finish the request in hand; queued ones are dropped with their clients
    task_deque_.close();
    workers_.clear(); // jthread auto cleanup
    clients_.clear();
    fd_idx_map_.clear();
    poll_fds_.clear();
    listen_socket_.reset(); // stop accepting new clients
    running_ = false;
    log_info("Server", "Stopped");
}

void HttpServer::run_reactor() {
    while (!stop_requested_) {
        apply_dirty_updates();
        int activity = poll(poll_fds_.data(), poll_fds_.size(), -1); // Block until a FD is ready
        if (activity < 0) {
            if (errno == EINTR) // interrupted syscall, eg: SIGWINCH or SIGCONT
                continue;
            throw std::runtime_error("poll failed");
        }

        for (size_t i = 0; i < poll_fds_.size(); i++) {
            short revents = poll_fds_[i].revents;
            // Nothing on current fd
            if (revents == 0)
                continue;
            poll_fds_[i].revents = 0;
            int fd = poll_fds_[i].fd;

            // Waker poke
            if (fd == waker_.read_fd()) {
                waker_.clear();
                continue;
            }

            // New client
            if (fd == listen_socket_.fd()) {
                if (revents & POLLIN)
                    handle_new_connection();
                continue;
            }

            // Handle errors (Disconnects)
            if (revents & (POLLERR | POLLNVAL)) {
                handle_client_dc(i);
                continue;
            }

            // Read from client (a hang-up shows up as a 0-byte read)
            if (revents & (POLLIN | POLLHUP)) {
                if (!handle_new_request(i))
                    continue;
            }

            // Write to client
            if (revents & POLLOUT) {
                handle_client_write(i);
            }
        }
    }
}

void HttpServer::apply_dirty_updates() {
    std::vector<int> local_dirty;
    {
        // Swap to a local vector to keep the lock time minimal
        std::lock_guard lock(dirty_mutex_);
        local_dirty.swap(dirty_fds_);
    }

    for (auto fd : local_dirty) {
        auto it = fd_idx_map_.find(fd);
        if (it == fd_idx_map_.end())
            continue;
        poll_fds_[it->second].events |= POLLOUT;
        // A pipelined request may already be waiting in the inbox
        dispatch_next(fd, clients_[fd]);
    }
}

void HttpServer::mark_as_dirty(int fd) {
    {
        std::lock_guard lock(dirty_mutex_);
        dirty_fds_.push_back(fd);
    }
    waker_.notify();
}

bool HttpServer::handle_client_write(size_t& poll_fds_idx) {
    int fd = poll_fds_[poll_fds_idx].fd;
    auto& client_connection = clients_[fd];

    try {
        if (!client_connection->write_from_outbox()) {  // if "everything has been written"
            poll_fds_[poll_fds_idx].events &= ~POLLOUT; // Outbox empty, turn off POLLOUT
            if (client_connection->closing() && !client_connection->in_flight()) {
                handle_client_dc(poll_fds_idx);
                return false;
            }
        }
    } catch (IOError&) {
        handle_client_dc(poll_fds_idx);
        return false;
    }
    return true;
}

void HttpServer::handle_client_dc(size_t& poll_fds_idx) {
    int moving_fd = poll_fds_.back().fd;
    int dead_fd = poll_fds_[poll_fds_idx].fd;

    // swap & pop to remove dead connection in O(1)
    if (poll_fds_idx < poll_fds_.size() - 1) {
        std::swap(poll_fds_[poll_fds_idx], poll_fds_.back());
        fd_idx_map_[moving_fd] = poll_fds_idx;
    }
    fd_idx_map_.erase(dead_fd);
    clients_.erase(dead_fd);
    poll_fds_.pop_back();
    poll_fds_idx--; // revisit the slot the moved fd now occupies

    log_info("Server", "Client [" + std::to_string(dead_fd) + "] disconnected");
}

void HttpServer::handle_new_connection() {
    while (auto client = accept()) {
        int current_fd = client->fd();
        poll_fds_.push_back({current_fd, POLLIN, 0});
        fd_idx_map_[current_fd] = poll_fds_.size() - 1;
        clients_[current_fd] = std::make_shared<Connection>(std::move(*client));
        log_info("Server", "Client [" + std::to_string(current_fd) + "] connected on port " +
                           std::to_string(port_));
    }
}

bool HttpServer::handle_new_request(size_t& poll_fds_idx) {
    int fd = poll_fds_[poll_fds_idx].fd;
    auto client_connection = clients_[fd];
    try {
        // Pull data from the OS into our buffer
        if (!client_connection->read_to_inbox()) {
            handle_client_dc(poll_fds_idx);
            return false;
        }
    } catch (const BufferOverflowError& e) {
        client_connection->close_after_flush();
        client_connection->append_response(Protocol::format(Gateway::error(413, e.what()), false));
        poll_fds_[poll_fds_idx].events |= POLLOUT;
        return true;
    } catch (const IOError&) {
        handle_client_dc(poll_fds_idx);
        return false;
    }

    dispatch_next(fd, client_connection);
    return true;
}

void HttpServer::dispatch_next(int fd, const std::shared_ptr<Connection>& client_connection) {
    if (!client_connection || client_connection->in_flight() || client_connection->closing())
        return;

    try {
        auto message = client_connection->try_get_message();
        if (!message)
            return;

        HttpRequest request = Protocol::parse(*message);
        request.received = std::chrono::steady_clock::now();
        if (!request.keep_alive())
            client_connection->close_after_flush();
        client_connection->set_in_flight(true);

        // Push to worker pool
        task_deque_.push_back(Task{
            .connection = client_connection,
            .request = std::move(request),
            .on_complete = [this, fd]() { mark_as_dirty(fd); }
        });
    } catch (const ProtocolError& e) {
        client_connection->close_after_flush();
        client_connection->append_response(
            Protocol::format(Gateway::error(e.status(), e.what()), false));
        auto it = fd_idx_map_.find(fd);
        if (it != fd_idx_map_.end())
            poll_fds_[it->second].events |= POLLOUT;
    }
}

void HttpServer::stop() noexcept {
    stop_requested_ = true;
    waker_.notify();
}

std::optional<UniqueFd> HttpServer::accept() {
    struct sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);

    // Create non-blocking client socket
    int client_fd = ::accept4(
        listen_socket_.fd(),
        reinterpret_cast<sockaddr*>(&client_addr),
        &client_len,
        SOCK_NONBLOCK | SOCK_CLOEXEC
    );

    if (client_fd < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == ECONNABORTED || errno == EINTR)
            return std::nullopt;
        throw std::runtime_error("Accept failed");
    }

     return UniqueFd{client_fd};
}

bool HttpServer::is_running() const noexcept {
    return running_;
}

void HttpServer::worker_loop(std::stop_token stop_token) {
    while(!stop_token.stop_requested()) {
        auto task = task_deque_.wait_and_pop_front(stop_token);
        if (!task) {
            if (task_deque_.closed())
                break; // closed and empty: pop would return at once from now on
            continue;
        }
        try {
            task->execute(gateway_);
        } catch (const std::exception& e) {
            log_error("Worker", e.what());
        }
    }
}

void HttpServer::setup_workers() {
    for (size_t i = 0; i < num_workers_; i++) {
        workers_.emplace_back([this](std::stop_token stop_token) {
            worker_loop(stop_token);
        });
    }
}


} // namespace ankiplace
