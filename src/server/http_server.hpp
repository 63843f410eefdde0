#pragma once

#include "ankiplace/gateway.hpp"
#include "ankiplace/protocol.hpp"
#include "ankiplace/task_deque.hpp"
#include "ankiplace/unique_fd.hpp"
#include "connection.hpp"
#include "waker.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <memory>
#include <mutex>
#include <poll.h>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ankiplace {

struct Task {
    std::weak_ptr<Connection> connection;
    HttpRequest request;
    std::function<void()> on_complete; // Reactor poke callback
    void execute(Gateway& gateway);
};


/*
 * Single-process HTTP/1.1 server.
 * One reactor thread polls the sockets; a pool of workers runs
 * the gateway, blocking on the store as long as needed.
 */
class HttpServer {
public:
    explicit HttpServer(Gateway& gateway, size_t num_workers = 8)
        : gateway_(gateway), num_workers_(num_workers) {};

    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    HttpServer(HttpServer&&) = delete;
    HttpServer& operator=(HttpServer&&) = delete;

    // Bind to the given port (0 picks a free one) and start listening.
    // Returns the bound port. Throws std::runtime_error on failure.
    uint16_t listen(uint16_t port);

    // Run the reactor until stop(); joins the workers before returning
    void run();

    // listen() then run()
    void start(uint16_t port);

    // Safe from any thread and from a signal handler
    void stop() noexcept;

    // Routes SIGINT and SIGTERM to stop()
    void install_signal_handlers();

    bool is_running() const noexcept;

    uint16_t port() const noexcept { return port_; }

private:
    Gateway& gateway_;
    UniqueFd listen_socket_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    uint16_t port_{0};

    // Reactor event loop
    void run_reactor();
    void handle_new_connection();
    // Both return false if the client was disconnected
    bool handle_new_request(size_t& poll_fds_idx);
    bool handle_client_write(size_t& poll_fds_idx);
    void handle_client_dc(size_t& poll_fds_idx);
    void dispatch_next(int fd, const std::shared_ptr<Connection>& client_connection);
    std::optional<UniqueFd> accept();

    // Thread pool
    size_t num_workers_{8};
    TaskDeque<Task> task_deque_;
    std::vector<std::jthread> workers_;
    std::vector<pollfd> poll_fds_;
    std::map<int, std::shared_ptr<Connection>> clients_; // fd -> connection map
    void setup_workers();
    void worker_loop(std::stop_token stop_token);

    // Waker
    Waker waker_;
    inline static HttpServer* s_this_server = nullptr;
    static void signal_handler(int) {
        if (s_this_server)
            s_this_server->stop();
    }

    // dirty list
    std::mutex dirty_mutex_;
    std::vector<int> dirty_fds_;
    std::unordered_map<int, size_t> fd_idx_map_;

    void mark_as_dirty(int fd);
    void apply_dirty_updates();

};

} // namespace ankiplace
