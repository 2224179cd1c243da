/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Server - HTTP listener, worker threads and lifecycle
 *
 * Shutdown is graceful: the listener closes first, open connections finish
 * their current exchange, and the workers stop once every connection is
 * gone or the drain timeout expires.
 */

#ifndef QCACHE_SERVER_SERVER_HPP
#define QCACHE_SERVER_SERVER_HPP

#include "server/connection.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace qcache::server {

struct ServerConfig {
    std::uint16_t port{8080};  // 0 = ephemeral, see bound_port()
    std::size_t thread_count{1};
    std::string bind_address{"0.0.0.0"};
    ConnectionLimits limits;
    std::chrono::milliseconds drain_timeout{5000};
    bool handle_signals{true};  // SIGINT/SIGTERM stop, SIGHUP reloads
};

using ReloadHandler = std::function<void()>;

class Server {
public:
    Server(ServerConfig config, RequestHandler handler);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /**
     * Handler invoked on SIGHUP; set before start()
     */
    void on_reload(ReloadHandler handler);

    /**
     * Bind, listen and start the worker threads
     *
     * @throws std::runtime_error if the listener cannot be set up
     */
    void start();

    /**
     * Stop accepting and begin draining; returns immediately
     */
    void stop();

    /**
     * Block until all worker threads have exited
     */
    void wait();

    bool is_running() const noexcept;

    /**
     * Port the listener is bound to (valid after start())
     */
    std::uint16_t bound_port() const noexcept;

    std::size_t active_connections() const noexcept;

private:
    void open_listener();
    void accept_next();
    void watch_signals();
    void drain(std::chrono::steady_clock::time_point deadline);
    void run_worker(std::stop_token stop_token);

    ServerConfig config_;
    std::shared_ptr<const RequestHandler> handler_;
    ReloadHandler reload_handler_;

    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    tcp::acceptor acceptor_;
    asio::signal_set signals_;
    asio::steady_timer drain_timer_;

    std::shared_ptr<ConnectionTracker> tracker_;
    std::vector<std::jthread> workers_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint16_t> bound_port_{0};
};

} // namespace qcache::server

#endif // QCACHE_SERVER_SERVER_HPP
