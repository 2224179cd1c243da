/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Server Implementation
 */

#include "server/server.hpp"
#include "util/logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <csignal>
#include <stdexcept>

namespace qcache::server {

namespace lc = util::log_component;

namespace {

constexpr auto kDrainPollInterval = std::chrono::milliseconds(50);

void throw_on_error(const boost::system::error_code& ec, std::string_view step) {
    if (ec) {
        QCACHE_LOG_ERROR(lc::Server, "Listener {} failed: {}", step, ec.message());
        throw std::runtime_error(fmt::format("Listener {} failed: {}", step, ec.message()));
    }
}

} // namespace

Server::Server(ServerConfig config, RequestHandler handler)
    : config_(std::move(config))
    , handler_(std::make_shared<const RequestHandler>(std::move(handler)))
    , io_context_(static_cast<int>(std::max<std::size_t>(config_.thread_count, 1)))
    , work_guard_(asio::make_work_guard(io_context_))
    , acceptor_(io_context_)
    , signals_(io_context_)
    , drain_timer_(io_context_)
    , tracker_(std::make_shared<ConnectionTracker>())
{
}

Server::~Server() {
    stop();
    wait();
}

void Server::on_reload(ReloadHandler handler) {
    reload_handler_ = std::move(handler);
}

void Server::start() {
    if (running_.exchange(true)) {
        return;
    }

    try {
        open_listener();
    } catch (const std::exception&) {
        running_ = false;
        throw;
    }

    if (config_.handle_signals) {
        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.add(SIGHUP);
        watch_signals();
    }
    accept_next();

    auto threads = std::max<std::size_t>(config_.thread_count, 1);
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this](std::stop_token st) { run_worker(st); });
    }

    QCACHE_LOG_INFO(lc::Server, "Listening on {}:{} with {} worker threads",
                    config_.bind_address, bound_port_.load(), threads);
}

void Server::open_listener() {
    boost::system::error_code ec;
    auto address = asio::ip::make_address(config_.bind_address, ec);
    throw_on_error(ec, "address");

    tcp::endpoint endpoint(address, config_.port);

    acceptor_.open(endpoint.protocol(), ec);
    throw_on_error(ec, "open");

    acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (ec) {
        QCACHE_LOG_WARN(lc::Server, "SO_REUSEADDR not set: {}", ec.message());
    }

    acceptor_.bind(endpoint, ec);
    throw_on_error(ec, "bind");

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    throw_on_error(ec, "listen");

    bound_port_ = acceptor_.local_endpoint().port();
}

void Server::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    QCACHE_LOG_INFO(lc::Server, "Shutting down, {} connections open", tracker_->active.load());

    tracker_->draining = true;
    auto deadline = std::chrono::steady_clock::now() + config_.drain_timeout;

    asio::post(io_context_, [this, deadline] {
        boost::system::error_code ec;
        acceptor_.close(ec);
        signals_.cancel(ec);
        drain(deadline);
    });
}

void Server::drain(std::chrono::steady_clock::time_point deadline) {
    auto active = tracker_->active.load();
    if (active == 0 || std::chrono::steady_clock::now() >= deadline) {
        if (active > 0) {
            QCACHE_LOG_WARN(lc::Server, "Drain timeout, abandoning {} connections", active);
        }
        work_guard_.reset();
        io_context_.stop();
        return;
    }

    drain_timer_.expires_after(kDrainPollInterval);
    drain_timer_.async_wait([this, deadline](boost::system::error_code ec) {
        if (!ec) {
            drain(deadline);
        }
    });
}

void Server::wait() {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    if (!workers_.empty()) {
        workers_.clear();
        QCACHE_LOG_INFO(lc::Server, "Stopped after {} connections", tracker_->accepted.load());
    }
}

bool Server::is_running() const noexcept {
    return running_.load();
}

std::uint16_t Server::bound_port() const noexcept {
    return bound_port_.load();
}

std::size_t Server::active_connections() const noexcept {
    return tracker_->active.load();
}

void Server::run_worker(std::stop_token stop_token) {
    while (!stop_token.stop_requested()) {
        try {
            io_context_.run();
            return;
        } catch (const std::exception& e) {
            QCACHE_LOG_ERROR(lc::Server, "Worker caught exception: {}", e.what());
        }
    }
}

void Server::accept_next() {
    acceptor_.async_accept([this](boost::system::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
            return;
        }
        if (ec) {
            QCACHE_LOG_WARN(lc::Server, "Accept failed: {}", ec.message());
        } else {
            ++tracker_->accepted;
            std::make_shared<Connection>(std::move(socket), handler_, config_.limits, tracker_)->start();
        }
        accept_next();
    });
}

void Server::watch_signals() {
    signals_.async_wait([this](boost::system::error_code ec, int signal_number) {
        if (ec) {
            return;
        }

        if (signal_number != SIGHUP) {
            QCACHE_LOG_INFO(lc::Server, "Received signal {}", signal_number);
            stop();
            return;
        }

        if (reload_handler_) {
            QCACHE_LOG_INFO(lc::Server, "Received SIGHUP, reloading");
            try {
                reload_handler_();
            } catch (const std::exception& e) {
                QCACHE_LOG_ERROR(lc::Server, "Reload failed: {}", e.what());
            }
        }
        watch_signals();
    });
}

} // namespace qcache::server
