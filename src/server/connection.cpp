/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Connection Implementation
 */

#include "server/connection.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

namespace qcache::server {

namespace lc = util::log_component;

namespace {

constexpr const char* kServerName = "QCACHE/0.1.0";

std::string to_lower(std::string_view value) {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

bool is_client_error(const beast::error_code& ec) {
    return ec == http::error::bad_method
        || ec == http::error::bad_target
        || ec == http::error::bad_version
        || ec == http::error::bad_field
        || ec == http::error::bad_value
        || ec == http::error::bad_content_length
        || ec == http::error::bad_transfer_encoding
        || ec == http::error::bad_chunk
        || ec == http::error::partial_message;
}

} // namespace

std::optional<std::string> HttpRequest::header(std::string_view name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string_view HttpRequest::path() const {
    std::string_view view(target);
    return view.substr(0, view.find('?'));
}

Connection::Connection(tcp::socket socket,
                       std::shared_ptr<const RequestHandler> handler,
                       ConnectionLimits limits,
                       std::shared_ptr<ConnectionTracker> tracker)
    : stream_(std::move(socket))
    , handler_(std::move(handler))
    , limits_(limits)
    , tracker_(std::move(tracker))
{
    ++tracker_->active;

    beast::error_code ec;
    auto endpoint = stream_.socket().remote_endpoint(ec);
    if (!ec) {
        client_ip_ = endpoint.address().to_string();
        client_port_ = endpoint.port();
    }
}

Connection::~Connection() {
    --tracker_->active;
}

void Connection::start() {
    asio::dispatch(stream_.get_executor(),
                   beast::bind_front_handler(&Connection::read_request, shared_from_this()));
}

void Connection::read_request() {
    parser_.emplace();
    parser_->body_limit(limits_.max_body_bytes);

    stream_.expires_after(limits_.io_timeout);
    http::async_read(stream_, buffer_, *parser_,
                     beast::bind_front_handler(&Connection::on_read, shared_from_this()));
}

void Connection::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        close();
        return;
    }
    if (ec == http::error::body_limit) {
        QCACHE_LOG_WARN(lc::Server, "{} sent a body over {} bytes", client_ip_, limits_.max_body_bytes);
        respond(error_response(http::status::payload_too_large, "Request body too large"), 11, true);
        return;
    }
    if (is_client_error(ec)) {
        QCACHE_LOG_WARN(lc::Server, "Malformed request from {}: {}", client_ip_, ec.message());
        respond(error_response(http::status::bad_request, "Malformed HTTP request"), 11, true);
        return;
    }
    if (ec) {
        if (ec != beast::error::timeout && ec != asio::error::operation_aborted) {
            QCACHE_LOG_DEBUG(lc::Server, "Read from {} failed: {}", client_ip_, ec.message());
        }
        close();
        return;
    }

    auto version = parser_->get().version();
    auto keep_alive = parser_->get().keep_alive();

    auto request = to_http_request(parser_->release());
    request.client_ip = client_ip_;
    request.client_port = client_port_;

    HttpResponse response;
    try {
        response = (*handler_)(request);
    } catch (const std::exception& e) {
        QCACHE_LOG_ERROR(lc::Server, "Handler failed for {} {}: {}",
                         std::string(http::to_string(request.method)), request.target, e.what());
        response = error_response(http::status::internal_server_error, "Internal server error");
    }

    respond(std::move(response), version, !keep_alive);
}

void Connection::respond(HttpResponse response, unsigned version, bool close_after) {
    auto message = std::make_shared<http::response<http::string_body>>(response.status, version);
    message->set(http::field::server, kServerName);
    message->set(http::field::content_type, response.content_type);
    for (const auto& [name, value] : response.headers) {
        message->set(name, value);
    }
    message->body() = std::move(response.body);

    close_after = close_after || tracker_->draining.load();
    message->keep_alive(!close_after);
    message->prepare_payload();

    response_ = message;
    stream_.expires_after(limits_.io_timeout);
    http::async_write(stream_, *response_,
                      beast::bind_front_handler(&Connection::on_write, shared_from_this(), close_after));
}

void Connection::on_write(bool close_after, beast::error_code ec, std::size_t) {
    response_.reset();

    if (ec) {
        if (ec != asio::error::operation_aborted) {
            QCACHE_LOG_DEBUG(lc::Server, "Write to {} failed: {}", client_ip_, ec.message());
        }
        close();
        return;
    }
    if (close_after) {
        close();
        return;
    }
    read_request();
}

void Connection::close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != beast::errc::not_connected) {
        QCACHE_LOG_TRACE(lc::Server, "Shutdown of {}: {}", client_ip_, ec.message());
    }
}

HttpRequest Connection::to_http_request(http::request<http::string_body>&& request) {
    HttpRequest converted;
    converted.method = request.method();
    converted.target = std::string(request.target());
    converted.version = request.version();

    for (const auto& field : request) {
        auto [it, inserted] = converted.headers.emplace(to_lower(std::string(field.name_string())),
                                                        std::string(field.value()));
        if (!inserted) {
            it->second += ", ";
            it->second += std::string(field.value());
        }
    }

    converted.body = std::move(request.body());
    return converted;
}

HttpResponse Connection::error_response(http::status status, std::string_view message) {
    return HttpResponse{
        .status = status,
        .content_type = "application/json",
        .body = nlohmann::json{{"error", std::string(message)}}.dump()
    };
}

} // namespace qcache::server
