/**
 * QCACHE - Full-Response Cache for GraphQL Servers
 * Connection - One HTTP/1.1 client connection served with Boost.Beast
 */

#ifndef QCACHE_SERVER_CONNECTION_HPP
#define QCACHE_SERVER_CONNECTION_HPP

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qcache::server {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

/**
 * Request as seen by the application
 */
struct HttpRequest {
    http::verb method{http::verb::unknown};
    std::string target;
    unsigned version{11};

    // Lowercase names; repeated headers are joined with ", "
    std::map<std::string, std::string> headers;

    std::string body;

    std::string client_ip;
    std::uint16_t client_port{0};

    std::optional<std::string> header(std::string_view name) const;

    /**
     * Target without the query string
     */
    std::string_view path() const;
};

struct HttpResponse {
    http::status status{http::status::ok};
    std::string content_type{"text/plain"};
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers{};
};

using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

struct ConnectionLimits {
    std::chrono::seconds io_timeout{30};
    std::size_t max_body_bytes{1024 * 1024};
};

/**
 * Shared between the server and its live connections
 */
struct ConnectionTracker {
    std::atomic<std::size_t> active{0};
    std::atomic<std::uint64_t> accepted{0};
    std::atomic<bool> draining{false};  // Finish the current exchange, then close
};

/**
 * Reads requests, hands them to the handler and writes the responses back,
 * one at a time, until the client or the server ends the connection.
 *
 * The handler runs on the io_context thread that completed the read.
 */
class Connection : public std::enable_shared_from_this<Connection> {
public:
    Connection(tcp::socket socket,
               std::shared_ptr<const RequestHandler> handler,
               ConnectionLimits limits,
               std::shared_ptr<ConnectionTracker> tracker);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    void start();

    /**
     * Convert a parsed Beast request into an HttpRequest
     */
    static HttpRequest to_http_request(http::request<http::string_body>&& request);

private:
    void read_request();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void respond(HttpResponse response, unsigned version, bool close_after);
    void on_write(bool close_after, beast::error_code ec, std::size_t bytes_transferred);
    void close();

    static HttpResponse error_response(http::status status, std::string_view message);

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<http::response<http::string_body>> response_;

    std::shared_ptr<const RequestHandler> handler_;
    ConnectionLimits limits_;
    std::shared_ptr<ConnectionTracker> tracker_;

    std::string client_ip_;
    std::uint16_t client_port_{0};
};

} // namespace qcache::server

#endif // QCACHE_SERVER_CONNECTION_HPP
