#include "server/server.hpp"

#include <boost/asio/connect.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace qcache;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace bhttp = boost::beast::http;

namespace {

/**
 * Synchronous Beast client holding one connection open
 */
class TestClient {
public:
    explicit TestClient(std::uint16_t port)
        : socket_(io_context_)
    {
        socket_.connect({asio::ip::make_address("127.0.0.1"), port});
    }

    bhttp::response<bhttp::string_body> send(bhttp::request<bhttp::string_body> request) {
        request.prepare_payload();
        bhttp::write(socket_, request);

        bhttp::response<bhttp::string_body> response;
        bhttp::read(socket_, buffer_, response);
        return response;
    }

    bhttp::response<bhttp::string_body> post(const std::string& target, std::string body) {
        bhttp::request<bhttp::string_body> request{bhttp::verb::post, target, 11};
        request.set(bhttp::field::host, "localhost");
        request.set(bhttp::field::content_type, "application/json");
        request.set("X-Custom-Header", "one");
        request.insert("X-Custom-Header", "two");
        request.body() = std::move(body);
        return send(std::move(request));
    }

    bool closed_by_peer() {
        char byte;
        beast::error_code ec;
        socket_.read_some(asio::buffer(&byte, 1), ec);
        return ec == asio::error::eof || ec == asio::error::connection_reset;
    }

private:
    asio::io_context io_context_;
    asio::ip::tcp::socket socket_;
    beast::flat_buffer buffer_;
};

} // namespace

class ServerTest : public testing::Test {
protected:
    void SetUp() override {
        config_.port = 0;
        config_.bind_address = "127.0.0.1";
        config_.thread_count = 1;
        config_.handle_signals = false;
        config_.drain_timeout = std::chrono::milliseconds(500);
        config_.limits.max_body_bytes = 64;
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
            server_->wait();
        }
    }

    void start(server::RequestHandler handler) {
        server_ = std::make_unique<server::Server>(config_, std::move(handler));
        server_->start();
    }

    server::RequestHandler echo_handler() {
        return [this](const server::HttpRequest& request) {
            std::lock_guard<std::mutex> lock(mutex_);
            seen_.push_back(request);
            return server::HttpResponse{
                .status = bhttp::status::ok,
                .content_type = "application/json",
                .body = request.body,
                .headers = {{"X-Path", std::string(request.path())}}
            };
        };
    }

    std::vector<server::HttpRequest> seen() {
        std::lock_guard<std::mutex> lock(mutex_);
        return seen_;
    }

    server::ServerConfig config_;
    std::unique_ptr<server::Server> server_;
    std::mutex mutex_;
    std::vector<server::HttpRequest> seen_;
};

TEST_F(ServerTest, BindsEphemeralPortAndServesRequests) {
    start(echo_handler());
    ASSERT_TRUE(server_->is_running());
    ASSERT_NE(server_->bound_port(), 0);

    TestClient client(server_->bound_port());
    auto response = client.post("/graphql?debug=1", R"({"query":"{ a }"})");

    EXPECT_EQ(response.result(), bhttp::status::ok);
    EXPECT_EQ(response.body(), R"({"query":"{ a }"})");
    EXPECT_EQ(std::string(response[bhttp::field::server]), "QCACHE/0.1.0");
    EXPECT_EQ(std::string(response[bhttp::field::content_type]), "application/json");
    EXPECT_EQ(std::string(response["X-Path"]), "/graphql");
}

TEST_F(ServerTest, NormalizesRequestHeaders) {
    start(echo_handler());

    TestClient client(server_->bound_port());
    client.post("/graphql", "{}");

    auto requests = seen();
    ASSERT_EQ(requests.size(), 1u);
    const auto& request = requests.front();
    EXPECT_EQ(request.method, bhttp::verb::post);
    EXPECT_EQ(request.target, "/graphql");
    EXPECT_EQ(request.headers.count("x-custom-header"), 1u);
    EXPECT_EQ(request.header("X-Custom-Header"), "one, two");
    EXPECT_EQ(request.header("content-type"), "application/json");
    EXPECT_FALSE(request.header("x-missing").has_value());
    EXPECT_EQ(request.client_ip, "127.0.0.1");
    EXPECT_NE(request.client_port, 0);
}

TEST_F(ServerTest, KeepsConnectionAliveBetweenRequests) {
    start(echo_handler());

    TestClient client(server_->bound_port());
    auto first = client.post("/graphql", "1");
    auto second = client.post("/graphql", "2");

    EXPECT_TRUE(first.keep_alive());
    EXPECT_EQ(first.body(), "1");
    EXPECT_EQ(second.body(), "2");
    EXPECT_EQ(seen().size(), 2u);
}

TEST_F(ServerTest, ClosesWhenClientAsks) {
    start(echo_handler());

    TestClient client(server_->bound_port());
    bhttp::request<bhttp::string_body> request{bhttp::verb::get, "/health", 11};
    request.set(bhttp::field::host, "localhost");
    request.keep_alive(false);

    auto response = client.send(std::move(request));
    EXPECT_FALSE(response.keep_alive());
    EXPECT_TRUE(client.closed_by_peer());
}

TEST_F(ServerTest, RejectsOversizedBody) {
    start(echo_handler());

    TestClient client(server_->bound_port());
    auto response = client.post("/graphql", std::string(1000, 'x'));

    EXPECT_EQ(response.result(), bhttp::status::payload_too_large);
    EXPECT_FALSE(response.keep_alive());
    EXPECT_TRUE(seen().empty());
}

TEST_F(ServerTest, HandlerExceptionBecomes500) {
    start([](const server::HttpRequest&) -> server::HttpResponse {
        throw std::runtime_error("boom");
    });

    TestClient client(server_->bound_port());
    auto response = client.post("/graphql", "{}");

    EXPECT_EQ(response.result(), bhttp::status::internal_server_error);
    EXPECT_NE(response.body().find("Internal server error"), std::string::npos);

    // The connection survives a failed handler
    auto again = client.post("/graphql", "{}");
    EXPECT_EQ(again.result(), bhttp::status::internal_server_error);
}

TEST_F(ServerTest, StopDrainsWithinTimeout) {
    start(echo_handler());

    TestClient idle(server_->bound_port());
    idle.post("/graphql", "{}");
    EXPECT_EQ(server_->active_connections(), 1u);

    auto begin = std::chrono::steady_clock::now();
    server_->stop();
    server_->wait();
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_FALSE(server_->is_running());
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST_F(ServerTest, StopWithoutConnectionsIsPrompt) {
    start(echo_handler());

    auto begin = std::chrono::steady_clock::now();
    server_->stop();
    server_->wait();

    EXPECT_LT(std::chrono::steady_clock::now() - begin, config_.drain_timeout);
    EXPECT_EQ(server_->active_connections(), 0u);
}

TEST_F(ServerTest, InvalidBindAddressThrows) {
    config_.bind_address = "not-an-address";
    server::Server server(config_, echo_handler());

    EXPECT_THROW(server.start(), std::runtime_error);
    EXPECT_FALSE(server.is_running());
}
