#include "accounts_exceptions.hpp"
#include "http_server.hpp"
#include "request_handler.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace accounts;
using tcp = boost::asio::ip::tcp;

class HttpServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_ = ServerConfig::create("127.0.0.1", 0, 2);
    handler_ = std::make_shared<RequestHandler>(routes_, config_, DocsConfig{});
    server_ = std::make_unique<HttpServer>("127.0.0.1", 0, 2, config_);
    server_->setRequestHandler(handler_);
    server_->start();
  }

  void TearDown() override { server_->stop(); }

  http::response<http::string_body>
  roundTrip(boost::beast::tcp_stream &stream, const std::string &target,
            bool keepAlive = false) {
    http::request<http::string_body> req{http::verb::get, target, 11};
    req.set(http::field::host, "127.0.0.1");
    req.keep_alive(keepAlive);
    http::write(stream, req);

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);
    return res;
  }

  boost::beast::tcp_stream connect() {
    tcp::resolver resolver(ioc_);
    boost::beast::tcp_stream stream(ioc_);
    stream.connect(
        resolver.resolve("127.0.0.1", std::to_string(server_->boundPort())));
    return stream;
  }

  RouteTable routes_ = buildRouteTable();
  ServerConfig config_;
  std::shared_ptr<RequestHandler> handler_;
  std::unique_ptr<HttpServer> server_;
  boost::asio::io_context ioc_;
};

TEST_F(HttpServerTest, StartsOnEphemeralPort) {
  EXPECT_TRUE(server_->isRunning());
  EXPECT_NE(server_->boundPort(), 0);
}

TEST_F(HttpServerTest, ServesUserOverLoopback) {
  auto stream = connect();
  auto res = roundTrip(stream, "/users/550e8400-e29b-41d4-a716-446655440000");

  EXPECT_EQ(res.result(), http::status::ok);
  auto body = nlohmann::json::parse(res.body());
  EXPECT_EQ(body["firstName"], "Jane");
}

TEST_F(HttpServerTest, KeepAliveServesSeveralRequests) {
  auto stream = connect();

  auto first = roundTrip(stream, "/users/00000000-0000-0000-0000-000000000000",
                         true);
  EXPECT_EQ(first.result(), http::status::not_found);
  EXPECT_EQ(first.body(), "User not found");

  auto second = roundTrip(stream, "/users/not-a-uuid", true);
  EXPECT_EQ(second.result(), http::status::bad_request);

  auto third = roundTrip(stream, "/api", false);
  EXPECT_EQ(third.result(), http::status::ok);
  EXPECT_NE(third.body().find("api-reference"), std::string::npos);
}

TEST_F(HttpServerTest, OversizedBodyIsRejected) {
  config_.maxRequestBodySize = 16;
  HttpServer small("127.0.0.1", 0, 1, config_);
  small.setRequestHandler(handler_);
  small.start();

  tcp::resolver resolver(ioc_);
  boost::beast::tcp_stream stream(ioc_);
  stream.connect(
      resolver.resolve("127.0.0.1", std::to_string(small.boundPort())));

  http::request<http::string_body> req{http::verb::get, "/api", 11};
  req.set(http::field::host, "127.0.0.1");
  req.body() = std::string(64, 'x');
  req.prepare_payload();
  http::write(stream, req);

  boost::beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(stream, buffer, res);
  EXPECT_EQ(res.result(), http::status::payload_too_large);

  small.stop();
}

TEST_F(HttpServerTest, SecondBindOnSamePortFails) {
  HttpServer clash("127.0.0.1", server_->boundPort(), 1, config_);
  clash.setRequestHandler(handler_);

  try {
    clash.start();
    FAIL() << "Expected SystemException";
  } catch (const SystemException &e) {
    EXPECT_EQ(e.getCode(), ErrorCode::BIND_FAILED);
  }
  EXPECT_FALSE(clash.isRunning());
}

TEST_F(HttpServerTest, StopIsIdempotent) {
  server_->stop();
  EXPECT_FALSE(server_->isRunning());
  server_->stop();
  EXPECT_FALSE(server_->isRunning());
}

TEST_F(HttpServerTest, RestartAfterStopRunsFreshWorkers) {
  server_->stop();
  ASSERT_FALSE(server_->isRunning());

  server_->start();
  ASSERT_TRUE(server_->isRunning());

  auto stream = connect();
  auto res = roundTrip(stream, "/users/550e8400-e29b-41d4-a716-446655440000");
  EXPECT_EQ(res.result(), http::status::ok);

  server_->stop();
  EXPECT_FALSE(server_->isRunning());
}

TEST(HttpServerSetupTest, StartWithoutHandlerThrows) {
  HttpServer server("127.0.0.1", 0, 1);
  EXPECT_THROW(server.start(), SystemException);
  EXPECT_FALSE(server.isRunning());
}

TEST(HttpServerSetupTest, InvalidAddressIsBindFailure) {
  RouteTable routes = buildRouteTable();
  ServerConfig config;
  HttpServer server("not-an-address", 0, 1, config);
  server.setRequestHandler(
      std::make_shared<RequestHandler>(routes, config, DocsConfig{}));

  try {
    server.start();
    FAIL() << "Expected SystemException";
  } catch (const SystemException &e) {
    EXPECT_EQ(e.getCode(), ErrorCode::BIND_FAILED);
  }
}
