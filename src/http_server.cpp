#include "http_server.hpp"
#include "accounts_exceptions.hpp"
#include "http_session.hpp"
#include "logger.hpp"
#include "request_handler.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <algorithm>
#include <atomic>
#include <system_error>
#include <thread>
#include <vector>

namespace accounts {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace {

class Listener : public std::enable_shared_from_this<Listener> {
public:
  Listener(net::io_context &ioc, tcp::endpoint endpoint,
           std::shared_ptr<const RequestHandler> handler,
           const ServerConfig &config)
      : ioc_(ioc), acceptor_(net::make_strand(ioc)),
        handler_(std::move(handler)), config_(config) {
    beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      fail(ec, "open", endpoint);
    }

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
      fail(ec, "set_option", endpoint);
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      fail(ec, "bind", endpoint);
    }

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
      fail(ec, "listen", endpoint);
    }
  }

  void run() { doAccept(); }

  unsigned short port() const {
    beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

private:
  net::io_context &ioc_;
  tcp::acceptor acceptor_;
  std::shared_ptr<const RequestHandler> handler_;
  ServerConfig config_;

  [[noreturn]] void fail(beast::error_code ec, const char *what,
                         const tcp::endpoint &endpoint) {
    SystemException error(ErrorCode::BIND_FAILED,
                          std::string(what) + " failed: " + ec.message(),
                          "HttpServer");
    error.addContext("address", endpoint.address().to_string());
    error.addContext("port", std::to_string(endpoint.port()));
    throw error;
  }

  void doAccept() {
    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(&Listener::onAccept, shared_from_this()));
  }

  void onAccept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
      if (ec == net::error::operation_aborted ||
          ec == net::error::bad_descriptor) {
        HTTP_LOG_DEBUG("Listener stopped: {}", ec.message());
        return;
      }
      HTTP_LOG_WARN("Accept failed, continuing: {}", ec.message());
    } else {
      HTTP_LOG_DEBUG("Accepted connection");
      std::make_shared<HttpSession>(std::move(socket), handler_, config_)
          ->run();
    }

    doAccept();
  }
};

void logValidation(const ServerConfig::ValidationResult &validation) {
  for (const auto &error : validation.errors) {
    HTTP_LOG_ERROR("Invalid server configuration: {}", error);
  }
  for (const auto &warning : validation.warnings) {
    HTTP_LOG_WARN("Server configuration: {}", warning);
  }
}

} // namespace

struct HttpServer::Impl {
  std::string address;
  unsigned short port = 0;
  int threads = 1;
  ServerConfig config;
  std::shared_ptr<const RequestHandler> handler;
  std::unique_ptr<net::io_context> ioc;
  std::shared_ptr<Listener> listener;
  std::vector<std::thread> threadPool;
  std::atomic<bool> running{false};
};

HttpServer::HttpServer(const std::string &address, unsigned short port,
                       int threads)
    : HttpServer(address, port, threads,
                 ServerConfig::create(address, port, threads)) {}

HttpServer::HttpServer(const std::string &address, unsigned short port,
                       int threads, const ServerConfig &config)
    : pImpl(std::make_unique<Impl>()) {
  pImpl->address = address;
  pImpl->port = port;
  pImpl->threads = std::max(1, threads);
  pImpl->config = config;

  auto validation = pImpl->config.validate();
  logValidation(validation);
  if (!validation.isValid) {
    pImpl->config.applyDefaults();
    HTTP_LOG_INFO("Applied default values for invalid configuration");
  }
}

HttpServer::~HttpServer() { stop(); }

void HttpServer::start() {
  if (pImpl->running) {
    HTTP_LOG_WARN("HttpServer already running");
    return;
  }

  if (!pImpl->handler) {
    throw SystemException(ErrorCode::CONFIGURATION_ERROR,
                          "No request handler set", "HttpServer");
  }

  HTTP_LOG_INFO("Starting HTTP server on {}:{}", pImpl->address, pImpl->port);

  beast::error_code ec;
  auto const address = net::ip::make_address(pImpl->address, ec);
  if (ec) {
    SystemException error(ErrorCode::BIND_FAILED,
                          "Invalid listen address: " + ec.message(),
                          "HttpServer");
    error.addContext("address", pImpl->address);
    throw error;
  }

  pImpl->ioc = std::make_unique<net::io_context>(pImpl->threads);
  try {
    pImpl->listener = std::make_shared<Listener>(
        *pImpl->ioc, tcp::endpoint{address, pImpl->port}, pImpl->handler,
        pImpl->config);
  } catch (const SystemException &e) {
    HTTP_LOG_ERROR("Cannot listen on {}:{}: {}", pImpl->address, pImpl->port,
                   e.getMessage());
    pImpl->ioc.reset();
    throw;
  }
  pImpl->listener->run();

  // Set before spawning so stop() joins whatever workers did start
  pImpl->running = true;
  pImpl->threadPool.reserve(pImpl->threads);
  try {
    for (int i = 0; i < pImpl->threads; ++i) {
      pImpl->threadPool.emplace_back([this, i]() {
        HTTP_LOG_DEBUG("Worker {} starting", i);
        try {
          pImpl->ioc->run();
        } catch (const std::exception &e) {
          HTTP_LOG_ERROR("Worker {} exception: {}", i, e.what());
        }
        HTTP_LOG_DEBUG("Worker {} finished", i);
      });
    }
  } catch (const std::system_error &e) {
    HTTP_LOG_ERROR("Cannot start worker thread: {}", e.what());
    stop();
    throw SystemException(ErrorCode::CONFIGURATION_ERROR,
                          std::string("Cannot start worker threads: ") +
                              e.what(),
                          "HttpServer");
  }

  HTTP_LOG_INFO("HTTP server listening on {}:{} with {} threads",
                pImpl->address, boundPort(), pImpl->threads);
}

void HttpServer::stop() {
  if (!pImpl || !pImpl->running.exchange(false)) {
    return;
  }

  HTTP_LOG_INFO("Stopping HTTP server");
  pImpl->ioc->stop();

  for (auto &t : pImpl->threadPool) {
    if (t.joinable()) {
      t.join();
    }
  }
  pImpl->threadPool.clear();
  pImpl->listener.reset();
  pImpl->ioc.reset();

  HTTP_LOG_INFO("HTTP server stopped");
}

bool HttpServer::isRunning() const { return pImpl->running; }

void HttpServer::setRequestHandler(
    std::shared_ptr<const RequestHandler> handler) {
  HTTP_LOG_DEBUG("Request handler set: {}", handler ? "valid" : "null");
  pImpl->handler = std::move(handler);
}

ServerConfig HttpServer::getServerConfig() const { return pImpl->config; }

unsigned short HttpServer::boundPort() const {
  if (!pImpl->listener) {
    return 0;
  }
  return pImpl->listener->port();
}

} // namespace accounts
