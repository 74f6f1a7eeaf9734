#include "http_session.hpp"
#include "logger.hpp"
#include "request_handler.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/core/ignore_unused.hpp>

namespace accounts {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

HttpSession::HttpSession(tcp::socket &&socket,
                         std::shared_ptr<const RequestHandler> handler,
                         const ServerConfig &config)
    : stream_(std::move(socket)), handler_(std::move(handler)),
      requestTimeout_(config.requestTimeout),
      bodyLimit_(config.maxRequestBodySize), serverName_(config.serverName) {
  SESSION_LOG_DEBUG("HttpSession created, timeout {}s, body limit {} bytes",
                    requestTimeout_.count(), bodyLimit_);
}

HttpSession::~HttpSession() { SESSION_LOG_DEBUG("HttpSession destroyed"); }

void HttpSession::run() {
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::doRead,
                                          shared_from_this()));
}

void HttpSession::doRead() {
  // A fresh parser per request; the body limit applies to each one
  parser_.emplace();
  parser_->body_limit(bodyLimit_);

  stream_.expires_after(requestTimeout_);

  beast::http::async_read(
      stream_, buffer_, *parser_,
      beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void HttpSession::onRead(beast::error_code ec, std::size_t bytesTransferred) {
  boost::ignore_unused(bytesTransferred);

  if (ec == beast::http::error::end_of_stream) {
    SESSION_LOG_DEBUG("Client closed the connection");
    return doClose();
  }

  if (ec == beast::error::timeout) {
    SESSION_LOG_WARN("Request timed out after {}s, closing",
                     requestTimeout_.count());
    return;
  }

  if (ec == beast::http::error::body_limit) {
    SESSION_LOG_WARN("Request body exceeds {} bytes", bodyLimit_);
    return sendPlainError(beast::http::status::payload_too_large,
                          "Request body too large", requestVersion());
  }

  if (ec) {
    if (ec.category() ==
        beast::http::make_error_code(beast::http::error::bad_target)
            .category()) {
      SESSION_LOG_WARN("Malformed request: {}", ec.message());
      return sendPlainError(beast::http::status::bad_request, "Bad request",
                            requestVersion());
    }
    SESSION_LOG_ERROR("Read failed: {}", ec.message());
    return;
  }

  const unsigned version = parser_->get().version();
  Request request = parser_->release();
  Response response;
  try {
    response = handler_->handleRequest(std::move(request));
  } catch (const std::exception &e) {
    SESSION_LOG_ERROR("Request handler threw: {}", e.what());
    return sendPlainError(beast::http::status::internal_server_error,
                          "Internal server error", version);
  }
  sendResponse(std::move(response));
}

unsigned HttpSession::requestVersion() const {
  if (parser_ && parser_->is_header_done()) {
    return parser_->get().version();
  }
  return 11;
}

void HttpSession::sendResponse(Response &&response) {
  auto message = std::make_shared<Response>(std::move(response));
  auto self = shared_from_this();
  beast::http::async_write(
      stream_, *message,
      [self, message](beast::error_code ec, std::size_t bytesTransferred) {
        self->onWrite(message->need_eof(), ec, bytesTransferred);
      });
}

void HttpSession::sendPlainError(beast::http::status status,
                                 const std::string &body, unsigned version) {
  Response response{status, version};
  response.set(beast::http::field::server, serverName_);
  response.set(beast::http::field::content_type, "text/plain; charset=utf-8");
  response.keep_alive(false);
  response.body() = body;
  response.prepare_payload();
  sendResponse(std::move(response));
}

void HttpSession::onWrite(bool close, beast::error_code ec,
                          std::size_t bytesTransferred) {
  boost::ignore_unused(bytesTransferred);

  if (ec) {
    SESSION_LOG_ERROR("Write failed: {}", ec.message());
    return;
  }

  if (close) {
    return doClose();
  }

  doRead();
}

void HttpSession::doClose() {
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  if (ec && ec != beast::errc::not_connected) {
    SESSION_LOG_DEBUG("Shutdown reported: {}", ec.message());
  }
}

} // namespace accounts
