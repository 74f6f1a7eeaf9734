#pragma once

#include "server_config.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <memory>
#include <optional>

namespace accounts {

class RequestHandler;

/**
 * @brief One HTTP/1.1 connection.
 *
 * Reads requests one after another, hands each to the RequestHandler and
 * writes the response back. The connection stays open while the client asks
 * for keep-alive; it is closed on end of stream, on a read error, or when the
 * request timeout elapses.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(boost::asio::ip::tcp::socket &&socket,
              std::shared_ptr<const RequestHandler> handler,
              const ServerConfig &config);
  ~HttpSession();

  void run();

private:
  using Request = boost::beast::http::request<boost::beast::http::string_body>;
  using Response =
      boost::beast::http::response<boost::beast::http::string_body>;

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  std::optional<boost::beast::http::request_parser<
      boost::beast::http::string_body>>
      parser_;
  std::shared_ptr<const RequestHandler> handler_;
  std::chrono::seconds requestTimeout_;
  size_t bodyLimit_;
  std::string serverName_;

  void doRead();
  void onRead(boost::beast::error_code ec, std::size_t bytesTransferred);
  void sendResponse(Response &&response);
  void onWrite(bool close, boost::beast::error_code ec,
               std::size_t bytesTransferred);
  void sendPlainError(boost::beast::http::status status,
                      const std::string &body, unsigned version);
  void doClose();
  unsigned requestVersion() const;
};

} // namespace accounts
