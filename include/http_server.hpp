#pragma once

#include "server_config.hpp"
#include <memory>
#include <string>

namespace accounts {

class RequestHandler;

/**
 * @brief Multi-threaded HTTP/1.1 server built on Boost.Beast.
 *
 * start() binds synchronously so that an unusable address surfaces as a
 * SystemException(BIND_FAILED) to the caller instead of a log line on a
 * worker thread.
 */
class HttpServer {
public:
  HttpServer(const std::string &address, unsigned short port, int threads = 1);
  HttpServer(const std::string &address, unsigned short port, int threads,
             const ServerConfig &config);
  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;

  void start();
  void stop();
  bool isRunning() const;

  void setRequestHandler(std::shared_ptr<const RequestHandler> handler);

  ServerConfig getServerConfig() const;

  // Port the acceptor is bound to; differs from the configured one for port 0
  unsigned short boundPort() const;

private:
  struct Impl;
  std::unique_ptr<Impl> pImpl;
};

} // namespace accounts
