#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "internal/http/types.hpp"

namespace chatrelay::http {

struct ServerOptions {
  std::uint64_t body_limit_bytes = 1 << 20;
  unsigned      threads          = 2;
};

/*
  HTTP/1.1 server on Boost.Beast.

  Headers are read before the body so a request whose declared length is
  over the limit reaches the handler with body_too_large set and no body;
  the connection is closed after such a response.
*/
class Server {
 public:
  Server(std::string bind_address, Handler handler, ServerOptions options = {});
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  // Binds and starts serving. Throws std::runtime_error when the address cannot be bound.
  void Start();
  void Stop();

  // Bound port; useful with ":0".
  std::uint16_t Port() const;

 private:
  void DoAccept();

  std::string   bind_address_;
  Handler       handler_;
  ServerOptions options_;

  boost::asio::io_context        ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::vector<std::thread>       threads_;
  bool                           running_ = false;
};

} // namespace chatrelay::http
