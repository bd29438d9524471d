#pragma once

#include <memory>
#include <string>

#include "internal/engine/engine.hpp"
#include "internal/http/server.hpp"
#include "internal/http/types.hpp"
#include "internal/util/context.hpp"

namespace chatrelay::engine {

/*
  REST control surface of the engine.

    POST /api/send      {recipient, message, media_path?, media_data?, mimetype?, filename?}
    POST /api/typing    {recipient, typing, media}
    POST /api/markread  {recipient, message_ids[], sender?, receipt_type?}

  Every reply is {success, message}: 405 for other methods, 400 for a
  malformed body, 500 when the engine call fails.
*/
class ControlServer {
 public:
  ControlServer(Engine& engine, util::Context ctx, std::string bind_address, unsigned threads = 2);

  ControlServer(const ControlServer&)            = delete;
  ControlServer& operator=(const ControlServer&) = delete;

  void Start();
  void Stop();

  std::uint16_t Port() const;

  // Routing without the network, for tests.
  http::Response Handle(const http::Request& request) const;

 private:
  http::Response Send(const http::Request& request) const;
  http::Response Typing(const http::Request& request) const;
  http::Response MarkRead(const http::Request& request) const;

  Engine&       engine_;
  util::Context ctx_;
  http::Router  router_;

  std::unique_ptr<http::Server> server_;
};

} // namespace chatrelay::engine
