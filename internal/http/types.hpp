#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chatrelay::http {

struct Request {
  std::string method;
  std::string target;

  // keys lower-cased
  std::map<std::string, std::string> headers;

  std::string body;

  // Declared Content-Length, when the client sent one.
  std::optional<std::uint64_t> content_length;

  // Set by the server when the body exceeded its limit; `body` is empty then.
  bool body_too_large = false;

  std::string Header(std::string_view name) const;

  // target without the query string
  std::string Path() const;
};

struct Response {
  int         status       = 200;
  std::string content_type = "application/json";
  std::string body;

  std::vector<std::pair<std::string, std::string>> headers;

  static Response Json(int status, std::string body);
  static Response Text(int status, std::string body);
};

using Handler = std::function<Response(const Request&)>;

/*
  Exact-path dispatch. Unknown paths yield 404.
*/
class Router {
 public:
  void Handle(std::string path, Handler handler);

  Response Dispatch(const Request& request) const;

  // Adapter for Server.
  Handler AsHandler() const;

 private:
  std::map<std::string, Handler> routes_;
};

// Outbound request for HttpClient.
struct ClientRequest {
  std::string method = "POST";
  std::string url;
  std::string body;

  std::vector<std::pair<std::string, std::string>> headers;

  std::chrono::milliseconds timeout{7000};
};

struct ClientResponse {
  long        status = 0;
  std::string body;

  bool Ok() const {
    return status >= 200 && status < 300;
  }
};

} // namespace chatrelay::http
