#include "types.hpp"

#include "internal/util/text.hpp"

namespace chatrelay::http {

std::string Request::Header(std::string_view name) const {
  auto it = headers.find(util::ToLower(name));
  if (it == headers.end()) return {};
  return it->second;
}

std::string Request::Path() const {
  const auto q = target.find('?');
  return q == std::string::npos ? target : target.substr(0, q);
}

Response Response::Json(int status, std::string body) {
  Response r;
  r.status = status;
  r.body   = std::move(body);
  return r;
}

Response Response::Text(int status, std::string body) {
  Response r;
  r.status       = status;
  r.content_type = "text/plain; charset=utf-8";
  r.body         = std::move(body);
  return r;
}

void Router::Handle(std::string path, Handler handler) {
  routes_[std::move(path)] = std::move(handler);
}

Response Router::Dispatch(const Request& request) const {
  auto it = routes_.find(request.Path());
  if (it == routes_.end()) {
    return Response::Text(404, "not found");
  }
  return it->second(request);
}

Handler Router::AsHandler() const {
  return [this](const Request& request) { return Dispatch(request); };
}

} // namespace chatrelay::http
