#pragma once

#include "internal/http/types.hpp"

namespace chatrelay::http {

/*
  Blocking HTTP client seam. Implementations throw util::TransportError on
  transport failures; HTTP error statuses are returned, not thrown.
*/
class HttpClient {
 public:
  virtual ~HttpClient() = default;

  virtual ClientResponse Send(const ClientRequest& request) = 0;
};

/*
  libcurl implementation. One easy handle per request, safe to share
  across threads.
*/
class CurlHttpClient : public HttpClient {
 public:
  CurlHttpClient();

  ClientResponse Send(const ClientRequest& request) override;
};

} // namespace chatrelay::http
