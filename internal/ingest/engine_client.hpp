#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/http/http_client.hpp"

namespace chatrelay::ingest {

struct EngineEndpoints {
  std::string send_url;
  std::string typing_url;
  std::string markread_url;

  std::chrono::milliseconds timeout{5000};
};

/*
  Calls the engine REST control surface. An empty endpoint disables the
  call. Failures are logged and reported as false; nothing throws.
*/
class EngineControlClient {
 public:
  EngineControlClient(EngineEndpoints endpoints, std::shared_ptr<http::HttpClient> client);

  bool Send(const std::string& to, const std::string& message);
  bool SetTyping(const std::string& chat, bool typing, const std::string& media);

  // `sender` is required for groups and left out of the request when empty.
  bool MarkRead(const std::string& chat, const std::string& sender, const std::vector<std::string>& message_ids);

 private:
  bool Post(std::string_view op, const std::string& url, std::string body);

  EngineEndpoints                   endpoints_;
  std::shared_ptr<http::HttpClient> client_;
};

} // namespace chatrelay::ingest
