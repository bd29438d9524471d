#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "chatrelay/v1.hpp"
#include "internal/http/http_client.hpp"

namespace chatrelay::ingest {

using BusinessReply = chatrelay::v1::BusinessReply;

struct BusinessOptions {
  std::string               url;
  std::string               channel = "whatsapp";
  std::chrono::milliseconds timeout{10000};
};

// "wa-" + sender
std::string SessionIdFor(const std::string& sender);

/*
  Downstream conversational backend: POST {sessionId, message, channel},
  answer {reply, leadScore, category}.
*/
class BusinessClient {
 public:
  BusinessClient(BusinessOptions options, std::shared_ptr<http::HttpClient> client);

  // nullopt when disabled, on any failure, or when the reply text is empty.
  std::optional<BusinessReply> Ask(const std::string& sender, const std::string& message);

 private:
  BusinessOptions                   options_;
  std::shared_ptr<http::HttpClient> client_;
};

} // namespace chatrelay::ingest
