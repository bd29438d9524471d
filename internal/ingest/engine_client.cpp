#include "engine_client.hpp"

#include "chatrelay/v1.hpp"
#include "internal/model/json.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace chatrelay::ingest {

using observability::IntField;
using observability::StringField;

EngineControlClient::EngineControlClient(EngineEndpoints endpoints, std::shared_ptr<http::HttpClient> client)
    : endpoints_(std::move(endpoints)), client_(std::move(client)) {}

bool EngineControlClient::Post(std::string_view op, const std::string& url, std::string body) {
  if (util::Trim(url).empty()) return false;

  http::ClientRequest request;
  request.url     = url;
  request.body    = std::move(body);
  request.timeout = endpoints_.timeout;
  request.headers.emplace_back("Content-Type", "application/json");

  try {
    auto response = client_->Send(request);
    if (!response.Ok()) {
      CHATRELAY_LOG_WARN(std::string(op) + "_non_2xx", {IntField("code", response.status)});
      return false;
    }
    return true;
  } catch (const util::TransportError& e) {
    CHATRELAY_LOG_WARN(std::string(op) + "_error", {StringField("error", e.what())});
    return false;
  }
}

bool EngineControlClient::Send(const std::string& to, const std::string& message) {
  chatrelay::v1::SendRequest req;
  req.set_recipient(to);
  req.set_message(message);
  return Post("send", endpoints_.send_url, model::ToJson(req));
}

bool EngineControlClient::SetTyping(const std::string& chat, bool typing, const std::string& media) {
  chatrelay::v1::TypingRequest req;
  req.set_recipient(chat);
  req.set_typing(typing);
  req.set_media(media);
  return Post("typing", endpoints_.typing_url, model::ToJsonWithDefaults(req));
}

bool EngineControlClient::MarkRead(const std::string& chat, const std::string& sender, const std::vector<std::string>& message_ids) {
  if (chat.empty() || message_ids.empty()) return false;

  chatrelay::v1::MarkReadRequest req;
  req.set_recipient(chat);
  req.set_receipt_type("read");
  if (!util::Trim(sender).empty()) req.set_sender(sender);
  for (const auto& id : message_ids) req.add_message_ids(id);
  return Post("markread", endpoints_.markread_url, model::ToJson(req));
}

} // namespace chatrelay::ingest
