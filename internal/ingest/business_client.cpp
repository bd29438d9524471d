#include "business_client.hpp"

#include "internal/model/json.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace chatrelay::ingest {

using observability::IntField;
using observability::StringField;

std::string SessionIdFor(const std::string& sender) {
  return "wa-" + sender;
}

BusinessClient::BusinessClient(BusinessOptions options, std::shared_ptr<http::HttpClient> client)
    : options_(std::move(options)), client_(std::move(client)) {}

std::optional<BusinessReply> BusinessClient::Ask(const std::string& sender, const std::string& message) {
  if (util::Trim(options_.url).empty()) return std::nullopt;

  chatrelay::v1::BusinessRequest req;
  req.set_sessionid(SessionIdFor(sender));
  req.set_message(message);
  req.set_channel(options_.channel);

  http::ClientRequest request;
  request.url     = options_.url;
  request.body    = model::ToJson(req);
  request.timeout = options_.timeout;
  request.headers.emplace_back("Content-Type", "application/json");

  http::ClientResponse response;
  try {
    response = client_->Send(request);
  } catch (const util::TransportError& e) {
    CHATRELAY_LOG_WARN("business_error", {StringField("error", e.what())});
    return std::nullopt;
  }
  if (!response.Ok()) {
    CHATRELAY_LOG_WARN("business_non_2xx", {IntField("code", response.status)});
    return std::nullopt;
  }

  BusinessReply reply;
  try {
    model::FromJson(response.body, &reply);
  } catch (const util::ValidationError& e) {
    CHATRELAY_LOG_WARN("business_decode_error", {StringField("error", e.what())});
    return std::nullopt;
  }
  if (util::Trim(reply.reply()).empty()) return std::nullopt;

  CHATRELAY_LOG_INFO("business_reply", {StringField("from", sender), IntField("score", static_cast<std::int64_t>(reply.leadscore())),
                                        StringField("category", reply.category()), IntField("reply_len", static_cast<std::int64_t>(util::RuneCount(reply.reply())))});
  return reply;
}

} // namespace chatrelay::ingest
