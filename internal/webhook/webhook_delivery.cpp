#include "webhook_delivery.hpp"

#include "internal/observability/logging.hpp"
#include "internal/ratelimit/retry.hpp"
#include "internal/util/errors.hpp"
#include "internal/webhook/signature.hpp"

namespace chatrelay::webhook {

using observability::IntField;
using observability::StringField;

WebhookDelivery::WebhookDelivery(WebhookOptions options, std::shared_ptr<http::HttpClient> client, runtime::TaskExecutor& executor, util::Context ctx)
    : options_(std::move(options)), client_(std::move(client)), executor_(executor), ctx_(std::move(ctx)) {
}

http::ClientRequest WebhookDelivery::BuildRequest(model::Envelope env, util::TimePoint now) const {
  model::StampIfUnset(env, now);
  if (env.extra().fields().empty() && !options_.default_extra.fields().empty()) {
    *env.mutable_extra() = options_.default_extra;
  }

  http::ClientRequest request;
  request.method  = "POST";
  request.url     = options_.url;
  request.body    = model::Serialize(env);
  request.timeout = options_.timeout;

  request.headers.emplace_back("Content-Type", "application/json");
  request.headers.emplace_back(std::string(kTimestampHeader), util::FormatRfc3339(now));
  for (const auto& [name, value] : options_.headers) {
    request.headers.emplace_back(name, value);
  }
  if (!options_.secret.empty()) {
    request.headers.emplace_back(std::string(kSignatureHeader), SignBody(options_.secret, request.body));
  }
  return request;
}

bool WebhookDelivery::Deliver(const util::Context& ctx, model::Envelope env) {
  const auto request = BuildRequest(std::move(env), util::Now());

  try {
    ratelimit::WithRetry(ctx, options_.max_attempts, options_.base_delay, "webhook", [&](const util::Context&) {
      auto response = client_->Send(request);
      if (!response.Ok()) {
        throw util::TransportError("webhook status " + std::to_string(response.status));
      }
    });
    return true;
  } catch (const util::Cancelled&) {
    CHATRELAY_LOG_WARN("webhook_cancelled", {StringField("url", options_.url)});
  } catch (const std::exception& e) {
    CHATRELAY_LOG_WARN("webhook_post_failed", {StringField("url", options_.url), IntField("attempts", options_.max_attempts), StringField("error", e.what())});
  }
  return false;
}

void WebhookDelivery::Enqueue(model::Envelope env) {
  auto accepted = executor_.Submit([this, env = std::move(env)]() mutable { Deliver(ctx_, std::move(env)); });
  if (!accepted) {
    CHATRELAY_LOG_WARN("webhook_dropped", {StringField("reason", "executor_stopped")});
  }
}

} // namespace chatrelay::webhook
