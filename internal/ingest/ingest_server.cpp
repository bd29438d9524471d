#include "ingest_server.hpp"

#include <sstream>

#include "internal/identity/chat_id.hpp"
#include "internal/model/json.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"
#include "internal/webhook/signature.hpp"

namespace chatrelay::ingest {

using observability::IntField;
using observability::StringField;

IngestServer::IngestServer(IngestOptions options, dedupe::DedupeCache& dedupe, EventRouter& router, EngineControlClient& engine,
                           profile::ProfileStore& profiles, runtime::TaskExecutor& executor)
    : options_(std::move(options)), dedupe_(dedupe), router_(router), engine_(engine), profiles_(profiles), executor_(executor) {
  routes_.Handle("/wh", [this](const http::Request& r) { return HandleWebhook(r); });
  routes_.Handle("/healthz", [](const http::Request&) { return http::Response::Text(200, "ok"); });
  routes_.Handle("/readyz", [](const http::Request&) { return http::Response::Text(200, "ready"); });
  routes_.Handle("/debug/profiles", [this](const http::Request& r) { return DebugProfiles(r); });
  routes_.Handle("/", [](const http::Request&) { return http::Response::Text(200, "chatrelay-ingest up"); });

  http::ServerOptions server_options;
  server_options.body_limit_bytes = options_.body_limit_bytes;
  server_options.threads          = options_.threads == 0 ? 2 : options_.threads;
  server_                         = std::make_unique<http::Server>(options_.bind_address, routes_.AsHandler(), server_options);
}

void IngestServer::Start() {
  server_->Start();
}

void IngestServer::Stop() {
  server_->Stop();
}

std::uint16_t IngestServer::Port() const {
  return server_->Port();
}

http::Response IngestServer::Handle(const http::Request& request) const {
  return routes_.Dispatch(request);
}

// ------------------------------------------------------------------
// POST /wh
// ------------------------------------------------------------------

http::Response IngestServer::HandleWebhook(const http::Request& request) const {
  if (request.method != "POST") {
    return http::Response::Text(405, "method not allowed");
  }

  const bool declared_over = request.content_length && *request.content_length > options_.body_limit_bytes;
  if (request.body_too_large || declared_over || request.body.size() > options_.body_limit_bytes) {
    CHATRELAY_LOG_WARN("wh_rejected", {StringField("reason", "body_too_large")});
    return http::Response::Text(413, "payload too large");
  }

  if (options_.check_timestamp) {
    const auto header = request.Header(webhook::kTimestampHeader);
    if (!webhook::VerifyTimestamp(header, util::Now(), options_.timestamp_skew)) {
      CHATRELAY_LOG_WARN("wh_rejected", {StringField("reason", "invalid_timestamp")});
      return http::Response::Text(401, "invalid timestamp");
    }
  }

  if (options_.require_signature) {
    const auto header = request.Header(webhook::kSignatureHeader);
    if (!webhook::VerifySignature(options_.secret, request.body, header)) {
      CHATRELAY_LOG_WARN("wh_rejected", {StringField("reason", "invalid_signature")});
      return http::Response::Text(401, "invalid signature");
    }
  } else if (options_.secret.empty()) {
    CHATRELAY_LOG_DEBUG("signature_not_required_dev_mode");
  }

  model::Envelope env;
  try {
    env = model::Parse(request.body);
  } catch (const util::ValidationError& e) {
    CHATRELAY_LOG_WARN("wh_rejected", {StringField("reason", "invalid_envelope"), StringField("error", e.what())});
    return http::Response::Text(400, "invalid envelope");
  }

  CHATRELAY_LOG_INFO("event", {StringField("type", util::Trim(env.event_type())), StringField("dir", env.direction()), StringField("chat", env.chat_id()),
                               StringField("sender", env.sender_id()), StringField("msg_id", env.message_id())});

  if (!executor_.Submit([this, env] { Process(env); })) {
    CHATRELAY_LOG_WARN("wh_dropped", {StringField("reason", "executor_stopped"), StringField("msg_id", env.message_id())});
  }
  return http::Response::Json(200, R"({"ok":true})");
}

void IngestServer::Process(const model::Envelope& env) const {
  const bool message = model::IsMessage(env);

  if (message && dedupe_.Seen(env.message_id())) {
    CHATRELAY_LOG_INFO("dup", {StringField("chat", env.chat_id()), StringField("msg_id", env.message_id())});
    return;
  }

  if (message && !model::IsOutbound(env) && !util::Trim(env.message_id()).empty()) {
    const auto start  = std::chrono::steady_clock::now();
    const auto chat   = identity::CanonicalChatId(env.chat_id());
    const auto sender = identity::IsGroup(chat) ? env.sender_id() : std::string();

    if (engine_.MarkRead(chat, sender, {env.message_id()})) {
      const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
      CHATRELAY_LOG_INFO("markread_ok", {StringField("chat", chat), StringField("msg_id", env.message_id()), IntField("t_ms", elapsed.count())});
    } else {
      CHATRELAY_LOG_DEBUG("markread_skipped", {StringField("chat", chat), StringField("msg_id", env.message_id())});
    }
  }

  router_.Route(env);
}

http::Response IngestServer::DebugProfiles(const http::Request&) const {
  std::ostringstream out;
  out << '[';
  bool first = true;
  for (const auto& profile : profiles_.Snapshot()) {
    if (!first) out << ',';
    out << model::ToJson(profile);
    first = false;
  }
  out << ']';
  return http::Response::Json(200, out.str());
}

} // namespace chatrelay::ingest
