#include "control_server.hpp"

#include <vector>

#include "chatrelay/v1.hpp"
#include "internal/model/json.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace chatrelay::engine {

using observability::StringField;

namespace {

http::Response Reply(int status, bool success, const std::string& message) {
  chatrelay::v1::ControlResponse body;
  body.set_success(success);
  body.set_message(message);
  return http::Response::Json(status, model::ToJsonWithDefaults(body));
}

// 405 / 400 before the handler body runs. Returns false with `out` set on rejection.
template <typename Request>
bool Decode(const http::Request& request, Request* decoded, http::Response& out) {
  if (request.method != "POST") {
    out = Reply(405, false, "method not allowed");
    return false;
  }
  try {
    model::FromJson(request.body, decoded);
  } catch (const util::ValidationError& e) {
    out = Reply(400, false, e.what());
    return false;
  }
  if (util::Trim(decoded->recipient()).empty()) {
    out = Reply(400, false, "recipient is required");
    return false;
  }
  return true;
}

template <typename Fn>
http::Response Guard(std::string_view endpoint, Fn&& fn) {
  try {
    return fn();
  } catch (const util::ValidationError& e) {
    return Reply(400, false, e.what());
  } catch (const std::exception& e) {
    CHATRELAY_LOG_WARN("control_call_failed", {StringField("endpoint", endpoint), StringField("error", e.what())});
    return Reply(500, false, e.what());
  }
}

} // namespace

ControlServer::ControlServer(Engine& engine, util::Context ctx, std::string bind_address, unsigned threads) : engine_(engine), ctx_(std::move(ctx)) {
  router_.Handle("/api/send", [this](const http::Request& r) { return Send(r); });
  router_.Handle("/api/typing", [this](const http::Request& r) { return Typing(r); });
  router_.Handle("/api/markread", [this](const http::Request& r) { return MarkRead(r); });

  http::ServerOptions options;
  options.threads = threads == 0 ? 2 : threads;
  server_         = std::make_unique<http::Server>(std::move(bind_address), router_.AsHandler(), options);
}

void ControlServer::Start() {
  server_->Start();
}

void ControlServer::Stop() {
  server_->Stop();
}

std::uint16_t ControlServer::Port() const {
  return server_->Port();
}

http::Response ControlServer::Handle(const http::Request& request) const {
  return router_.Dispatch(request);
}

http::Response ControlServer::Send(const http::Request& request) const {
  chatrelay::v1::SendRequest req;
  http::Response             rejected;
  if (!Decode(request, &req, rejected)) return rejected;

  return Guard("send", [&] {
    std::string id;
    if (req.media_path().empty() && req.media_data().empty()) {
      id = engine_.SendText(ctx_, req.recipient(), req.message());
    } else {
      auto media = LoadMediaInput(req.media_path(), req.media_data(), req.mimetype(), req.filename(), req.message());
      id         = engine_.SendMedia(ctx_, req.recipient(), media);
    }
    return Reply(200, true, "sent: " + id);
  });
}

http::Response ControlServer::Typing(const http::Request& request) const {
  chatrelay::v1::TypingRequest req;
  http::Response               rejected;
  if (!Decode(request, &req, rejected)) return rejected;

  return Guard("typing", [&] {
    engine_.SetTyping(ctx_, req.recipient(), req.typing(), req.media());
    return Reply(200, true, "typing updated");
  });
}

http::Response ControlServer::MarkRead(const http::Request& request) const {
  chatrelay::v1::MarkReadRequest req;
  http::Response                 rejected;
  if (!Decode(request, &req, rejected)) return rejected;

  std::vector<std::string> ids;
  for (const auto& id : req.message_ids()) {
    if (!util::Trim(id).empty()) ids.emplace_back(util::Trim(id));
  }
  if (ids.empty()) return Reply(400, false, "message_ids required");

  return Guard("markread", [&] {
    engine_.MarkRead(ctx_, req.recipient(), ids, req.sender(), req.receipt_type());
    return Reply(200, true, "marked");
  });
}

} // namespace chatrelay::engine
