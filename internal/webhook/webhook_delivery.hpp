#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "internal/http/http_client.hpp"
#include "internal/model/envelope.hpp"
#include "internal/runtime/task_executor.hpp"
#include "internal/util/context.hpp"

namespace chatrelay::webhook {

struct WebhookOptions {
  std::string                        url;
  std::string                        secret;
  std::map<std::string, std::string> headers;

  std::chrono::milliseconds timeout{7000};
  int                       max_attempts = 3;
  std::chrono::milliseconds base_delay{250};

  // Applied to envelopes that carry no extra of their own.
  google::protobuf::Struct default_extra;
};

/*
  Best-effort signed POST of envelopes, decoupled from the sink.

  Enqueue() returns immediately; delivery runs on the executor and its
  outcome is only logged. Non-2xx responses and transport errors are
  retried with doubling delay; cancelling the root context aborts the
  wait between attempts.
*/
class WebhookDelivery {
 public:
  WebhookDelivery(WebhookOptions options, std::shared_ptr<http::HttpClient> client, runtime::TaskExecutor& executor, util::Context ctx);

  void Enqueue(model::Envelope env);

  // Synchronous delivery. Returns true on a 2xx within the attempt budget.
  bool Deliver(const util::Context& ctx, model::Envelope env);

  // Body and headers exactly as posted.
  http::ClientRequest BuildRequest(model::Envelope env, util::TimePoint now) const;

 private:
  WebhookOptions                    options_;
  std::shared_ptr<http::HttpClient> client_;
  runtime::TaskExecutor&            executor_;
  util::Context                     ctx_;
};

} // namespace chatrelay::webhook
