#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/aggregation/aggregator.hpp"
#include "internal/dedupe/dedupe_cache.hpp"
#include "internal/ingest/business_client.hpp"
#include "internal/ingest/engine_client.hpp"
#include "internal/ingest/event_router.hpp"
#include "internal/ingest/ingest_server.hpp"
#include "internal/ingest/reply_pacer.hpp"
#include "internal/profile/profile_store.hpp"
#include "internal/runtime/task_executor.hpp"
#include "tests/support/test_fakes.hpp"

namespace chatrelay::testing {

inline constexpr const char* kSendUrl     = "http://engine.test/api/send";
inline constexpr const char* kTypingUrl   = "http://engine.test/api/typing";
inline constexpr const char* kMarkReadUrl = "http://engine.test/api/markread";
inline constexpr const char* kBusinessUrl = "http://business.test/chat";

inline ingest::ReplyPacing FastPacing() {
  ingest::ReplyPacing pacing;
  pacing.pre_reply_delay = std::chrono::milliseconds(1);
  pacing.base_wait       = std::chrono::milliseconds(5);
  pacing.per_char        = std::chrono::milliseconds(0);
  pacing.jitter          = std::chrono::milliseconds(0);
  pacing.max_wait        = std::chrono::milliseconds(20);
  pacing.typing_pause    = std::chrono::milliseconds(1);
  return pacing;
}

struct IngestHarnessOptions {
  std::string               name;
  std::string               business_url;
  std::string               secret;
  bool                      require_signature = false;
  bool                      check_timestamp   = false;
  std::uint64_t             body_limit_bytes  = 4096;
  std::chrono::milliseconds window{120};
  std::chrono::milliseconds typing_debounce{20};
  ingest::ReplyPacing       pacing = FastPacing();
};

/*
  The ingestion pipeline wired the way the factory wires it, against a
  recording HTTP client.
*/
struct IngestHarness {
  explicit IngestHarness(const IngestHarnessOptions& o)
      : profiles(ProfileOptions(o.name)),
        engine({kSendUrl, kTypingUrl, kMarkReadUrl, std::chrono::milliseconds(1000)}, http),
        business({o.business_url, "whatsapp", std::chrono::milliseconds(1000)}, http),
        pacer(o.pacing, engine, root),
        router({o.typing_debounce, o.pacing.pre_reply_delay}, profiles, business, pacer, root),
        aggregator(
            o.window, reply_executor, [this](const std::string& chat, int count) { router.OnFlush(chat, count); },
            [this](const std::string& chat, std::string_view reason, int count, std::chrono::milliseconds window) {
              router.OnWindowReset(chat, reason, count, window);
            }),
        server(ServerOptions(o), dedupe, router, engine, profiles, executor) {
    router.AttachAggregator(&aggregator);
  }

  ~IngestHarness() {
    root.Cancel();
    aggregator.Stop();
    executor.Stop(std::chrono::seconds(2));
    reply_executor.Stop(std::chrono::seconds(2));
    executor.Join();
    reply_executor.Join();
    dedupe.Stop();
  }

  static profile::ProfileStoreOptions ProfileOptions(const std::string& name) {
    profile::ProfileStoreOptions options;
    options.base_dir = FreshDir(name);
    return options;
  }

  static ingest::IngestOptions ServerOptions(const IngestHarnessOptions& o) {
    ingest::IngestOptions options;
    options.bind_address      = "127.0.0.1:0";
    options.body_limit_bytes  = o.body_limit_bytes;
    options.secret            = o.secret;
    options.require_signature = o.require_signature;
    options.check_timestamp   = o.check_timestamp;
    options.timestamp_skew    = std::chrono::seconds(60);
    return options;
  }

  std::shared_ptr<RecordingHttpClient> http = std::make_shared<RecordingHttpClient>();
  util::Context                        root = util::Context::Background();
  runtime::TaskExecutor                executor{2, "ingest_test"};
  runtime::TaskExecutor                reply_executor{2, "ingest_test_reply"};
  dedupe::DedupeCache                  dedupe{std::chrono::minutes(10), std::chrono::minutes(1)};
  profile::ProfileStore                profiles;
  ingest::EngineControlClient          engine;
  ingest::BusinessClient               business;
  ingest::ReplyPacer                   pacer;
  ingest::EventRouter                  router;
  aggregation::Aggregator              aggregator;
  ingest::IngestServer                 server;
};

inline http::Request WebhookPost(const std::string& body) {
  http::Request r;
  r.method                  = "POST";
  r.target                  = "/wh";
  r.body                    = body;
  r.content_length          = body.size();
  r.headers["content-type"] = "application/json";
  return r;
}

inline std::string InboundText(const std::string& id, const std::string& chat, const std::string& sender, const std::string& text) {
  return R"({"event_type":"message","direction":"in","chat_id":")" + chat + R"(","sender_id":")" + sender + R"(","message_id":")" + id +
         R"(","text":")" + text + R"("})";
}

} // namespace chatrelay::testing
