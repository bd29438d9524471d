#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/dedupe/dedupe_cache.hpp"
#include "internal/engine/media_input.hpp"
#include "internal/history/history_store.hpp"
#include "internal/model/envelope.hpp"
#include "internal/protocol/protocol_client.hpp"
#include "internal/ratelimit/rate_limiter.hpp"
#include "internal/runtime/task_executor.hpp"
#include "internal/sink/folder_sink.hpp"
#include "internal/util/context.hpp"
#include "internal/webhook/webhook_delivery.hpp"

namespace chatrelay::engine {

/*
  Behavior callbacks. Each is optional; exceptions thrown from them are
  logged and never stop the loop.
*/
struct EngineHandlers {
  std::function<void(const model::Envelope&)> on_message;
  std::function<void(const model::Envelope&)> on_receipt;
  std::function<void(const model::Envelope&)> on_presence;
  std::function<void(const model::Envelope&)> on_group_update;

  // (stage, error message) for per-event side-effect failures
  std::function<void(std::string_view, const std::string&)> on_error;
};

struct EngineOptions {
  int                       connect_attempts = 5;
  std::chrono::milliseconds connect_base_delay{2000};

  bool announce_presence = true;

  std::chrono::milliseconds receipt_dedupe_window{5000};
};

/*
  Event loop and outbound control surface.

  Raw events are normalized and processed on the executor, one task per
  event. Side effects (history, sink, webhook, callback) run independently
  so one failing does not block the others.

  Outbound sends go through the rate limiter, then record a history row
  with sender "me" and mirror an outbound envelope to sink and webhook.

  `sink` and `webhook` may be null when the corresponding forwarding is
  disabled.
*/
class Engine {
 public:
  Engine(EngineOptions options, std::shared_ptr<protocol::ProtocolClient> client, std::shared_ptr<history::HistoryStore> history,
         std::shared_ptr<sink::FolderSink> sink, std::shared_ptr<webhook::WebhookDelivery> webhook, std::shared_ptr<ratelimit::RateLimiter> limiter,
         runtime::TaskExecutor& executor, util::Context ctx);
  ~Engine();

  Engine(const Engine&)            = delete;
  Engine& operator=(const Engine&) = delete;

  void SetHandlers(EngineHandlers handlers);

  // Connects with bounded retry and announces presence. Throws util::TransportError or util::Cancelled.
  void Start();
  void Stop();

  // Processes one raw event on the calling thread.
  void HandleEvent(const protocol::RawEvent& raw);

  std::string SendText(const util::Context& ctx, const std::string& to, const std::string& text);
  std::string SendMedia(const util::Context& ctx, const std::string& to, const MediaInput& media);

  // media: "audio" for a recording indicator, anything else is text.
  void SetTyping(const util::Context& ctx, const std::string& to, bool typing, const std::string& media);

  // Empty ids are dropped; no ids is a no-op. Groups need the original sender.
  void MarkRead(const util::Context& ctx, const std::string& chat, const std::vector<std::string>& message_ids, const std::string& sender,
                const std::string& receipt_type);

  std::vector<history::HistoryMessage> RecentMessages(const std::string& chat, int limit) const;

 private:
  void Dispatch(const protocol::RawEvent& raw);
  void ConnectWithRetry();
  void AnnouncePresence();

  void HandleInbound(const protocol::RawEvent& raw, model::Envelope env);
  bool FirstReceipt(const model::Envelope& env);

  void StoreHistory(const history::HistoryMessage& row, const std::string& chat_name);
  void Forward(model::Envelope env);
  void RecordOutbound(const std::string& chat, const std::string& id, const std::string& text, const model::MediaTicket* media);

  void Notify(const std::function<void(const model::Envelope&)>& fn, std::string_view name, const model::Envelope& env);
  void ReportError(std::string_view stage, const std::string& error);

  std::string ChatNameFor(const std::string& chat) const;

  EngineOptions                             options_;
  std::shared_ptr<protocol::ProtocolClient> client_;
  std::shared_ptr<history::HistoryStore>    history_;
  std::shared_ptr<sink::FolderSink>         sink_;
  std::shared_ptr<webhook::WebhookDelivery> webhook_;
  std::shared_ptr<ratelimit::RateLimiter>   limiter_;
  runtime::TaskExecutor&                    executor_;
  util::Context                             ctx_;

  EngineHandlers handlers_;

  dedupe::DedupeCache receipts_;
};

} // namespace chatrelay::engine
