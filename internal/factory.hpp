#pragma once

#include <chrono>
#include <memory>

#include "config/config.pb.h"

#include "internal/aggregation/aggregator.hpp"
#include "internal/dedupe/dedupe_cache.hpp"
#include "internal/engine/control_server.hpp"
#include "internal/engine/engine.hpp"
#include "internal/history/history_store.hpp"
#include "internal/http/http_client.hpp"
#include "internal/ingest/business_client.hpp"
#include "internal/ingest/engine_client.hpp"
#include "internal/ingest/event_router.hpp"
#include "internal/ingest/ingest_server.hpp"
#include "internal/ingest/reply_pacer.hpp"
#include "internal/profile/profile_store.hpp"
#include "internal/protocol/protocol_client.hpp"
#include "internal/ratelimit/rate_limiter.hpp"
#include "internal/runtime/task_executor.hpp"
#include "internal/sink/folder_sink.hpp"
#include "internal/util/context.hpp"
#include "internal/webhook/webhook_delivery.hpp"

namespace chatrelay::factory {

/*
  EngineRuntime

  Owns every long-lived object of the engine process. Members are
  declared in dependency order so destruction runs dependents first.
*/
struct EngineRuntime {
  util::Context             root = util::Context::Background();
  std::chrono::milliseconds shutdown_grace{5000};

  std::unique_ptr<runtime::TaskExecutor>    executor;
  std::shared_ptr<history::HistoryStore>    history;
  std::shared_ptr<protocol::ProtocolClient> client;
  std::shared_ptr<http::HttpClient>         http;
  std::shared_ptr<sink::FolderSink>         sink;
  std::shared_ptr<webhook::WebhookDelivery> webhook;
  std::shared_ptr<ratelimit::RateLimiter>   limiter;
  std::unique_ptr<engine::Engine>           engine;
  std::unique_ptr<engine::ControlServer>    control;

  ~EngineRuntime();

  // Connects the protocol client and opens the control port. Throws on failure.
  void Start();

  // Cancels the root context, stops servers, drains the executor within the grace period. Idempotent.
  void Shutdown();
};

/*
  IngestRuntime

  Same idea for the ingestion process.
*/
struct IngestRuntime {
  util::Context             root = util::Context::Background();
  std::chrono::milliseconds shutdown_grace{5000};

  // webhook processing
  std::unique_ptr<runtime::TaskExecutor>        executor;
  // aggregation flushes; paced replies block here, never on `executor`
  std::unique_ptr<runtime::TaskExecutor>        reply_executor;
  std::shared_ptr<http::HttpClient>             http;
  std::unique_ptr<dedupe::DedupeCache>          dedupe;
  std::unique_ptr<profile::ProfileStore>        profiles;
  std::unique_ptr<ingest::EngineControlClient>  engine;
  std::unique_ptr<ingest::BusinessClient>       business;
  std::unique_ptr<ingest::ReplyPacer>           pacer;
  std::unique_ptr<ingest::EventRouter>          router;
  std::unique_ptr<aggregation::Aggregator>      aggregator;
  std::unique_ptr<ingest::IngestServer>         server;

  ~IngestRuntime();

  void Start();
  void Shutdown();
};

/*
  Composition roots. The only places that know concrete store, client and
  transport types. Throw std::runtime_error when the history store cannot
  be opened.
*/
std::unique_ptr<EngineRuntime> BuildEngine(const chatrelay::runtime::config::EngineConfig& config);
std::unique_ptr<IngestRuntime> BuildIngest(const chatrelay::runtime::config::IngestConfig& config);

// Same graphs with injected transports, for tests.
std::unique_ptr<EngineRuntime> BuildEngine(const chatrelay::runtime::config::EngineConfig& config, std::shared_ptr<history::HistoryStore> history,
                                           std::shared_ptr<protocol::ProtocolClient> client, std::shared_ptr<http::HttpClient> http);
std::unique_ptr<IngestRuntime> BuildIngest(const chatrelay::runtime::config::IngestConfig& config, std::shared_ptr<http::HttpClient> http);

} // namespace chatrelay::factory
