#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/dedupe/dedupe_cache.hpp"
#include "internal/http/server.hpp"
#include "internal/http/types.hpp"
#include "internal/ingest/engine_client.hpp"
#include "internal/ingest/event_router.hpp"
#include "internal/model/envelope.hpp"
#include "internal/profile/profile_store.hpp"
#include "internal/runtime/task_executor.hpp"

namespace chatrelay::ingest {

struct IngestOptions {
  std::string   bind_address     = "0.0.0.0:8081";
  unsigned      threads          = 2;
  std::uint64_t body_limit_bytes = 1 << 20;

  std::string secret;
  bool        require_signature = false;

  bool                      check_timestamp = false;
  std::chrono::milliseconds timestamp_skew{5 * 60 * 1000};
};

/*
  Webhook front door of the ingestion process.

  POST /wh is checked in order: method (405), body ceiling from the
  declared length (413), timestamp header (401), signature (401), envelope
  decode (400). An accepted envelope is ACKed with {"ok":true} at once;
  dedupe, mark-read and routing run afterwards on the executor.

  GET /healthz, /readyz, /debug/profiles and / are auxiliary.
*/
class IngestServer {
 public:
  IngestServer(IngestOptions options, dedupe::DedupeCache& dedupe, EventRouter& router, EngineControlClient& engine, profile::ProfileStore& profiles,
               runtime::TaskExecutor& executor);

  IngestServer(const IngestServer&)            = delete;
  IngestServer& operator=(const IngestServer&) = delete;

  // Throws std::runtime_error when the address cannot be bound.
  void Start();
  void Stop();

  std::uint16_t Port() const;

  http::Response Handle(const http::Request& request) const;
  http::Response HandleWebhook(const http::Request& request) const;

  // Post-ACK processing of one accepted envelope.
  void Process(const model::Envelope& env) const;

 private:
  http::Response DebugProfiles(const http::Request& request) const;

  IngestOptions          options_;
  dedupe::DedupeCache&   dedupe_;
  EventRouter&           router_;
  EngineControlClient&   engine_;
  profile::ProfileStore& profiles_;
  runtime::TaskExecutor& executor_;

  http::Router                  routes_;
  std::unique_ptr<http::Server> server_;
};

} // namespace chatrelay::ingest
