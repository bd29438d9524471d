#include "factory.hpp"

#include <memory>
#include <string>
#include <utility>

#include "internal/history/sqlite_history_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/protocol/stream_client.hpp"
#include "internal/util/time.hpp"

namespace chatrelay::factory {

using chatrelay::runtime::config::EngineConfig;
using chatrelay::runtime::config::IngestConfig;
using chatrelay::runtime::config::RateLimitPolicy;
using observability::BoolField;
using observability::IntField;
using observability::StringField;
using std::chrono::milliseconds;

namespace {

ratelimit::Policy ToPolicy(const RateLimitPolicy& config, const ratelimit::Policy& fallback) {
  ratelimit::Policy policy;
  policy.interval       = util::DurationOr(config.interval(), fallback.interval);
  policy.burst          = config.burst() > 0 ? static_cast<int>(config.burst()) : fallback.burst;
  policy.retry_attempts = config.retry_attempts() > 0 ? static_cast<int>(config.retry_attempts()) : fallback.retry_attempts;
  policy.retry_delay    = util::DurationOr(config.retry_delay(), fallback.retry_delay);
  return policy;
}

ratelimit::Policies ToPolicies(const chatrelay::runtime::config::RateLimitConfig& config) {
  const ratelimit::Policies defaults;
  ratelimit::Policies       policies;
  policies.text   = ToPolicy(config.text(), defaults.text);
  policies.media  = ToPolicy(config.media(), defaults.media);
  policies.status = ToPolicy(config.status(), defaults.status);
  return policies;
}

std::size_t ThreadsOr(std::uint32_t threads, std::size_t fallback) {
  return threads > 0 ? threads : fallback;
}

} // namespace

// ------------------------------------------------------------------
// Engine
// ------------------------------------------------------------------

EngineRuntime::~EngineRuntime() {
  Shutdown();
  // joins tasks that overran the grace while engine, sink and webhook are still alive
  executor.reset();
}

void EngineRuntime::Start() {
  engine->Start();
  control->Start();
  CHATRELAY_LOG_INFO("engine_started", {StringField("control", std::to_string(control->Port())), BoolField("sink", sink != nullptr),
                                        BoolField("webhook", webhook != nullptr)});
}

void EngineRuntime::Shutdown() {
  root.Cancel();
  if (control) control->Stop();
  if (engine) engine->Stop();
  if (executor && !executor->Stop(shutdown_grace)) {
    CHATRELAY_LOG_WARN("shutdown_grace_exceeded", {IntField("grace_ms", shutdown_grace.count())});
  }
}

std::unique_ptr<EngineRuntime> BuildEngine(const EngineConfig& config) {
  auto history = std::make_shared<history::SqliteHistoryStore>(config.history().sqlite_path());

  const auto&                   proto = config.protocol();
  protocol::StreamClientOptions stream;
  stream.event_source = proto.event_source();
  stream.command_sink = proto.command_sink();
  if (!proto.spool_dir().empty()) stream.spool_dir = proto.spool_dir();
  stream.own_id = proto.own_id();

  return BuildEngine(config, std::move(history), std::make_shared<protocol::StreamClient>(std::move(stream)), std::make_shared<http::CurlHttpClient>());
}

std::unique_ptr<EngineRuntime> BuildEngine(const EngineConfig& config, std::shared_ptr<history::HistoryStore> history,
                                           std::shared_ptr<protocol::ProtocolClient> client, std::shared_ptr<http::HttpClient> http) {
  auto rt            = std::make_unique<EngineRuntime>();
  rt->shutdown_grace = util::DurationOr(config.executor().shutdown_grace(), milliseconds(5000));
  rt->executor       = std::make_unique<runtime::TaskExecutor>(ThreadsOr(config.executor().threads(), 4), "engine");
  rt->history        = std::move(history);
  rt->client         = std::move(client);
  rt->http           = std::move(http);

  const auto& forwarding = config.forwarding();

  if (forwarding.folder().enabled()) {
    const auto&             folder = forwarding.folder();
    sink::FolderSinkOptions options;
    if (!folder.base_dir().empty()) options.base_dir = folder.base_dir();
    if (folder.max_bytes() != 0) options.max_bytes = folder.max_bytes();
    options.host_id = folder.host_id();
    rt->sink        = std::make_shared<sink::FolderSink>(std::move(options));
  }

  if (forwarding.webhook().enabled()) {
    const auto&             hook = forwarding.webhook();
    webhook::WebhookOptions options;
    options.url    = hook.url();
    options.secret = hook.secret();
    options.headers.insert(hook.headers().begin(), hook.headers().end());
    options.timeout       = util::DurationOr(hook.timeout(), milliseconds(7000));
    options.max_attempts  = hook.max_attempts() > 0 ? static_cast<int>(hook.max_attempts()) : 3;
    options.base_delay    = util::DurationOr(hook.base_delay(), milliseconds(250));
    options.default_extra = forwarding.extra();
    rt->webhook           = std::make_shared<webhook::WebhookDelivery>(std::move(options), rt->http, *rt->executor, rt->root);
  }

  rt->limiter = std::make_shared<ratelimit::RateLimiter>(ToPolicies(config.rate_limit()));

  const auto&           proto = config.protocol();
  engine::EngineOptions options;
  if (proto.connect_attempts() > 0) options.connect_attempts = static_cast<int>(proto.connect_attempts());
  options.connect_base_delay    = util::DurationOr(proto.connect_base_delay(), options.connect_base_delay);
  options.announce_presence     = !config.presence().disable_announce();
  options.receipt_dedupe_window = util::DurationOr(config.receipt_dedupe_window(), options.receipt_dedupe_window);

  rt->engine = std::make_unique<engine::Engine>(options, rt->client, rt->history, rt->sink, rt->webhook, rt->limiter, *rt->executor, rt->root);

  const auto& control = config.control();
  rt->control         = std::make_unique<engine::ControlServer>(*rt->engine, rt->root, control.bind_address().empty() ? "127.0.0.1:8080" : control.bind_address(),
                                                                static_cast<unsigned>(ThreadsOr(control.threads(), 2)));
  return rt;
}

// ------------------------------------------------------------------
// Ingest
// ------------------------------------------------------------------

IngestRuntime::~IngestRuntime() {
  Shutdown();
  // joins tasks that overran the grace while router, pacer and clients are still alive
  executor.reset();
  reply_executor.reset();
}

void IngestRuntime::Start() {
  dedupe->StartSweeper();
  server->Start();
  CHATRELAY_LOG_INFO("ingest_started", {StringField("port", std::to_string(server->Port())), IntField("window_ms", aggregator->Window().count())});
}

void IngestRuntime::Shutdown() {
  root.Cancel();
  if (server) server->Stop();
  if (aggregator) aggregator->Stop();
  if (dedupe) dedupe->Stop();
  if (executor && !executor->Stop(shutdown_grace)) {
    CHATRELAY_LOG_WARN("shutdown_grace_exceeded", {StringField("pool", "ingest"), IntField("grace_ms", shutdown_grace.count())});
  }
  if (reply_executor && !reply_executor->Stop(shutdown_grace)) {
    CHATRELAY_LOG_WARN("shutdown_grace_exceeded", {StringField("pool", "reply"), IntField("grace_ms", shutdown_grace.count())});
  }
}

std::unique_ptr<IngestRuntime> BuildIngest(const IngestConfig& config) {
  return BuildIngest(config, std::make_shared<http::CurlHttpClient>());
}

std::unique_ptr<IngestRuntime> BuildIngest(const IngestConfig& config, std::shared_ptr<http::HttpClient> http) {
  auto rt            = std::make_unique<IngestRuntime>();
  rt->shutdown_grace = util::DurationOr(config.executor().shutdown_grace(), milliseconds(5000));
  rt->executor       = std::make_unique<runtime::TaskExecutor>(ThreadsOr(config.executor().threads(), 4), "ingest");
  rt->reply_executor = std::make_unique<runtime::TaskExecutor>(ThreadsOr(config.executor().reply_threads(), 4), "reply");
  rt->http           = std::move(http);

  rt->dedupe = std::make_unique<dedupe::DedupeCache>(util::DurationOr(config.dedupe().window(), milliseconds(10 * 60 * 1000)),
                                                     util::DurationOr(config.dedupe().sweep_interval(), milliseconds(60 * 1000)));

  profile::ProfileStoreOptions profiles;
  if (!config.profiles().base_dir().empty()) profiles.base_dir = config.profiles().base_dir();
  if (config.profiles().media_history_cap() > 0) profiles.media_history_cap = config.profiles().media_history_cap();
  rt->profiles = std::make_unique<profile::ProfileStore>(std::move(profiles));

  const auto&             endpoints_config = config.engine();
  ingest::EngineEndpoints endpoints;
  endpoints.send_url     = endpoints_config.send_url();
  endpoints.typing_url   = endpoints_config.typing_url();
  endpoints.markread_url = endpoints_config.markread_url();
  endpoints.timeout      = util::DurationOr(endpoints_config.timeout(), endpoints.timeout);
  rt->engine             = std::make_unique<ingest::EngineControlClient>(std::move(endpoints), rt->http);

  ingest::BusinessOptions business;
  business.url = config.business().url();
  if (!config.business().channel().empty()) business.channel = config.business().channel();
  business.timeout = util::DurationOr(config.business().timeout(), business.timeout);
  rt->business     = std::make_unique<ingest::BusinessClient>(std::move(business), rt->http);

  const auto&         reply = config.reply();
  ingest::ReplyPacing pacing;
  pacing.pre_reply_delay = util::DurationOr(reply.pre_reply_delay(), pacing.pre_reply_delay);
  pacing.base_wait       = util::DurationOr(reply.base_wait(), pacing.base_wait);
  pacing.per_char        = util::DurationOr(reply.per_char(), pacing.per_char);
  pacing.jitter          = util::DurationOr(reply.jitter(), pacing.jitter);
  pacing.max_wait        = util::DurationOr(reply.max_wait(), pacing.max_wait);
  pacing.typing_pause    = util::DurationOr(reply.typing_pause(), pacing.typing_pause);
  rt->pacer              = std::make_unique<ingest::ReplyPacer>(pacing, *rt->engine, rt->root);

  ingest::RouterOptions router;
  router.typing_debounce = util::DurationOr(config.aggregation().typing_debounce(), router.typing_debounce);
  router.pre_reply_delay = pacing.pre_reply_delay;
  rt->router             = std::make_unique<ingest::EventRouter>(router, *rt->profiles, *rt->business, *rt->pacer, rt->root);

  auto* routed    = rt->router.get();
  rt->aggregator  = std::make_unique<aggregation::Aggregator>(
      util::DurationOr(config.aggregation().window(), milliseconds(3000)), *rt->reply_executor,
      [routed](const std::string& chat, int count) { routed->OnFlush(chat, count); },
      [routed](const std::string& chat, std::string_view reason, int count, milliseconds window) { routed->OnWindowReset(chat, reason, count, window); });
  rt->router->AttachAggregator(rt->aggregator.get());

  const auto&           server   = config.server();
  const auto&           security = config.security();
  ingest::IngestOptions options;
  if (!server.bind_address().empty()) options.bind_address = server.bind_address();
  if (server.threads() > 0) options.threads = server.threads();
  if (server.body_limit_bytes() > 0) options.body_limit_bytes = server.body_limit_bytes();
  options.secret            = security.secret();
  options.require_signature = security.require_signature();
  options.check_timestamp   = security.check_timestamp();
  options.timestamp_skew    = util::DurationOr(security.timestamp_skew(), options.timestamp_skew);

  if (options.require_signature && options.secret.empty()) {
    CHATRELAY_LOG_WARN("signature_check_disabled", {StringField("reason", "allow_no_secret_dev")});
    options.require_signature = false;
  }

  rt->server = std::make_unique<ingest::IngestServer>(options, *rt->dedupe, *rt->router, *rt->engine, *rt->profiles, *rt->executor);
  return rt;
}

} // namespace chatrelay::factory
