#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace chatrelay::config {

using chatrelay::runtime::config::EngineConfig;
using chatrelay::runtime::config::IngestConfig;
using chatrelay::util::InvalidConfig;
using google::protobuf::util::TimeUtil;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw InvalidConfig("Unsupported YAML node");
  }
}

template <typename Config>
static Config LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw InvalidConfig("Failed to load YAML config: " + std::string(e.what()));
  }

  std::string json = "{}";
  if (!yaml.IsNull()) {
    if (!yaml.IsMap()) {
      throw InvalidConfig("Invalid configuration: top level must be a mapping");
    }

    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    json.clear();
    auto to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw InvalidConfig("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }
  }

  Config config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw InvalidConfig("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

static void DefaultDuration(google::protobuf::Duration* d, std::int64_t millis) {
  if (TimeUtil::DurationToMilliseconds(*d) <= 0) {
    *d = TimeUtil::MillisecondsToDuration(millis);
  }
}

static void DefaultExecutor(chatrelay::runtime::config::ExecutorConfig* executor) {
  if (executor->threads() == 0) executor->set_threads(4);
  DefaultDuration(executor->mutable_shutdown_grace(), 5000);
}

static void DefaultPolicy(chatrelay::runtime::config::RateLimitPolicy* policy, std::int64_t interval_ms, uint32_t burst, uint32_t attempts, std::int64_t delay_ms) {
  DefaultDuration(policy->mutable_interval(), interval_ms);
  if (policy->burst() == 0) policy->set_burst(burst);
  if (policy->retry_attempts() == 0) policy->set_retry_attempts(attempts);
  DefaultDuration(policy->mutable_retry_delay(), delay_ms);
}

static void ApplySecretOverride(std::string* secret) {
  if (const char* env = std::getenv("CHATRELAY_WEBHOOK_SECRET")) {
    *secret = env;
  }
}

void ConfigLoader::ApplyDefaults(EngineConfig& config) {
  auto* history = config.mutable_history();
  if (history->sqlite_path().empty()) history->set_sqlite_path("store/messages.db");

  auto* protocol = config.mutable_protocol();
  if (protocol->spool_dir().empty()) protocol->set_spool_dir("spool");
  if (protocol->connect_attempts() == 0) protocol->set_connect_attempts(5);
  DefaultDuration(protocol->mutable_connect_base_delay(), 2000);

  auto* folder = config.mutable_forwarding()->mutable_folder();
  if (folder->base_dir().empty()) folder->set_base_dir("outbox");
  if (folder->max_bytes() == 0) folder->set_max_bytes(10 * 1024 * 1024);

  auto* webhook = config.mutable_forwarding()->mutable_webhook();
  DefaultDuration(webhook->mutable_timeout(), 7000);
  if (webhook->max_attempts() == 0) webhook->set_max_attempts(3);
  DefaultDuration(webhook->mutable_base_delay(), 250);
  ApplySecretOverride(webhook->mutable_secret());

  auto* limits = config.mutable_rate_limit();
  DefaultPolicy(limits->mutable_text(), 50, 5, 3, 250);
  DefaultPolicy(limits->mutable_media(), 150, 2, 3, 400);
  DefaultPolicy(limits->mutable_status(), 500, 1, 2, 600);

  auto* control = config.mutable_control();
  if (control->bind_address().empty()) control->set_bind_address("127.0.0.1:8080");
  if (control->threads() == 0) control->set_threads(2);

  DefaultExecutor(config.mutable_executor());
  DefaultDuration(config.mutable_receipt_dedupe_window(), 5000);
}

void ConfigLoader::ApplyDefaults(IngestConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:8081");
  if (server->body_limit_bytes() == 0) server->set_body_limit_bytes(1 << 20);
  if (server->threads() == 0) server->set_threads(2);

  auto* security = config.mutable_security();
  DefaultDuration(security->mutable_timestamp_skew(), 5 * 60 * 1000);
  ApplySecretOverride(security->mutable_secret());

  auto* dedupe = config.mutable_dedupe();
  DefaultDuration(dedupe->mutable_window(), 10 * 60 * 1000);
  DefaultDuration(dedupe->mutable_sweep_interval(), 60 * 1000);

  auto* aggregation = config.mutable_aggregation();
  DefaultDuration(aggregation->mutable_window(), 3000);
  DefaultDuration(aggregation->mutable_typing_debounce(), 700);

  auto* profiles = config.mutable_profiles();
  if (profiles->base_dir().empty()) profiles->set_base_dir("outbox");
  if (profiles->media_history_cap() == 0) profiles->set_media_history_cap(200);

  DefaultDuration(config.mutable_engine()->mutable_timeout(), 5000);

  auto* business = config.mutable_business();
  if (business->channel().empty()) business->set_channel("whatsapp");
  DefaultDuration(business->mutable_timeout(), 10000);

  auto* reply = config.mutable_reply();
  DefaultDuration(reply->mutable_pre_reply_delay(), 500);
  DefaultDuration(reply->mutable_base_wait(), 800);
  DefaultDuration(reply->mutable_per_char(), 35);
  DefaultDuration(reply->mutable_jitter(), 400);
  DefaultDuration(reply->mutable_max_wait(), 6000);
  DefaultDuration(reply->mutable_typing_pause(), 300);

  DefaultExecutor(config.mutable_executor());
  if (config.executor().reply_threads() == 0) config.mutable_executor()->set_reply_threads(4);
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void ConfigLoader::Validate(const EngineConfig& config) {
  if (config.protocol().event_source().empty()) {
    throw InvalidConfig("protocol.event_source is required");
  }
  if (config.protocol().command_sink().empty()) {
    throw InvalidConfig("protocol.command_sink is required");
  }
  const auto& webhook = config.forwarding().webhook();
  if (webhook.enabled() && webhook.url().empty()) {
    throw InvalidConfig("forwarding.webhook.url is required when the webhook is enabled");
  }
}

void ConfigLoader::Validate(const IngestConfig& config) {
  const auto& security = config.security();
  if (security.require_signature() && security.secret().empty() && !security.allow_no_secret_dev()) {
    throw InvalidConfig("security.secret is required when signatures are required");
  }
}

// ------------------------------------------------------------
// Public loaders
// ------------------------------------------------------------

EngineConfig ConfigLoader::LoadEngineFromYaml(const std::string& path) {
  auto config = LoadFromYaml<EngineConfig>(path);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

IngestConfig ConfigLoader::LoadIngestFromYaml(const std::string& path) {
  auto config = LoadFromYaml<IngestConfig>(path);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

} // namespace chatrelay::config
