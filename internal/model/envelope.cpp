#include "envelope.hpp"

#include "internal/model/json.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace chatrelay::model {

bool IsMessage(const Envelope& env) {
  return env.event_type() == event_type::kMessage;
}

bool IsOutbound(const Envelope& env) {
  return util::EqualsIgnoreCase(util::Trim(env.direction()), kDirectionOut);
}

bool IsDeviceEvent(std::string_view type) {
  return type == event_type::kConnected || type == event_type::kLoggedOut || type == event_type::kHistorySync ||
         type == event_type::kOfflineSyncCompleted || type == event_type::kIdentityChange;
}

void Validate(const Envelope& env) {
  if (util::Trim(env.event_type()).empty()) {
    throw util::ValidationError("envelope: event_type is required");
  }
  if (env.event_type() == event_type::kReceipt) {
    if (!env.message_id().empty()) {
      throw util::ValidationError("envelope: receipts carry message_ids, not message_id");
    }
    return;
  }
  if (env.message_ids_size() > 0) {
    throw util::ValidationError("envelope: message_ids is only valid on receipts");
  }
}

void StampIfUnset(Envelope& env, util::TimePoint now) {
  if (!env.has_at()) {
    *env.mutable_at() = util::ToProto(now);
  }
}

std::string Serialize(const Envelope& env) {
  return ToJson(env);
}

Envelope Parse(std::string_view json) {
  Envelope env;
  FromJson(json, &env);
  Validate(env);
  return env;
}

void SetExtra(Envelope& env, const std::string& key, const std::string& value) {
  (*env.mutable_extra()->mutable_fields())[key].set_string_value(value);
}

void SetExtraBool(Envelope& env, const std::string& key, bool value) {
  (*env.mutable_extra()->mutable_fields())[key].set_bool_value(value);
}

void SetExtraNumber(Envelope& env, const std::string& key, double value) {
  (*env.mutable_extra()->mutable_fields())[key].set_number_value(value);
}

std::optional<std::string> ExtraString(const Envelope& env, const std::string& key) {
  const auto& fields = env.extra().fields();
  auto        it     = fields.find(key);
  if (it == fields.end() || it->second.kind_case() != google::protobuf::Value::kStringValue) return std::nullopt;
  return it->second.string_value();
}

std::optional<bool> ExtraBool(const Envelope& env, const std::string& key) {
  const auto& fields = env.extra().fields();
  auto        it     = fields.find(key);
  if (it == fields.end() || it->second.kind_case() != google::protobuf::Value::kBoolValue) return std::nullopt;
  return it->second.bool_value();
}

} // namespace chatrelay::model
