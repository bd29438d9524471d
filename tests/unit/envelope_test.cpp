#include "internal/model/envelope.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using chatrelay::model::Envelope;
using chatrelay::util::ValidationError;

bool Rejects(const std::string& json) {
  try {
    (void)chatrelay::model::Parse(json);
  } catch (const ValidationError&) {
    return true;
  }
  return false;
}

void TestParsesMessageWithMediaAndExtra() {
  const auto env = chatrelay::model::Parse(R"({
    "event_type": "message",
    "direction": "in",
    "chat_id": "5491122334455@s.whatsapp.net",
    "sender_id": "5491122334455@s.whatsapp.net",
    "message_id": "ABC",
    "text": "hola",
    "media": {"type": "image", "mimetype": "image/jpeg", "media_key": "a2V5"},
    "extra": {"push_name": "Ana", "typing": true},
    "at": "2024-05-01T10:00:00Z",
    "future_field": 1
  })");

  assert(chatrelay::model::IsMessage(env));
  assert(!chatrelay::model::IsOutbound(env));
  assert(env.media().type() == "image");
  assert(env.media().media_key() == "key");
  assert(chatrelay::model::ExtraString(env, "push_name").value_or("") == "Ana");
  assert(chatrelay::model::ExtraBool(env, "typing").value_or(false));
  assert(!chatrelay::model::ExtraString(env, "typing").has_value());
}

void TestIdCarrierInvariant() {
  assert(Rejects(R"({"event_type": "receipt", "message_id": "X"})"));
  assert(Rejects(R"({"event_type": "message", "message_ids": ["X"]})"));
  assert(Rejects(R"({"direction": "in"})"));
  assert(Rejects("not json"));

  assert(!Rejects(R"({"event_type": "receipt", "message_ids": ["X", "Y"], "receipt_type": "read"})"));
}

void TestOutboundDirectionIgnoresCaseAndSpace() {
  Envelope env;
  env.set_event_type("message");
  env.set_direction(" OUT ");
  assert(chatrelay::model::IsOutbound(env));
}

void TestSerializeStampsNothingAndKeepsFieldNames() {
  Envelope env;
  env.set_event_type("presence");
  env.set_sender_id("1@s.whatsapp.net");
  chatrelay::model::SetExtraBool(env, "unavailable", true);

  const auto json = chatrelay::model::Serialize(env);
  assert(json.find("\"event_type\":\"presence\"") != std::string::npos);
  assert(json.find("\"unavailable\":true") != std::string::npos);
  assert(json.find("\"at\"") == std::string::npos);
  assert(json.find('\n') == std::string::npos);

  chatrelay::model::StampIfUnset(env, chatrelay::util::Now());
  const auto first = env.at().seconds();
  chatrelay::model::StampIfUnset(env, chatrelay::util::Now() + std::chrono::hours(1));
  assert(env.at().seconds() == first);
}

void TestDeviceEventTypes() {
  assert(chatrelay::model::IsDeviceEvent("connected"));
  assert(chatrelay::model::IsDeviceEvent("logged_out"));
  assert(chatrelay::model::IsDeviceEvent("history_sync"));
  assert(!chatrelay::model::IsDeviceEvent("message"));
  assert(!chatrelay::model::IsDeviceEvent("group_update"));
}

} // namespace

int main() {
  TestParsesMessageWithMediaAndExtra();
  TestIdCarrierInvariant();
  TestOutboundDirectionIgnoresCaseAndSpace();
  TestSerializeStampsNothingAndKeepsFieldNames();
  TestDeviceEventTypes();

  std::cout << "chatrelay_unit_envelope: pass\n";
  return 0;
}
