#include "internal/engine/normalizer.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/engine/chat_names.hpp"
#include "internal/model/json.hpp"
#include "tests/support/test_fakes.hpp"

namespace {

using chatrelay::engine::ChatNameInput;
using chatrelay::engine::Normalize;
using chatrelay::engine::ResolveChatName;
using chatrelay::protocol::RawEvent;
using chatrelay::testing::FakeProtocolClient;

RawEvent Event(const std::string& json) {
  RawEvent raw;
  chatrelay::model::FromJson(json, &raw);
  return raw;
}

void TestInboundTextMessage() {
  FakeProtocolClient names;
  names.contacts["5491122334455@s.whatsapp.net"] = "Ana Directory";

  const auto env = Normalize(Event(R"({"message": {
      "info": {"id": "M1", "chat": "5491122334455:3@s.whatsapp.net", "sender": "5491122334455@lid", "push_name": "Ana"},
      "content": {"conversation": "hola", "extended_text": "hola extendido"}}})"),
                             &names);

  assert(env.event_type() == "message");
  assert(env.direction() == "in");
  assert(env.chat_id() == "5491122334455@s.whatsapp.net");
  assert(env.sender_id() == "5491122334455@s.whatsapp.net");
  assert(env.message_id() == "M1");
  assert(env.text() == "hola extendido");
  assert(env.chat_name() == "Ana Directory");
  assert(chatrelay::model::ExtraString(env, "push_name").value_or("") == "Ana");
  assert(!env.has_at());
}

void TestImageCaptionBecomesTextAndTicket() {
  const auto env = Normalize(Event(R"({"message": {
      "info": {"id": "IMG", "chat": "120363@g.us", "sender": "549@s.whatsapp.net", "is_from_me": true, "timestamp": "2024-05-01T10:00:00Z"},
      "content": {"image": {"url": "https://mmg/1", "mimetype": "image/jpeg", "caption": "mirá", "file_length": 1024}},
      "conversation_name": "Familia"}})"),
                             nullptr);

  assert(env.direction() == "out");
  assert(env.text() == "mirá");
  assert(env.chat_name() == "Familia");
  assert(env.media().type() == "image");
  assert(env.media().direction() == "out");
  assert(env.media().chat_id() == "120363@g.us");
  assert(env.media().file_length() == 1024);
  assert(env.media().has_at());
}

void TestAudioAndDocumentTickets() {
  const auto audio = Normalize(Event(R"({"message": {"info": {"id": "A", "chat": "1@s.whatsapp.net", "sender": "1@s.whatsapp.net"},
      "content": {"audio": {"mimetype": "audio/ogg; codecs=opus", "seconds": 12}}}})"),
                               nullptr);
  assert(audio.media().type() == "audio");
  assert(audio.media().seconds() == 12);
  assert(audio.text().empty());

  const auto doc = Normalize(Event(R"({"message": {"info": {"id": "D", "chat": "1@s.whatsapp.net", "sender": "1@s.whatsapp.net"},
      "content": {"document": {"mimetype": "application/pdf", "title": "factura.pdf"}}}})"),
                             nullptr);
  assert(doc.media().type() == "document");
  assert(doc.media().title() == "factura.pdf");
}

void TestReceiptCarriesIdsOnly() {
  const auto env = Normalize(Event(R"({"receipt": {"chat": "+549", "sender": "549:2@s.whatsapp.net", "message_ids": ["A", "", "B"], "type": "read"}})"),
                             nullptr);

  assert(env.event_type() == "receipt");
  assert(env.chat_id() == "549@s.whatsapp.net");
  assert(env.message_id().empty());
  assert(env.message_ids_size() == 2);
  assert(env.receipt_type() == "read");
  chatrelay::model::Validate(env);
}

void TestPresenceAndLifecycleEvents() {
  const auto typing = Normalize(Event(R"({"chat_presence": {"chat": "549@s.whatsapp.net", "sender": "549@s.whatsapp.net", "state": "composing", "media": "audio"}})"),
                                nullptr);
  assert(typing.event_type() == "chat_presence");
  assert(chatrelay::model::ExtraString(typing, "state").value_or("") == "composing");
  assert(chatrelay::model::ExtraString(typing, "media").value_or("") == "audio");

  const auto presence = Normalize(Event(R"({"presence": {"from": "549@s.whatsapp.net", "unavailable": true, "last_seen": "2024-05-01T10:00:00Z"}})"), nullptr);
  assert(presence.event_type() == "presence");
  assert(chatrelay::model::ExtraBool(presence, "unavailable").value_or(false));
  assert(chatrelay::model::ExtraString(presence, "last_seen").value_or("") == "2024-05-01T10:00:00Z");

  const auto group = Normalize(Event(R"({"group_info": {"jid": "120363@g.us", "name": "Nuevo nombre", "sender": "549@s.whatsapp.net"}})"), nullptr);
  assert(group.event_type() == "group_update");
  assert(group.chat_name() == "Nuevo nombre");

  assert(Normalize(Event(R"({"connected": {}})"), nullptr).event_type() == "connected");
  const auto logged_out = Normalize(Event(R"({"logged_out": {"reason": "device_removed"}})"), nullptr);
  assert(logged_out.event_type() == "logged_out");
  assert(chatrelay::model::ExtraString(logged_out, "reason").value_or("") == "device_removed");
}

void TestUnknownEventKeepsItsType() {
  const auto env = Normalize(Event(R"({"unknown": {"type": "call_offer", "payload": {"from": "549"}}})"), nullptr);
  assert(env.event_type() == "call_offer");
  assert(chatrelay::model::ExtraString(env, "from").value_or("") == "549");

  assert(Normalize(RawEvent(), nullptr).event_type() == "unknown");
}

void TestChatNameFallbacks() {
  FakeProtocolClient names;
  names.groups["120363@g.us"] = "Directorio";

  ChatNameInput group;
  group.chat_id = "120363@g.us";
  assert(ResolveChatName(group) == "Group 120363");
  group.names = &names;
  assert(ResolveChatName(group) == "Directorio");

  ChatNameInput contact;
  contact.chat_id = "549@s.whatsapp.net";
  assert(ResolveChatName(contact) == "549");
}

} // namespace

int main() {
  TestInboundTextMessage();
  TestImageCaptionBecomesTextAndTicket();
  TestAudioAndDocumentTickets();
  TestReceiptCarriesIdsOnly();
  TestPresenceAndLifecycleEvents();
  TestUnknownEventKeepsItsType();
  TestChatNameFallbacks();

  std::cout << "chatrelay_unit_normalizer: pass\n";
  return 0;
}
