#include "internal/ingest/event_router.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <thread>

#include "internal/model/envelope.hpp"
#include "tests/support/ingest_harness.hpp"

namespace {

using chatrelay::model::Parse;
using chatrelay::testing::Eventually;
using chatrelay::testing::InboundText;
using chatrelay::testing::IngestHarness;
using chatrelay::testing::IngestHarnessOptions;
using chatrelay::testing::kBusinessUrl;
using chatrelay::testing::kSendUrl;
using chatrelay::testing::kTypingUrl;
using std::chrono::milliseconds;

const std::string kChat = "5491100000000@s.whatsapp.net";

IngestHarnessOptions Named(const std::string& name) {
  IngestHarnessOptions o;
  o.name = name;
  return o;
}

void TestTypingDetection() {
  using chatrelay::ingest::IsTypingEvent;

  assert(IsTypingEvent(Parse(R"({"event_type":"chat_presence","extra":{"state":" Composing "}})")));
  assert(IsTypingEvent(Parse(R"({"event_type":"typing","extra":{"state":"recording"}})")));
  assert(IsTypingEvent(Parse(R"({"event_type":"presence","extra":{"typing":true}})")));
  assert(IsTypingEvent(Parse(R"({"event_type":"typing","extra":{"typing":"TRUE"}})")));
  assert(IsTypingEvent(Parse(R"({"event_type":"receipt","receipt_type":"composing","message_ids":["X"]})")));

  assert(!IsTypingEvent(Parse(R"({"event_type":"chat_presence","extra":{"state":"paused"}})")));
  assert(!IsTypingEvent(Parse(R"({"event_type":"presence","extra":{"typing":false}})")));
  assert(!IsTypingEvent(Parse(R"({"event_type":"presence","extra":{"typing":1}})")));
  assert(!IsTypingEvent(Parse(R"({"event_type":"receipt","receipt_type":"read","message_ids":["X"]})")));
}

void TestFallbackAndTypingWait() {
  assert(chatrelay::ingest::FallbackReply(3) == "Llegaron 3 mensaje(s) en la ventana.");

  chatrelay::ingest::ReplyPacing pacing;
  assert(chatrelay::ingest::TypingWait(pacing, "hola", milliseconds(100)) == milliseconds(800 + 35 * 4 + 100));
  // runes, not bytes
  assert(chatrelay::ingest::TypingWait(pacing, "ñandú", milliseconds(0)) == milliseconds(800 + 35 * 5));
  assert(chatrelay::ingest::TypingWait(pacing, std::string(1000, 'a'), milliseconds(0)) == pacing.max_wait);

  assert(chatrelay::ingest::SessionIdFor(kChat) == "wa-" + kChat);
}

void TestBurstFlushesWithFallbackReply() {
  IngestHarness h(Named("router_burst"));

  for (int i = 1; i <= 3; ++i) {
    h.router.Route(Parse(InboundText("M" + std::to_string(i), kChat, kChat, "mensaje " + std::to_string(i))));
  }
  assert(h.aggregator.Pending(kChat) == 3);

  assert(Eventually([&] { return h.http->RequestsTo(kTypingUrl).size() == 2; }));

  const auto sends = h.http->RequestsTo(kSendUrl);
  assert(sends.size() == 1);
  assert(sends[0].body.find("Llegaron 3 mensaje(s) en la ventana.") != std::string::npos);
  assert(sends[0].body.find(R"("recipient":")" + kChat + "\"") != std::string::npos);

  // typing on, send, typing off
  const auto all = h.http->Requests();
  assert(all.size() == 3);
  assert(all[0].url == kTypingUrl && all[0].body.find(R"("typing":true)") != std::string::npos);
  assert(all[1].url == kSendUrl);
  assert(all[2].url == kTypingUrl && all[2].body.find(R"("typing":false)") != std::string::npos);

  assert(h.aggregator.Pending(kChat) == 0);
  assert(h.router.LastByChat(kChat)->message_id() == "M3");
}

void TestBusinessReplyIsSent() {
  auto o         = Named("router_business");
  o.business_url = kBusinessUrl;
  IngestHarness h(o);
  h.http->bodies[kBusinessUrl] = R"({"reply":"Hola Ana, ¿en qué te ayudo?","leadScore":0.8,"category":"ventas"})";

  h.router.Route(Parse(InboundText("M1", kChat, kChat, "quiero info")));

  assert(Eventually([&] { return h.http->RequestsTo(kSendUrl).size() == 1; }));
  const auto ask = h.http->RequestsTo(kBusinessUrl);
  assert(ask.size() == 1);
  assert(ask[0].body.find(R"("sessionId":"wa-)" + kChat + "\"") != std::string::npos);
  assert(ask[0].body.find(R"("message":"quiero info")") != std::string::npos);
  assert(ask[0].body.find(R"("channel":"whatsapp")") != std::string::npos);

  assert(h.http->RequestsTo(kSendUrl)[0].body.find("Hola Ana") != std::string::npos);
}

void TestBusinessFailureFallsBack() {
  auto o         = Named("router_business_down");
  o.business_url = kBusinessUrl;
  IngestHarness h(o);
  h.http->bodies[kBusinessUrl] = "<html>bad gateway</html>";

  h.router.Route(Parse(InboundText("M1", kChat, kChat, "hola")));

  assert(Eventually([&] { return h.http->RequestsTo(kSendUrl).size() == 1; }));
  assert(h.http->RequestsTo(kSendUrl)[0].body.find("Llegaron 1 mensaje(s)") != std::string::npos);
}

void TestFilteredMessagesOpenNoWindow() {
  IngestHarness h(Named("router_filters"));

  h.router.Route(Parse(R"({"event_type":"message","direction":"out","chat_id":")" + kChat + R"(","message_id":"OUT1","text":"eco"})"));
  h.router.Route(Parse(R"({"event_type":"message","direction":"in","chat_id":")" + kChat + R"(","message_id":"M1","text":"sin remitente"})"));
  assert(h.aggregator.Pending(kChat) == 0);

  std::this_thread::sleep_for(milliseconds(300));
  assert(h.http->RequestsTo(kSendUrl).empty());

  // the profile still counted the inbound messages
  assert(h.profiles.Get(kChat)->metrics().msg_in() == 1);
  assert(h.profiles.Get(kChat)->metrics().msg_out() == 1);
}

void TestLinkedDeviceSenderGetsFallbackReply() {
  auto o         = Named("router_lid");
  o.business_url = kBusinessUrl;
  IngestHarness h(o);
  h.http->bodies[kBusinessUrl] = R"({"reply":"no deberia salir"})";

  const std::string chat = "777@s.whatsapp.net";
  h.router.Route(Parse(InboundText("M2", "777@lid", "777@lid", "hola")));
  assert(h.aggregator.Pending(chat) == 1);
  assert(!h.router.LastByChat(chat));

  assert(Eventually([&] { return h.http->RequestsTo(kSendUrl).size() == 1; }));
  const auto sends = h.http->RequestsTo(kSendUrl);
  assert(sends[0].body.find("Llegaron 1 mensaje(s)") != std::string::npos);
  assert(sends[0].body.find(R"("recipient":")" + chat + "\"") != std::string::npos);
  // no stored text, so the business service is never asked
  assert(h.http->RequestsTo(kBusinessUrl).empty());
}

void TestTypingExtendsTheSendersWindow() {
  auto o   = Named("router_typing");
  o.window = milliseconds(300);
  IngestHarness h(o);

  h.router.Route(Parse(InboundText("M1", kChat, kChat, "hola")));
  std::this_thread::sleep_for(milliseconds(200));

  // no chat id: mapped through the sender's last conversation
  h.router.Route(Parse(R"({"event_type":"chat_presence","sender_id":")" + kChat + R"(","extra":{"state":"composing"}})"));
  std::this_thread::sleep_for(milliseconds(200));

  assert(h.aggregator.Pending(kChat) == 1);
  assert(h.http->RequestsTo(kSendUrl).empty());

  assert(Eventually([&] { return h.http->RequestsTo(kSendUrl).size() == 1; }));
}

void TestTypingWithoutBufferedMessageIsIgnored() {
  IngestHarness h(Named("router_typing_idle"));

  h.router.Route(Parse(R"({"event_type":"chat_presence","chat_id":")" + kChat + R"(","extra":{"state":"composing"}})"));
  assert(h.aggregator.Pending(kChat) == 0);
  std::this_thread::sleep_for(milliseconds(200));
  assert(h.http->Requests().empty());
}

} // namespace

int main() {
  TestTypingDetection();
  TestFallbackAndTypingWait();
  TestBurstFlushesWithFallbackReply();
  TestBusinessReplyIsSent();
  TestBusinessFailureFallsBack();
  TestFilteredMessagesOpenNoWindow();
  TestLinkedDeviceSenderGetsFallbackReply();
  TestTypingExtendsTheSendersWindow();
  TestTypingWithoutBufferedMessageIsIgnored();

  std::cout << "chatrelay_unit_event_router: pass\n";
  return 0;
}
