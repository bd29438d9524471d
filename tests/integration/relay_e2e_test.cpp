#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <google/protobuf/util/time_util.h>

#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "internal/factory.hpp"
#include "internal/history/memory_history_store.hpp"
#include "internal/model/json.hpp"
#include "internal/webhook/signature.hpp"
#include "tests/support/test_fakes.hpp"

namespace {

using chatrelay::testing::Eventually;
using chatrelay::testing::FakeProtocolClient;
using google::protobuf::util::TimeUtil;

const std::string kChat   = "5491100000000@s.whatsapp.net";
const std::string kSecret = "relay-secret";

std::uint16_t FreePort() {
  boost::asio::io_context        ioc;
  boost::asio::ip::tcp::acceptor acceptor(ioc, {boost::asio::ip::make_address("127.0.0.1"), 0});
  return acceptor.local_endpoint().port();
}

google::protobuf::Duration Ms(std::int64_t ms) {
  return TimeUtil::MillisecondsToDuration(ms);
}

chatrelay::runtime::config::EngineConfig EngineSide(std::uint16_t ingest_port) {
  chatrelay::runtime::config::EngineConfig config;
  config.mutable_protocol()->set_connect_attempts(1);

  auto* hook = config.mutable_forwarding()->mutable_webhook();
  hook->set_enabled(true);
  hook->set_url("http://127.0.0.1:" + std::to_string(ingest_port) + "/wh");
  hook->set_secret(kSecret);
  *hook->mutable_timeout() = Ms(2000);

  config.mutable_control()->set_bind_address("127.0.0.1:0");
  return config;
}

chatrelay::runtime::config::IngestConfig IngestSide(std::uint16_t ingest_port, std::uint16_t engine_port, const std::filesystem::path& profiles) {
  chatrelay::runtime::config::IngestConfig config;

  auto* server = config.mutable_server();
  server->set_bind_address("127.0.0.1:" + std::to_string(ingest_port));
  server->set_body_limit_bytes(4096);

  auto* security = config.mutable_security();
  security->set_secret(kSecret);
  security->set_require_signature(true);
  security->set_check_timestamp(true);

  *config.mutable_aggregation()->mutable_window()          = Ms(200);
  *config.mutable_aggregation()->mutable_typing_debounce() = Ms(10);
  config.mutable_profiles()->set_base_dir(profiles.string());

  const std::string base = "http://127.0.0.1:" + std::to_string(engine_port) + "/api/";
  auto*             engine = config.mutable_engine();
  engine->set_send_url(base + "send");
  engine->set_typing_url(base + "typing");
  engine->set_markread_url(base + "markread");

  auto* reply                       = config.mutable_reply();
  *reply->mutable_pre_reply_delay() = Ms(1);
  *reply->mutable_base_wait()       = Ms(10);
  *reply->mutable_per_char()        = Ms(1);
  *reply->mutable_jitter()          = Ms(1);
  *reply->mutable_max_wait()        = Ms(100);
  *reply->mutable_typing_pause()    = Ms(1);
  return config;
}

void TestMessageIsRelayedAndAnswered() {
  const auto ingest_port = FreePort();
  auto       client      = std::make_shared<FakeProtocolClient>();
  auto       http        = std::make_shared<chatrelay::http::CurlHttpClient>();

  auto engine = chatrelay::factory::BuildEngine(EngineSide(ingest_port), std::make_shared<chatrelay::history::MemoryHistoryStore>(), client, http);
  engine->Start();

  auto ingest = chatrelay::factory::BuildIngest(IngestSide(ingest_port, engine->control->Port(), chatrelay::testing::FreshDir("relay_profiles")), http);
  ingest->Start();
  assert(ingest->server->Port() == ingest_port);

  chatrelay::protocol::RawEvent message;
  chatrelay::model::FromJson(R"({"message":{"info":{"id":"M1","chat":")" + kChat + R"(","sender":")" + kChat +
                                 R"(","push_name":"Ana"},"content":{"conversation":"hola, ¿están abiertos?"}}})",
                             &message);
  client->Emit(message);

  // ingest marks the message read through the engine
  assert(Eventually([&] { return client->Locked([&] { return client->reads.size() == 1; }); }));
  const auto reads = client->Locked([&] { return client->reads; });
  assert(reads[0].chat() == kChat);
  assert(reads[0].message_ids(0) == "M1");

  // the window closes and the fallback reply goes out with typing around it
  assert(Eventually([&] { return client->Locked([&] { return client->texts.size() == 1; }); }, std::chrono::seconds(5)));
  const auto texts = client->Locked([&] { return client->texts; });
  assert(texts[0].first == kChat);
  assert(texts[0].second == "Llegaron 1 mensaje(s) en la ventana.");
  assert(Eventually([&] { return client->Locked([&] { return client->chat_presence.size() == 2; }); }));
  const auto presence = client->Locked([&] { return client->chat_presence; });
  assert(presence[0].state == "composing");
  assert(presence[1].state == "paused");

  // the engine mirrors its own reply back; ingest counts it as outbound
  assert(Eventually([&] {
    auto profile = ingest->profiles->Get(kChat);
    return profile && profile->metrics().msg_in() == 1 && profile->metrics().msg_out() == 1;
  }));

  ingest->Shutdown();
  engine->Shutdown();
}

void TestIngestRejectsOverTheWire() {
  const auto ingest_port = FreePort();
  auto       http        = std::make_shared<chatrelay::http::CurlHttpClient>();

  auto ingest = chatrelay::factory::BuildIngest(IngestSide(ingest_port, 1, chatrelay::testing::FreshDir("relay_reject")), http);
  ingest->Start();

  const std::string url  = "http://127.0.0.1:" + std::to_string(ingest_port);
  const std::string body = R"({"event_type":"message","chat_id":")" + kChat + R"(","sender_id":")" + kChat + R"(","message_id":"X1","text":"hola"})";

  chatrelay::http::ClientRequest unsigned_request;
  unsigned_request.url  = url + "/wh";
  unsigned_request.body = body;
  unsigned_request.headers.emplace_back("X-Chatrelay-Timestamp", chatrelay::util::FormatRfc3339(chatrelay::util::Now()));
  assert(http->Send(unsigned_request).status == 401);

  auto signed_request = unsigned_request;
  signed_request.headers.emplace_back("X-Chatrelay-Signature", chatrelay::webhook::SignBody(kSecret, body));
  const auto accepted = http->Send(signed_request);
  assert(accepted.status == 200);
  assert(accepted.body == R"({"ok":true})");

  chatrelay::http::ClientRequest oversized = signed_request;
  oversized.body                           = std::string(5000, 'x');
  assert(http->Send(oversized).status == 413);

  chatrelay::http::ClientRequest health;
  health.method = "GET";
  health.url    = url + "/healthz";
  const auto ok = http->Send(health);
  assert(ok.status == 200);
  assert(ok.body == "ok");

  ingest->Shutdown();
}

} // namespace

int main() {
  TestMessageIsRelayedAndAnswered();
  TestIngestRejectsOverTheWire();

  std::cout << "chatrelay_integration_relay_e2e: pass\n";
  return 0;
}
