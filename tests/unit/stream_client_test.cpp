#include "internal/protocol/stream_client.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "internal/model/json.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"
#include "tests/support/test_fakes.hpp"

namespace {

using chatrelay::protocol::RawEvent;
using chatrelay::protocol::StreamClient;
using chatrelay::protocol::StreamClientOptions;
using chatrelay::protocol::v1::OutboundCommand;
using chatrelay::testing::Eventually;

struct Received {
  std::mutex            mutex;
  std::vector<RawEvent> events;

  std::size_t Size() {
    std::lock_guard lock(mutex);
    return events.size();
  }
};

StreamClientOptions Options(const std::filesystem::path& dir) {
  StreamClientOptions options;
  options.event_source = dir / "events.ndjson";
  options.command_sink = dir / "commands.ndjson";
  options.spool_dir    = dir / "spool";
  options.own_id       = "+1000";
  return options;
}

void Append(const std::filesystem::path& path, const std::string& line) {
  std::ofstream out(path, std::ios::app);
  out << line << '\n';
}

std::vector<OutboundCommand> Commands(const std::filesystem::path& path) {
  std::ifstream                in(path);
  std::vector<OutboundCommand> out;
  for (std::string line; std::getline(in, line);) {
    OutboundCommand command;
    chatrelay::model::FromJson(line, &command);
    out.push_back(std::move(command));
  }
  return out;
}

void TestReadsAndFollowsEventStream() {
  const auto dir     = chatrelay::testing::FreshDir("stream_client_events");
  const auto options = Options(dir);

  Append(options.event_source,
         R"({"message":{"info":{"id":"M1","chat":"5491100000000@s.whatsapp.net","sender":"5491100000000@s.whatsapp.net","push_name":"Ana"},"content":{"conversation":"hola"}}})");
  Append(options.event_source, "{this is not json");
  Append(options.event_source, R"({"group_info":{"jid":"120363000000@g.us","name":"Familia"}})");

  Received     received;
  StreamClient client(options);
  client.Connect([&received](const RawEvent& event) {
    std::lock_guard lock(received.mutex);
    received.events.push_back(event);
  });
  assert(client.IsConnected());
  assert(client.OwnId() == "1000@s.whatsapp.net");

  assert(Eventually([&] { return received.Size() == 2; }));

  // lines appended after connecting are picked up
  Append(options.event_source, R"({"receipt":{"chat":"5491100000000@s.whatsapp.net","message_ids":["M1"],"type":"read"}})");
  assert(Eventually([&] { return received.Size() == 3; }));

  {
    std::lock_guard lock(received.mutex);
    assert(received.events[0].message().content().conversation() == "hola");
    assert(received.events[1].kind_case() == RawEvent::kGroupInfo);
    assert(received.events[2].receipt().message_ids(0) == "M1");
  }

  assert(client.ContactName("+5491100000000") == "Ana");
  assert(client.GroupName("120363000000@g.us") == "Familia");
  assert(client.ContactName("unknown@s.whatsapp.net").empty());

  client.Disconnect();
  assert(!client.IsConnected());
}

void TestCommandsAreAppendedAsLines() {
  const auto dir     = chatrelay::testing::FreshDir("stream_client_commands");
  const auto options = Options(dir);
  Append(options.event_source, "");

  StreamClient client(options);
  client.Connect([](const RawEvent&) {});

  const auto id = client.SendText("5491100000000@s.whatsapp.net", "hola");
  assert(!id.empty());
  client.SendChatPresence("5491100000000@s.whatsapp.net", "composing", "audio");

  chatrelay::protocol::MarkReadCommand mark;
  mark.set_chat("5491100000000@s.whatsapp.net");
  mark.add_message_ids("M1");
  mark.set_type("read");
  client.MarkRead(mark);

  const auto commands = Commands(options.command_sink);
  assert(commands.size() == 3);
  assert(commands[0].id() == id);
  assert(commands[0].send_text().text() == "hola");
  assert(commands[1].chat_presence().media() == "audio");
  assert(commands[2].mark_read().has_at());
  assert(commands[1].id() != commands[2].id());

  client.Disconnect();

  bool threw = false;
  try {
    client.SendText("5491100000000@s.whatsapp.net", "late");
  } catch (const chatrelay::util::TransportError&) {
    threw = true;
  }
  assert(threw);
}

void TestUploadSpoolsContentAddressedFile() {
  const auto dir     = chatrelay::testing::FreshDir("stream_client_upload");
  const auto options = Options(dir);
  Append(options.event_source, "");

  StreamClient client(options);
  client.Connect([](const RawEvent&) {});

  const std::string data   = "abc";
  const auto        result = client.Upload(data, "image");

  // sha256("abc")
  const std::string hex = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
  assert(chatrelay::util::HexEncode(result.file_sha256()) == hex);
  assert(std::filesystem::exists(options.spool_dir / (hex + ".bin")));
  assert(result.file_length() == 3);
  assert(result.media_key().size() == 32);
  assert(result.url().rfind("file://", 0) == 0);
}

void TestMissingEventSourceFailsToConnect() {
  const auto dir     = chatrelay::testing::FreshDir("stream_client_missing");
  auto       options = Options(dir);
  options.event_source = dir / "absent.ndjson";

  StreamClient client(options);
  bool         threw = false;
  try {
    client.Connect([](const RawEvent&) {});
  } catch (const chatrelay::util::TransportError&) {
    threw = true;
  }
  assert(threw);
  assert(!client.IsConnected());
}

} // namespace

int main() {
  TestReadsAndFollowsEventStream();
  TestCommandsAreAppendedAsLines();
  TestUploadSpoolsContentAddressedFile();
  TestMissingEventSourceFailsToConnect();

  std::cout << "chatrelay_unit_stream_client: pass\n";
  return 0;
}
