#include "internal/sink/folder_sink.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "tests/support/test_fakes.hpp"

namespace {

namespace fs = std::filesystem;

using chatrelay::model::Envelope;
using chatrelay::sink::FolderSink;
using chatrelay::sink::FolderSinkOptions;

Envelope Message(const std::string& chat, const std::string& text) {
  Envelope env;
  env.set_event_type("message");
  env.set_direction("in");
  env.set_chat_id(chat);
  env.set_sender_id(chat);
  env.set_message_id("ID-" + text);
  env.set_text(text);
  return env;
}

std::vector<std::string> Lines(const fs::path& path) {
  std::ifstream            in(path);
  std::vector<std::string> lines;
  for (std::string line; std::getline(in, line);) lines.push_back(line);
  return lines;
}

void TestPartitionsByConversationKind() {
  FolderSinkOptions options;
  options.base_dir = "/out";
  options.host_id  = "edge-1";
  FolderSink sink(options);

  assert(sink.TargetFor(Message("120363@g.us", "x")) == fs::path("/out/groups/120363_g.us.ndjson"));
  assert(sink.TargetFor(Message("549@s.whatsapp.net", "x")) == fs::path("/out/contacts/549_s.whatsapp.net.ndjson"));

  auto status = Message("status@broadcast", "x");
  status.set_sender_id("777@s.whatsapp.net");
  assert(sink.TargetFor(status) == fs::path("/out/contacts/777_s.whatsapp.net.ndjson"));

  Envelope connected;
  connected.set_event_type("connected");
  assert(sink.TargetFor(connected) == fs::path("/out/devices/edge-1.ndjson"));

  Envelope other;
  other.set_event_type("custom_thing");
  assert(sink.TargetFor(other) == fs::path("/out/system/custom_thing.ndjson"));
}

void TestAppendWritesOneStampedLinePerEnvelope() {
  const auto        dir = chatrelay::testing::FreshDir("sink_append");
  FolderSinkOptions options;
  options.base_dir = dir;
  FolderSink sink(options);

  const auto path = sink.Append(Message("549@s.whatsapp.net", "hola"));
  sink.Append(Message("549@s.whatsapp.net", "chau"));

  const auto lines = Lines(path);
  assert(lines.size() == 2);
  const auto first = chatrelay::model::Parse(lines[0]);
  assert(first.text() == "hola");
  assert(first.has_at());
}

void TestRotationMovesToNextPartWithoutOverwriting() {
  const auto        dir = chatrelay::testing::FreshDir("sink_rotation");
  FolderSinkOptions options;
  options.base_dir  = dir;
  options.max_bytes = 400;
  FolderSink sink(options);

  const std::string chat = "549@s.whatsapp.net";
  const auto        base = sink.TargetFor(Message(chat, ""));

  std::vector<fs::path> written;
  for (int i = 0; i < 6; ++i) {
    written.push_back(sink.Append(Message(chat, std::string(120, 'a' + i))));
  }

  assert(written.front() == base);
  assert(written.back() != base);
  assert(fs::exists(base.string() + ".part1"));

  std::size_t total = Lines(base).size();
  for (int part = 1; fs::exists(base.string() + ".part" + std::to_string(part)); ++part) {
    const fs::path path = base.string() + ".part" + std::to_string(part);
    assert(fs::file_size(path) <= 400 || Lines(path).size() == 1);
    total += Lines(path).size();
  }
  assert(total == 6);
}

void TestOversizedFirstLineStillLandsInEmptyPart() {
  const auto        dir = chatrelay::testing::FreshDir("sink_oversized");
  FolderSinkOptions options;
  options.base_dir  = dir;
  options.max_bytes = 50;
  FolderSink sink(options);

  const auto path = sink.Append(Message("549@s.whatsapp.net", std::string(200, 'z')));
  assert(path == sink.TargetFor(Message("549@s.whatsapp.net", "")));
  assert(Lines(path).size() == 1);
}

void TestConcurrentAppendsKeepLinesIntact() {
  const auto        dir = chatrelay::testing::FreshDir("sink_concurrent");
  FolderSinkOptions options;
  options.base_dir = dir;
  FolderSink sink(options);

  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&sink, t] {
      for (int i = 0; i < 25; ++i) sink.Append(Message("120363@g.us", "w" + std::to_string(t) + "-" + std::to_string(i)));
    });
  }
  for (auto& w : writers) w.join();
  assert(sink.LockedPaths() == 0);

  const auto lines = Lines(sink.TargetFor(Message("120363@g.us", "")));
  assert(lines.size() == 100);
  for (const auto& line : lines) (void)chatrelay::model::Parse(line);
}

} // namespace

int main() {
  TestPartitionsByConversationKind();
  TestAppendWritesOneStampedLinePerEnvelope();
  TestRotationMovesToNextPartWithoutOverwriting();
  TestOversizedFirstLineStillLandsInEmptyPart();
  TestConcurrentAppendsKeepLinesIntact();

  std::cout << "chatrelay_unit_folder_sink: pass\n";
  return 0;
}
