#include "internal/profile/profile_store.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/model/json.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_fakes.hpp"

namespace {

namespace fs = std::filesystem;

using chatrelay::model::Envelope;
using chatrelay::profile::NextStreak;
using chatrelay::profile::ProfileStore;
using chatrelay::profile::ProfileStoreOptions;
using namespace std::chrono_literals;

Envelope Inbound(const std::string& chat, const std::string& id, const std::string& text) {
  Envelope env;
  env.set_event_type("message");
  env.set_direction("in");
  env.set_chat_id(chat);
  env.set_sender_id(chat);
  env.set_chat_name("Ana");
  env.set_message_id(id);
  env.set_text(text);
  return env;
}

ProfileStore MakeStore(const std::string& name) {
  ProfileStoreOptions options;
  options.base_dir = chatrelay::testing::FreshDir(name);
  return ProfileStore(options);
}

void TestNextStreak() {
  assert(NextStreak("", 0, "2024-05-01") == 1);
  assert(NextStreak("2024-05-01", 3, "2024-05-01") == 3);
  assert(NextStreak("2024-04-30", 3, "2024-05-01") == 4);
  assert(NextStreak("2024-04-28", 3, "2024-05-01") == 1);
  assert(NextStreak("2023-12-31", 9, "2024-01-01") == 10);
}

void TestFirstTouchCreatesDefaults() {
  ProfileStoreOptions options;
  options.base_dir = chatrelay::testing::FreshDir("profile_defaults");
  ProfileStore store(options);

  const auto now     = chatrelay::util::Now();
  const auto profile = store.TouchInbound(Inbound("549@s.whatsapp.net", "M1", "hola"), now);

  assert(profile.chat_id() == "549@s.whatsapp.net");
  assert(profile.name() == "Ana");
  assert(profile.language() == "es");
  assert(profile.tier() == "free");
  assert(profile.has_first_seen());
  assert(profile.metrics().msg_in() == 1);
  assert(profile.metrics().last_msg_id() == "M1");
  assert(profile.metrics().streak_days() == 1);
  assert(profile.last_text() == "hola");
  assert(profile.tags().at("out.contacts_ndjson") == (options.base_dir / "contacts" / "549_s.whatsapp.net.ndjson").string());
  assert(fs::exists(store.SnapshotPath("549@s.whatsapp.net")));
}

void TestStreakAcrossDays() {
  auto store = MakeStore("profile_streak");

  const auto day1 = chatrelay::util::Now();
  store.TouchInbound(Inbound("549@s.whatsapp.net", "M1", "a"), day1);
  store.TouchInbound(Inbound("549@s.whatsapp.net", "M2", "b"), day1);
  assert(store.Get("549@s.whatsapp.net")->metrics().streak_days() == 1);

  store.TouchInbound(Inbound("549@s.whatsapp.net", "M3", "c"), day1 + 24h);
  assert(store.Get("549@s.whatsapp.net")->metrics().streak_days() == 2);

  const auto after_gap = store.TouchInbound(Inbound("549@s.whatsapp.net", "M4", "d"), day1 + 96h);
  assert(after_gap.metrics().streak_days() == 1);
  assert(after_gap.metrics().msg_in() == 4);
}

void TestGroupTagAndOutboundCounter() {
  ProfileStoreOptions options;
  options.base_dir = chatrelay::testing::FreshDir("profile_group");
  ProfileStore store(options);

  store.TouchInbound(Inbound("120363@g.us", "G1", "hi"), chatrelay::util::Now());
  const auto profile = store.RecordOutbound("120363@g.us", chatrelay::util::Now());

  assert(profile.tags().count("out.group.120363@g.us") == 1);
  assert(profile.metrics().msg_out() == 1);
  assert(profile.metrics().msg_in() == 1);
}

void TestSnapshotSurvivesRestart() {
  ProfileStoreOptions options;
  options.base_dir = chatrelay::testing::FreshDir("profile_restart");
  {
    ProfileStore store(options);
    store.TouchInbound(Inbound("549@s.whatsapp.net", "M1", "hola"), chatrelay::util::Now());
    store.TouchInbound(Inbound("549@s.whatsapp.net", "M2", "otra"), chatrelay::util::Now());
  }

  ProfileStore reopened(options);
  const auto   loaded = reopened.Get("549@s.whatsapp.net");
  assert(loaded.has_value());
  assert(loaded->metrics().msg_in() == 2);
  assert(loaded->last_text() == "otra");

  const auto touched = reopened.TouchInbound(Inbound("549@s.whatsapp.net", "M3", "x"), chatrelay::util::Now());
  assert(touched.metrics().msg_in() == 3);
}

void TestMediaHistoryIsCappedOldestFirst() {
  ProfileStoreOptions options;
  options.base_dir = chatrelay::testing::FreshDir("profile_media");
  ProfileStore store(options);

  for (int i = 0; i < 5; ++i) {
    auto env = Inbound("549@s.whatsapp.net", "IMG" + std::to_string(i), "caption " + std::to_string(i));
    env.mutable_media()->set_type("Image");
    store.AppendMedia("549@s.whatsapp.net", env, 3);
  }

  auto outbound = Inbound("549@s.whatsapp.net", "OUT1", "");
  outbound.set_direction("out");
  outbound.mutable_media()->set_type("audio");
  store.AppendMedia("549@s.whatsapp.net", outbound, 3);

  Envelope no_media = Inbound("549@s.whatsapp.net", "TXT", "plain");
  assert(!store.AppendMedia("549@s.whatsapp.net", no_media, 3).has_value());

  const auto profile = store.Get("549@s.whatsapp.net");
  assert(profile->media().inbound_size() == 3);
  assert(profile->media().inbound(0).message_id() == "IMG2");
  assert(profile->media().inbound(2).caption() == "caption 4");
  assert(profile->media().inbound(0).type() == "image");
  assert(profile->media().outbound_size() == 1);
  assert(profile->media().outbound(0).direction() == "out");
}

void TestRejectsEnvelopeWithoutAddress() {
  auto     store = MakeStore("profile_reject");
  Envelope env;
  env.set_event_type("message");

  bool threw = false;
  try {
    store.TouchInbound(env, chatrelay::util::Now());
  } catch (const chatrelay::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestConcurrentTouchesAreSerialized() {
  ProfileStoreOptions options;
  options.base_dir = chatrelay::testing::FreshDir("profile_concurrent");
  ProfileStore store(options);

  std::vector<std::thread> workers;
  for (int t = 0; t < 4; ++t) {
    workers.emplace_back([&store, t] {
      for (int i = 0; i < 20; ++i) {
        store.TouchInbound(Inbound("549@s.whatsapp.net", std::to_string(t * 100 + i), "x"), chatrelay::util::Now());
      }
    });
  }
  for (auto& w : workers) w.join();

  assert(store.Get("549@s.whatsapp.net")->metrics().msg_in() == 80);

  ProfileStore reopened(options);
  assert(reopened.Get("549@s.whatsapp.net")->metrics().msg_in() == 80);
}

} // namespace

int main() {
  TestNextStreak();
  TestFirstTouchCreatesDefaults();
  TestStreakAcrossDays();
  TestGroupTagAndOutboundCounter();
  TestSnapshotSurvivesRestart();
  TestMediaHistoryIsCappedOldestFirst();
  TestRejectsEnvelopeWithoutAddress();
  TestConcurrentTouchesAreSerialized();

  std::cout << "chatrelay_unit_profile_store: pass\n";
  return 0;
}
