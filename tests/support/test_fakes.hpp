#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/http/http_client.hpp"
#include "internal/protocol/protocol_client.hpp"
#include "internal/util/errors.hpp"

namespace chatrelay::testing {

/*
  Records every request; answers with `status` and `body`, or throws a
  TransportError while `fail_remaining` is positive.
*/
class RecordingHttpClient : public http::HttpClient {
 public:
  http::ClientResponse Send(const http::ClientRequest& request) override {
    std::lock_guard lock(mutex_);
    requests_.push_back(request);
    if (fail_remaining > 0) {
      --fail_remaining;
      throw util::TransportError("connection refused");
    }
    auto it = bodies.find(request.url);
    return {status, it == bodies.end() ? body : it->second};
  }

  std::vector<http::ClientRequest> Requests() const {
    std::lock_guard lock(mutex_);
    return requests_;
  }

  std::vector<http::ClientRequest> RequestsTo(const std::string& url) const {
    std::lock_guard                  lock(mutex_);
    std::vector<http::ClientRequest> out;
    for (const auto& r : requests_) {
      if (r.url == url) out.push_back(r);
    }
    return out;
  }

  long                               status = 200;
  std::string                        body   = "{}";
  std::map<std::string, std::string> bodies;
  int                                fail_remaining = 0;

 private:
  mutable std::mutex               mutex_;
  std::vector<http::ClientRequest> requests_;
};

/*
  In-process protocol session. Emit() feeds raw events to the connected
  handler; every command is recorded.
*/
class FakeProtocolClient : public protocol::ProtocolClient {
 public:
  void Connect(protocol::EventHandler handler) override {
    std::lock_guard lock(mutex_);
    if (connect_failures > 0) {
      --connect_failures;
      throw util::TransportError("session unavailable");
    }
    handler_   = std::move(handler);
    connected_ = true;
  }

  void Disconnect() override {
    std::lock_guard lock(mutex_);
    connected_ = false;
  }

  bool IsConnected() const override {
    std::lock_guard lock(mutex_);
    return connected_;
  }

  std::string OwnId() const override {
    return "1000@s.whatsapp.net";
  }

  std::string SendText(const std::string& to, const std::string& text) override {
    std::lock_guard lock(mutex_);
    if (send_failures > 0) {
      --send_failures;
      throw util::TransportError("send failed");
    }
    texts.emplace_back(to, text);
    return "OUT" + std::to_string(texts.size());
  }

  protocol::UploadResult Upload(const std::string& data, const std::string& kind) override {
    std::lock_guard        lock(mutex_);
    protocol::UploadResult result;
    result.set_url("file:///spool/" + kind + ".bin");
    result.set_direct_path("/spool/" + kind + ".bin");
    result.set_media_key(std::string(32, 'k'));
    result.set_file_length(data.size());
    uploads.push_back(kind);
    return result;
  }

  std::string SendMedia(const protocol::SendMediaCommand& command) override {
    std::lock_guard lock(mutex_);
    media.push_back(command);
    return "MEDIA" + std::to_string(media.size());
  }

  void SendPresence(bool available) override {
    std::lock_guard lock(mutex_);
    presence.push_back(available);
  }

  void SendChatPresence(const std::string& to, const std::string& state, const std::string& kind) override {
    std::lock_guard lock(mutex_);
    chat_presence.push_back({to, state, kind});
  }

  void MarkRead(const protocol::MarkReadCommand& command) override {
    std::lock_guard lock(mutex_);
    reads.push_back(command);
  }

  std::string ContactName(const std::string& chat_id) const override {
    auto it = contacts.find(chat_id);
    return it == contacts.end() ? std::string() : it->second;
  }

  std::string GroupName(const std::string& group_id) const override {
    auto it = groups.find(group_id);
    return it == groups.end() ? std::string() : it->second;
  }

  void Emit(const protocol::RawEvent& event) {
    protocol::EventHandler handler;
    {
      std::lock_guard lock(mutex_);
      handler = handler_;
    }
    if (handler) handler(event);
  }

  // Reads recorded state under the client lock.
  template <typename Fn>
  auto Locked(Fn&& fn) const -> decltype(fn()) {
    std::lock_guard lock(mutex_);
    return fn();
  }

  struct ChatPresence {
    std::string to;
    std::string state;
    std::string media;
  };

  int connect_failures = 0;
  int send_failures    = 0;

  std::map<std::string, std::string> contacts;
  std::map<std::string, std::string> groups;

  std::vector<std::pair<std::string, std::string>> texts;
  std::vector<std::string>                          uploads;
  std::vector<protocol::SendMediaCommand>           media;
  std::vector<bool>                                 presence;
  std::vector<ChatPresence>                         chat_presence;
  std::vector<protocol::MarkReadCommand>            reads;

 private:
  mutable std::mutex     mutex_;
  protocol::EventHandler handler_;
  bool                   connected_ = false;
};

inline std::filesystem::path FreshDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "chatrelay_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

// Polls `done` every 10ms until it holds or `timeout` passes.
inline bool Eventually(const std::function<bool()>& done, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
  const auto until = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < until) {
    if (done()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return done();
}

} // namespace chatrelay::testing
