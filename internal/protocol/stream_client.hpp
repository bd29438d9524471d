#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

#include "internal/protocol/protocol_client.hpp"
#include "internal/util/context.hpp"

namespace chatrelay::protocol {

struct StreamClientOptions {
  // NDJSON RawEvent lines, a regular file (followed like tail -f) or a FIFO.
  std::filesystem::path event_source;

  // NDJSON OutboundCommand lines, appended.
  std::filesystem::path command_sink;

  // Uploaded media lands here as <sha256>.bin for the sidecar to pick up.
  std::filesystem::path spool_dir = "spool";

  std::string own_id;
};

/*
  ProtocolClient over two newline-delimited JSON streams shared with a
  protocol sidecar process.

  A reader thread decodes each event line into a RawEvent; undecodable
  lines are logged and skipped. Contact and group names seen in the stream
  are cached for the NameDirectory lookups. Commands are written one per
  line under a lock and flushed immediately.
*/
class StreamClient : public ProtocolClient {
 public:
  explicit StreamClient(StreamClientOptions options);
  ~StreamClient() override;

  StreamClient(const StreamClient&)            = delete;
  StreamClient& operator=(const StreamClient&) = delete;

  void Connect(EventHandler handler) override;
  void Disconnect() override;
  bool IsConnected() const override;

  std::string OwnId() const override;

  std::string  SendText(const std::string& to, const std::string& text) override;
  UploadResult Upload(const std::string& data, const std::string& kind) override;
  std::string  SendMedia(const SendMediaCommand& command) override;

  void SendPresence(bool available) override;
  void SendChatPresence(const std::string& to, const std::string& state, const std::string& media) override;
  void MarkRead(const MarkReadCommand& command) override;

  std::string ContactName(const std::string& chat_id) const override;
  std::string GroupName(const std::string& group_id) const override;

 private:
  void ReadLoop(int fd);
  void HandleLine(std::string_view line);
  void Remember(const RawEvent& event);

  // Assigns a command id when unset and returns it.
  std::string Write(chatrelay::protocol::v1::OutboundCommand command);

  StreamClientOptions options_;
  EventHandler        handler_;

  std::mutex    write_mutex_;
  std::ofstream commands_;

  std::atomic<bool> connected_{false};
  util::Context     stop_ = util::Context::Background();
  std::thread       reader_;

  mutable std::mutex                           names_mutex_;
  std::unordered_map<std::string, std::string> contact_names_;
  std::unordered_map<std::string, std::string> group_names_;
};

} // namespace chatrelay::protocol
