#include "stream_client.hpp"

#include <fcntl.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "internal/identity/chat_id.hpp"
#include "internal/model/json.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace chatrelay::protocol {

using chatrelay::protocol::v1::OutboundCommand;
using observability::IntField;
using observability::StringField;

namespace {

constexpr int                       kPollTimeoutMs = 200;
constexpr std::chrono::milliseconds kIdleWait{200};
constexpr std::size_t               kMediaKeyBytes = 32;

std::string Sha256(const std::string& data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  len = 0;
  if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_sha256(), nullptr) != 1) {
    throw util::TransportError("sha256 digest failed");
  }
  return std::string(reinterpret_cast<const char*>(digest), len);
}

} // namespace

StreamClient::StreamClient(StreamClientOptions options) : options_(std::move(options)) {}

StreamClient::~StreamClient() {
  Disconnect();
}

// ------------------------------------------------------------------
// Connection
// ------------------------------------------------------------------

void StreamClient::Connect(EventHandler handler) {
  if (connected_) return;

  {
    std::lock_guard lock(write_mutex_);
    commands_.open(options_.command_sink, std::ios::out | std::ios::app);
    if (!commands_) {
      throw util::TransportError("cannot open command sink: " + options_.command_sink.string());
    }
  }

  const int fd = ::open(options_.event_source.c_str(), O_RDONLY | O_NONBLOCK);
  if (fd < 0) {
    std::lock_guard lock(write_mutex_);
    commands_.close();
    throw util::TransportError("cannot open event source: " + options_.event_source.string() + ": " + std::strerror(errno));
  }

  handler_   = std::move(handler);
  stop_      = util::Context::Background();
  connected_ = true;
  reader_    = std::thread([this, fd] { ReadLoop(fd); });

  CHATRELAY_LOG_INFO("protocol_connected", {StringField("events", options_.event_source.string()), StringField("commands", options_.command_sink.string())});
}

void StreamClient::Disconnect() {
  if (!connected_.exchange(false)) return;

  stop_.Cancel();
  if (reader_.joinable()) reader_.join();

  std::lock_guard lock(write_mutex_);
  commands_.close();

  CHATRELAY_LOG_INFO("protocol_disconnected");
}

bool StreamClient::IsConnected() const {
  return connected_;
}

std::string StreamClient::OwnId() const {
  return options_.own_id.empty() ? std::string() : identity::CanonicalChatId(options_.own_id);
}

void StreamClient::ReadLoop(int fd) {
  std::string pending;
  char        buf[8192];

  while (!stop_.Done()) {
    pollfd pfd{fd, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, kPollTimeoutMs);
    if (ready < 0 && errno != EINTR) {
      CHATRELAY_LOG_ERROR("protocol_poll_failed", {StringField("error", std::strerror(errno))});
      break;
    }
    if (ready <= 0) continue;

    const auto n = ::read(fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EAGAIN || errno == EINTR) continue;
      CHATRELAY_LOG_ERROR("protocol_read_failed", {StringField("error", std::strerror(errno))});
      break;
    }
    if (n == 0) {
      // end of file, or no writer on the FIFO yet
      if (!stop_.WaitFor(kIdleWait)) break;
      continue;
    }

    pending.append(buf, static_cast<std::size_t>(n));
    std::size_t start = 0;
    for (auto nl = pending.find('\n', start); nl != std::string::npos; nl = pending.find('\n', start)) {
      HandleLine(std::string_view(pending).substr(start, nl - start));
      start = nl + 1;
    }
    pending.erase(0, start);
  }

  ::close(fd);
}

void StreamClient::HandleLine(std::string_view line) {
  line = util::Trim(line);
  if (line.empty()) return;

  RawEvent event;
  try {
    model::FromJson(line, &event);
  } catch (const util::ValidationError& e) {
    CHATRELAY_LOG_WARN("protocol_line_skipped", {StringField("error", e.what()), StringField("line", util::Preview(line, 80))});
    return;
  }

  Remember(event);

  try {
    handler_(event);
  } catch (const std::exception& e) {
    CHATRELAY_LOG_ERROR("protocol_handler_failed", {StringField("error", e.what())});
  }
}

void StreamClient::Remember(const RawEvent& event) {
  std::lock_guard lock(names_mutex_);
  switch (event.kind_case()) {
    case RawEvent::kMessage: {
      const auto& info = event.message().info();
      if (!info.push_name().empty() && !info.is_from_me()) {
        contact_names_[identity::CanonicalChatId(info.sender())] = info.push_name();
      }
      if (identity::IsGroup(info.chat()) && !event.message().conversation_name().empty()) {
        group_names_[identity::CanonicalChatId(info.chat())] = event.message().conversation_name();
      }
      break;
    }
    case RawEvent::kGroupInfo:
      if (!event.group_info().name().empty()) {
        group_names_[identity::CanonicalChatId(event.group_info().jid())] = event.group_info().name();
      }
      break;
    case RawEvent::kJoinedGroup:
      if (!event.joined_group().name().empty()) {
        group_names_[identity::CanonicalChatId(event.joined_group().jid())] = event.joined_group().name();
      }
      break;
    default:
      break;
  }
}

std::string StreamClient::ContactName(const std::string& chat_id) const {
  std::lock_guard lock(names_mutex_);
  auto            it = contact_names_.find(identity::CanonicalChatId(chat_id));
  return it == contact_names_.end() ? std::string() : it->second;
}

std::string StreamClient::GroupName(const std::string& group_id) const {
  std::lock_guard lock(names_mutex_);
  auto            it = group_names_.find(identity::CanonicalChatId(group_id));
  return it == group_names_.end() ? std::string() : it->second;
}

// ------------------------------------------------------------------
// Commands
// ------------------------------------------------------------------

std::string StreamClient::Write(OutboundCommand command) {
  if (command.id().empty()) command.set_id(util::NewMessageId());
  const auto line = model::ToJson(command);

  std::lock_guard lock(write_mutex_);
  if (!connected_ || !commands_.is_open()) {
    throw util::TransportError("protocol client not connected");
  }
  commands_ << line << '\n';
  commands_.flush();
  if (!commands_) {
    commands_.clear();
    throw util::TransportError("command sink write failed");
  }
  return command.id();
}

std::string StreamClient::SendText(const std::string& to, const std::string& text) {
  OutboundCommand command;
  auto*           send = command.mutable_send_text();
  send->set_to(to);
  send->set_text(text);
  return Write(std::move(command));
}

UploadResult StreamClient::Upload(const std::string& data, const std::string& kind) {
  const auto digest = Sha256(data);
  const auto path   = options_.spool_dir / (util::HexEncode(digest) + ".bin");

  std::error_code ec;
  std::filesystem::create_directories(options_.spool_dir, ec);
  if (ec) throw util::TransportError("cannot create spool dir: " + ec.message());

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
  out.close();
  if (!out) throw util::TransportError("spool write failed: " + path.string());

  std::string media_key(kMediaKeyBytes, '\0');
  if (RAND_bytes(reinterpret_cast<unsigned char*>(media_key.data()), static_cast<int>(media_key.size())) != 1) {
    throw util::TransportError("media key generation failed");
  }

  UploadResult result;
  result.set_url("file://" + std::filesystem::absolute(path).string());
  result.set_direct_path(path.string());
  result.set_media_key(media_key);
  result.set_file_sha256(digest);
  result.set_file_length(data.size());

  CHATRELAY_LOG_DEBUG("protocol_upload", {StringField("kind", kind), StringField("path", path.string()), IntField("bytes", static_cast<std::int64_t>(data.size()))});
  return result;
}

std::string StreamClient::SendMedia(const SendMediaCommand& media) {
  OutboundCommand command;
  *command.mutable_send_media() = media;
  return Write(std::move(command));
}

void StreamClient::SendPresence(bool available) {
  OutboundCommand command;
  command.mutable_set_presence()->set_available(available);
  Write(std::move(command));
}

void StreamClient::SendChatPresence(const std::string& to, const std::string& state, const std::string& media) {
  OutboundCommand command;
  auto*           presence = command.mutable_chat_presence();
  presence->set_to(to);
  presence->set_state(state);
  presence->set_media(media);
  Write(std::move(command));
}

void StreamClient::MarkRead(const MarkReadCommand& mark) {
  OutboundCommand command;
  *command.mutable_mark_read() = mark;
  if (!mark.has_at()) *command.mutable_mark_read()->mutable_at() = util::ToProto(util::Now());
  Write(std::move(command));
}

} // namespace chatrelay::protocol
