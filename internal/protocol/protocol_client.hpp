#pragma once

#include <functional>
#include <string>

#include "chatrelay/v1.hpp"

namespace chatrelay::protocol {

using RawEvent         = chatrelay::protocol::v1::RawEvent;
using UploadResult     = chatrelay::protocol::v1::UploadResult;
using SendMediaCommand = chatrelay::protocol::v1::SendMediaCommand;
using MarkReadCommand  = chatrelay::protocol::v1::MarkReadCommand;

using EventHandler = std::function<void(const RawEvent&)>;

/*
  Names the protocol session knows about. Empty when unknown.
*/
class NameDirectory {
 public:
  virtual ~NameDirectory() = default;

  virtual std::string ContactName(const std::string& chat_id) const = 0;
  virtual std::string GroupName(const std::string& group_id) const  = 0;
};

/*
  Boundary to the chat-protocol session.

  Every send primitive throws util::TransportError on failure; the engine
  wraps them in the rate-limited retry decorator.
*/
class ProtocolClient : public NameDirectory {
 public:
  // Starts delivering raw events to `handler`. Throws util::TransportError.
  virtual void Connect(EventHandler handler) = 0;
  virtual void Disconnect()                  = 0;
  virtual bool IsConnected() const           = 0;

  // Own account id, empty before pairing.
  virtual std::string OwnId() const = 0;

  // Returns the message id assigned to the sent message.
  virtual std::string SendText(const std::string& to, const std::string& text) = 0;

  virtual UploadResult Upload(const std::string& data, const std::string& kind) = 0;
  virtual std::string  SendMedia(const SendMediaCommand& command)               = 0;

  virtual void SendPresence(bool available)                                                              = 0;
  virtual void SendChatPresence(const std::string& to, const std::string& state, const std::string& media) = 0;
  virtual void MarkRead(const MarkReadCommand& command)                                                  = 0;
};

} // namespace chatrelay::protocol
