#pragma once

#include <optional>
#include <string>

#include "internal/model/envelope.hpp"
#include "internal/protocol/protocol_client.hpp"

namespace chatrelay::engine {

// extended text, plain body, image caption, video caption
std::string ExtractText(const chatrelay::protocol::v1::MessageContent& content);

// First present attachment among image, audio, video, document.
std::optional<model::MediaTicket> ExtractMedia(const chatrelay::protocol::v1::MessageEvent& event);

/*
  Maps a raw protocol event to the canonical envelope.

  Every address is passed through CanonicalChatId. Messages get a direction
  from is_from_me, their text, media ticket and resolved chat name. `at` is
  left unset; it is assigned when the envelope is serialized.
*/
model::Envelope Normalize(const protocol::RawEvent& raw, const protocol::NameDirectory* names);

} // namespace chatrelay::engine
