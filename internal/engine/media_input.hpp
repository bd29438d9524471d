#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace chatrelay::engine {

inline constexpr std::uint32_t kDefaultAudioSeconds = 30;
inline constexpr std::size_t   kWaveformSamples     = 64;

// MIME type for a file extension, application/octet-stream when unknown.
std::string MimeTypeForPath(const std::filesystem::path& path);

// image | video | audio | document
std::string MediaKindForPath(const std::filesystem::path& path);

/*
  Duration of an Ogg/Opus stream from the last non-zero granule position
  at 48 kHz, rounded up and clamped to [1, 300]. nullopt when the data is
  not an Ogg stream; kDefaultAudioSeconds when no page carries a granule.
*/
std::optional<std::uint32_t> OggDurationSeconds(std::string_view data);

// Deterministic 64-sample waveform (0-100) shaped by the duration.
std::string PlaceholderWaveform(std::uint32_t seconds);

struct MediaInput {
  std::string data;
  std::string mimetype;
  std::string filename;
  std::string kind;
  std::string caption;
};

/*
  Builds a media input from a file on disk or inline bytes. An explicit
  mimetype wins over the extension guess.

  Throws util::ValidationError when the file cannot be read or there is no data.
*/
MediaInput LoadMediaInput(const std::string& path, const std::string& inline_data, const std::string& mimetype, const std::string& filename,
                          const std::string& caption);

} // namespace chatrelay::engine
