#include "media_input.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <random>
#include <sstream>
#include <unordered_map>

#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace chatrelay::engine {

namespace {

constexpr double kPi             = 3.14159265358979323846;
constexpr double kOpusSampleRate = 48000.0;
constexpr double kMinSeconds     = 1.0;
constexpr double kMaxSeconds     = 300.0;

// page header: "OggS", version, flags, granule(8), serial(4), seq(4), crc(4), segments(1)
constexpr std::size_t kPageHeaderSize = 27;

std::string Extension(const std::filesystem::path& path) {
  return util::ToLower(path.extension().string());
}

std::uint64_t ReadLe64(std::string_view data, std::size_t offset) {
  std::uint64_t v = 0;
  for (int i = 7; i >= 0; --i) {
    v = (v << 8) | static_cast<unsigned char>(data[offset + static_cast<std::size_t>(i)]);
  }
  return v;
}

} // namespace

std::string MimeTypeForPath(const std::filesystem::path& path) {
  static const std::unordered_map<std::string, std::string> kTypes = {
      {".jpg", "image/jpeg"},        {".jpeg", "image/jpeg"},      {".png", "image/png"},
      {".webp", "image/webp"},       {".gif", "image/gif"},        {".mp4", "video/mp4"},
      {".mov", "video/quicktime"},   {".m4v", "video/x-m4v"},      {".webm", "video/webm"},
      {".ogg", "audio/ogg"},         {".opus", "audio/ogg"},       {".mp3", "audio/mpeg"},
      {".m4a", "audio/mp4"},         {".wav", "audio/wav"},        {".pdf", "application/pdf"},
      {".txt", "text/plain"},        {".csv", "text/csv"},         {".zip", "application/zip"},
      {".doc", "application/msword"}, {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
  };

  auto it = kTypes.find(Extension(path));
  return it == kTypes.end() ? "application/octet-stream" : it->second;
}

std::string MediaKindForPath(const std::filesystem::path& path) {
  const auto ext = Extension(path);
  if (ext == ".jpg" || ext == ".jpeg" || ext == ".png" || ext == ".webp" || ext == ".gif") return "image";
  if (ext == ".mp4" || ext == ".mov" || ext == ".m4v" || ext == ".webm") return "video";
  if (ext == ".ogg" || ext == ".opus" || ext == ".mp3" || ext == ".m4a" || ext == ".wav") return "audio";
  return "document";
}

std::optional<std::uint32_t> OggDurationSeconds(std::string_view data) {
  if (data.substr(0, 4) != "OggS") return std::nullopt;

  std::uint64_t last_granule = 0;
  std::size_t   i            = 0;
  while (i + kPageHeaderSize < data.size()) {
    if (data.substr(i, 4) != "OggS") {
      ++i;
      continue;
    }
    const auto granule  = ReadLe64(data, i + 6);
    const auto segments = static_cast<unsigned char>(data[i + 26]);
    if (i + kPageHeaderSize + segments >= data.size()) break;

    std::size_t page_size = kPageHeaderSize + segments;
    for (std::size_t s = 0; s < segments; ++s) {
      page_size += static_cast<unsigned char>(data[i + kPageHeaderSize + s]);
    }

    if (granule != 0) last_granule = granule;
    i += page_size;
  }

  if (last_granule == 0) return kDefaultAudioSeconds;

  const double seconds = std::clamp(static_cast<double>(last_granule) / kOpusSampleRate, kMinSeconds, kMaxSeconds);
  return static_cast<std::uint32_t>(std::ceil(seconds));
}

std::string PlaceholderWaveform(std::uint32_t seconds) {
  std::mt19937                           rng(seconds);
  std::uniform_real_distribution<double> noise(-0.5, 0.5);

  const double base = 35.0;
  const double freq = static_cast<double>(std::min<std::uint32_t>(seconds, 120)) / 30.0;

  std::string wave(kWaveformSamples, '\0');
  for (std::size_t i = 0; i < kWaveformSamples; ++i) {
    const double pos = static_cast<double>(i) / static_cast<double>(kWaveformSamples);
    double       val = base * std::sin(pos * kPi * freq * 8) + (base / 2) * std::sin(pos * kPi * freq * 16);
    val += noise(rng) * 15;
    val = val * (0.7 + 0.3 * std::sin(pos * kPi)) + 50;
    wave[i] = static_cast<char>(std::clamp(val, 0.0, 100.0));
  }
  return wave;
}

MediaInput LoadMediaInput(const std::string& path, const std::string& inline_data, const std::string& mimetype, const std::string& filename,
                          const std::string& caption) {
  MediaInput in;
  in.caption = caption;

  if (!inline_data.empty()) {
    in.data     = inline_data;
    in.filename = filename;
  } else {
    std::ifstream file(path, std::ios::binary);
    if (!file) throw util::ValidationError("cannot read media file: " + path);
    std::ostringstream buf;
    buf << file.rdbuf();
    in.data     = buf.str();
    in.filename = filename.empty() ? std::filesystem::path(path).filename().string() : filename;
  }
  if (in.data.empty()) throw util::ValidationError("media is empty");

  in.mimetype = mimetype.empty() ? MimeTypeForPath(in.filename) : mimetype;
  in.kind     = MediaKindForPath(in.filename);

  // inline data without a usable extension: fall back on the mimetype family
  if (in.kind == "document" && !mimetype.empty()) {
    const auto family = util::ToLower(mimetype.substr(0, mimetype.find('/')));
    if (family == "image" || family == "video" || family == "audio") in.kind = family;
  }
  return in;
}

} // namespace chatrelay::engine
