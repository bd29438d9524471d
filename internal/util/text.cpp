#include "text.hpp"

#include <cctype>

namespace chatrelay::util {

namespace {

bool IsContinuation(unsigned char c) {
  return (c & 0xC0) == 0x80;
}

} // namespace

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

std::string ToLower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
  }
  return true;
}

std::size_t RuneCount(std::string_view s) {
  std::size_t n = 0;
  for (char c : s) {
    if (!IsContinuation(static_cast<unsigned char>(c))) ++n;
  }
  return n;
}

std::string Preview(std::string_view s, std::size_t max_runes) {
  s = Trim(s);
  if (max_runes == 0 || RuneCount(s) <= max_runes) return std::string(s);

  std::size_t runes = 0;
  std::size_t end   = 0;
  while (end < s.size()) {
    if (!IsContinuation(static_cast<unsigned char>(s[end]))) {
      if (runes == max_runes) break;
      ++runes;
    }
    ++end;
  }
  return std::string(s.substr(0, end)) + "\xE2\x80\xA6";
}

std::string HexEncode(std::string_view bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(bytes.size() * 2);
  for (unsigned char b : bytes) {
    out.push_back(kHex[(b >> 4) & 0x0F]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

} // namespace chatrelay::util
