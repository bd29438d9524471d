#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace chatrelay::util {

std::string_view Trim(std::string_view s);
std::string      ToLower(std::string_view s);

bool EqualsIgnoreCase(std::string_view a, std::string_view b);

// Number of UTF-8 code points.
std::size_t RuneCount(std::string_view s);

// Trimmed text cut to `max_runes` code points with an ellipsis appended when cut.
std::string Preview(std::string_view s, std::size_t max_runes);

std::string HexEncode(std::string_view bytes);

} // namespace chatrelay::util
