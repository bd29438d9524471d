#include "uuid.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace chatrelay::util {

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  // version 4, RFC4122 variant
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string NewMessageId() {
  std::ostringstream oss;
  for (auto b : GenerateUUID())
    oss << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
  return oss.str();
}

} // namespace chatrelay::util
