#include "signature.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <stdexcept>

#include "internal/util/text.hpp"

namespace chatrelay::webhook {

std::string HmacSha256Hex(std::string_view secret, std::string_view body) {
  unsigned char out[EVP_MAX_MD_SIZE];
  size_t        out_len = 0;

  auto* result = EVP_Q_mac(nullptr, "HMAC", nullptr, "SHA256", nullptr, secret.data(), secret.size(),
                           reinterpret_cast<const unsigned char*>(body.data()), body.size(), out, sizeof(out), &out_len);
  if (result == nullptr) {
    throw std::runtime_error("HMAC-SHA256 computation failed");
  }
  return util::HexEncode(std::string_view(reinterpret_cast<const char*>(out), out_len));
}

std::string SignBody(std::string_view secret, std::string_view body) {
  return std::string(kSignaturePrefix) + HmacSha256Hex(secret, body);
}

bool VerifySignature(std::string_view secret, std::string_view body, std::string_view header) {
  if (secret.empty()) return false;

  header = util::Trim(header);
  if (header.substr(0, kSignaturePrefix.size()) != kSignaturePrefix) return false;

  const std::string got      = util::ToLower(header.substr(kSignaturePrefix.size()));
  const std::string expected = HmacSha256Hex(secret, body);
  if (got.size() != expected.size()) return false;

  return CRYPTO_memcmp(got.data(), expected.data(), expected.size()) == 0;
}

bool VerifyTimestamp(std::string_view header, util::TimePoint now, std::chrono::milliseconds skew) {
  const auto ts = util::ParseTimestamp(util::Trim(header));
  if (!ts) return false;

  auto diff = now - *ts;
  if (diff < util::Clock::duration::zero()) diff = -diff;
  return diff <= skew;
}

} // namespace chatrelay::webhook
