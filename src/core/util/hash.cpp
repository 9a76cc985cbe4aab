#include "core/util/hash.hpp"

#include <array>
#include <mutex>

#include <sodium.h>

namespace stride::util {
namespace {

std::string to_hex(const unsigned char* bytes, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2U);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kHex[(bytes[i] >> 4U) & 0x0FU]);
    out.push_back(kHex[bytes[i] & 0x0FU]);
  }
  return out;
}

}  // namespace

bool hashing_ready() {
  static std::once_flag once;
  static bool ready = false;
  std::call_once(once, [] { ready = sodium_init() >= 0; });
  return ready;
}

std::string blake2b_hex(std::string_view payload) {
  if (!hashing_ready()) {
    return {};
  }

  std::array<unsigned char, crypto_generichash_BYTES> digest{};
  crypto_generichash(digest.data(), digest.size(),
                     reinterpret_cast<const unsigned char*>(payload.data()),
                     static_cast<unsigned long long>(payload.size()), nullptr, 0);
  return to_hex(digest.data(), digest.size());
}

bool checksum_matches(std::string_view payload, std::string_view expected_hex) {
  const std::string actual = blake2b_hex(payload);
  if (actual.empty() || actual.size() != expected_hex.size()) {
    return false;
  }
  return sodium_memcmp(actual.data(), expected_hex.data(), actual.size()) == 0;
}

}  // namespace stride::util
