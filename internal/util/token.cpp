#include "token.hpp"

#include <array>
#include <cstdint>
#include <cstdio>
#include <random>

namespace pipeline::util {

std::string GenerateLockToken() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::array<uint8_t, 16> bytes{};
  const uint64_t          hi = rng();
  const uint64_t          lo = rng();
  for (int i = 0; i < 8; ++i) {
    bytes[i]     = static_cast<uint8_t>(hi >> (56 - 8 * i));
    bytes[i + 8] = static_cast<uint8_t>(lo >> (56 - 8 * i));
  }
  bytes[6] = (bytes[6] & 0x0F) | 0x40;
  bytes[8] = (bytes[8] & 0x3F) | 0x80;

  char out[37];
  std::snprintf(out, sizeof(out), "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x", bytes[0], bytes[1],
                bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7], bytes[8], bytes[9], bytes[10], bytes[11], bytes[12],
                bytes[13], bytes[14], bytes[15]);
  return out;
}

} // namespace pipeline::util
