#include "digest.hpp"

#include <algorithm>

namespace pipeline::util {

uint64_t Fnv1a64(std::string_view data) {
  uint64_t hash = 0xcbf29ce484222325ULL;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= 0x100000001b3ULL;
  }
  return hash;
}

std::string ShortDigestHex(std::string_view data, std::size_t length) {
  static constexpr char kHex[] = "0123456789abcdef";

  const auto  hash = Fnv1a64(data);
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[i] = kHex[(hash >> ((15 - i) * 4)) & 0x0F];
  }
  return out.substr(0, std::min<std::size_t>(length, out.size()));
}

} // namespace pipeline::util
