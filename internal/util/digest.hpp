#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace pipeline::util {

// 64-bit FNV-1a over the input bytes.
uint64_t Fnv1a64(std::string_view data);

// Lowercase hex of Fnv1a64(data), truncated to `length` digits (max 16).
std::string ShortDigestHex(std::string_view data, std::size_t length = 12);

} // namespace pipeline::util
