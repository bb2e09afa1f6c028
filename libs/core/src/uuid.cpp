#include "gentrade/core/uuid.h"

#include <cstdint>
#include <kj/array.h>
#include <random>

namespace gentrade::core {

kj::String generate_uuid() {
  // std::random is used because KJ has no random number generator
  static thread_local std::random_device rd;
  static thread_local std::mt19937_64 gen(rd());
  std::uniform_int_distribution<std::uint32_t> byte(0, 255);

  std::uint8_t bytes[16];
  for (auto& b : bytes) {
    b = static_cast<std::uint8_t>(byte(gen));
  }
  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0f) | 0x40); // version 4
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3f) | 0x80); // variant 10xx

  static constexpr char hex_chars[] = "0123456789abcdef";
  auto builder = kj::heapArrayBuilder<char>(37);
  for (size_t i = 0; i < 16; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      builder.add('-');
    }
    builder.add(hex_chars[bytes[i] >> 4]);
    builder.add(hex_chars[bytes[i] & 0x0f]);
  }
  builder.add('\0');
  return kj::String(builder.finish());
}

} // namespace gentrade::core
