#include "CRC.hpp"

#include <bit>
#include <cstring>

namespace pngstego::png {

uint32_t CRCCalculator::fast_crc32(const uint8_t *data, size_t length,
                                   uint32_t crc) {
  static constexpr auto crc_tables = generate_crc_table();
  crc = ~crc;

  // Word-at-a-time path assumes little-endian loads
  if constexpr (std::endian::native == std::endian::little) {
    while (length >= 4) {
      uint32_t word;
      std::memcpy(&word, data, sizeof(word));
      crc ^= word;
      crc = crc_tables[3][crc & 0xFF] ^ crc_tables[2][(crc >> 8) & 0xFF] ^
            crc_tables[1][(crc >> 16) & 0xFF] ^ crc_tables[0][crc >> 24];
      data += 4;
      length -= 4;
    }
  }

  while (length--) {
    crc = (crc >> 8) ^ crc_tables[0][(crc & 0xFF) ^ *data++];
  }

  return ~crc;
}

} // namespace pngstego::png
