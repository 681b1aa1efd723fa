#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace pngstego::png {

namespace crc_utils {

namespace constants {
constexpr uint32_t PNG_CRC_POLYNOMIAL = 0xEDB88320; ///< CRC polynomial for PNG
constexpr size_t CRC_TABLE_SIZE = 256;              ///< Size of the CRC table
} // namespace constants

} // namespace crc_utils

/**
 * @brief CRC Calculator class for computing CRC32 checksums.
 */
class CRCCalculator {
public:
  /**
   * @brief Generates the CRC lookup table.
   * @return A 2D array containing the slice-by-4 lookup tables.
   */
  static constexpr auto generate_crc_table() {
    using namespace crc_utils::constants;
    std::array<std::array<uint32_t, CRC_TABLE_SIZE>, 4> table{};
    for (uint32_t i = 0; i < CRC_TABLE_SIZE; i++) {
      uint32_t crc = i;
      for (int j = 0; j < 8; j++) {
        crc = (crc >> 1) ^ ((crc & 1) * PNG_CRC_POLYNOMIAL);
      }
      table[0][i] = crc;
    }

    for (uint32_t i = 0; i < CRC_TABLE_SIZE; i++) {
      for (uint32_t j = 1; j < 4; j++) {
        table[j][i] = (table[j - 1][i] >> 8) ^ table[0][table[j - 1][i] & 0xFF];
      }
    }
    return table;
  }

  /**
   * @brief Computes the CRC32 checksum for the given data.
   * @param data Pointer to the data.
   * @param length Length of the data in bytes.
   * @param crc CRC of the preceding bytes, for chained calls (default 0).
   * @return The computed CRC32 checksum.
   */
  static uint32_t fast_crc32(const uint8_t *data, size_t length,
                             uint32_t crc = 0);
};

namespace crc_inline {
/**
 * @brief Computes the CRC32 checksum for the given bytes.
 */
inline uint32_t quick_crc32(std::span<const uint8_t> bytes, uint32_t crc = 0) {
  return CRCCalculator::fast_crc32(bytes.data(), bytes.size(), crc);
}
} // namespace crc_inline

} // namespace pngstego::png
