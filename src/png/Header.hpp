#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace pngstego::png {

/// Size of the IHDR chunk payload.
inline constexpr size_t HEADER_DATA_SIZE = 13;

/**
 * @brief Decoded IHDR fields.
 */
struct HeaderFields {
  uint32_t width = 0;                ///< Image width
  uint32_t height = 0;               ///< Image height
  uint8_t bit_depth = 0;             ///< Bit depth
  uint8_t color_type = 0;            ///< Color type
  uint8_t compression_method = 0;    ///< Compression method
  uint8_t filter_method = 0;         ///< Filter method
  uint8_t interlace_method = 0;      ///< Interlace method

  bool operator==(const HeaderFields &) const = default;
};

// PNG colour type values
enum ColorType : uint8_t {
  COLOR_GRAY = 0,
  COLOR_RGB = 2,
  COLOR_PALETTE = 3,
  COLOR_GRAY_ALPHA = 4,
  COLOR_RGBA = 6
};

/**
 * @brief Decodes the IHDR payload by fixed offsets.
 * @param data Chunk data; only the first 13 bytes are used.
 * @return The decoded fields. No range validation is performed.
 * @throws StegoException (MalformedHeader) if fewer than 13 bytes are given.
 */
HeaderFields parseHeader(std::span<const uint8_t> data);

/**
 * @brief Encodes header fields as a 13-byte IHDR payload.
 */
std::array<uint8_t, HEADER_DATA_SIZE> serializeHeader(const HeaderFields &fields);

/**
 * @brief Number of samples per pixel for a colour type.
 * @return 1-4, or std::nullopt for values PNG does not define.
 */
std::optional<int> channelsForColorType(uint8_t color_type);

/**
 * @brief Index of the alpha sample within a pixel, if the colour type has one.
 */
std::optional<int> alphaChannelIndex(uint8_t color_type);

} // namespace pngstego::png
