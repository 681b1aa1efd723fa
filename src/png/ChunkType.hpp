#ifndef PNGSTEGO_CHUNKTYPE_HPP
#define PNGSTEGO_CHUNKTYPE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace pngstego::png {

/**
 * @struct ChunkType
 * @brief Four-byte chunk type code.
 */
struct ChunkType {
  std::array<uint8_t, 4> bytes{};

  constexpr ChunkType() = default;
  constexpr explicit ChunkType(const std::array<uint8_t, 4> &code)
      : bytes(code) {}
  /// Builds a code from a four-character literal, e.g. ChunkType("IHDR").
  constexpr explicit ChunkType(const char (&name)[5])
      : bytes{static_cast<uint8_t>(name[0]), static_cast<uint8_t>(name[1]),
              static_cast<uint8_t>(name[2]), static_cast<uint8_t>(name[3])} {}

  constexpr bool operator==(const ChunkType &) const = default;

  /**
   * @brief Text form of the code; bytes outside printable ASCII are
   * rendered as \xNN.
   */
  std::string toString() const;
};

// -- Critical chunks --
inline constexpr ChunkType IHDR("IHDR"); ///< Image header
inline constexpr ChunkType PLTE("PLTE"); ///< Palette
inline constexpr ChunkType IDAT("IDAT"); ///< Image data
inline constexpr ChunkType IEND("IEND"); ///< Image trailer

// -- Ancillary chunks --
inline constexpr ChunkType tRNS("tRNS"); ///< Transparency
inline constexpr ChunkType bKGD("bKGD"); ///< Background colour
inline constexpr ChunkType tIME("tIME"); ///< Last-modification time
inline constexpr ChunkType pHYs("pHYs"); ///< Physical pixel dimensions
inline constexpr ChunkType cHRM("cHRM"); ///< Primary chromaticities
inline constexpr ChunkType gAMA("gAMA"); ///< Image gamma
inline constexpr ChunkType sRGB("sRGB"); ///< Standard RGB colour space
inline constexpr ChunkType iCCP("iCCP"); ///< Embedded ICC profile
inline constexpr ChunkType cICP("cICP"); ///< Coding-independent code points
inline constexpr ChunkType mDCV("mDCV"); ///< Mastering display colour volume
inline constexpr ChunkType cLLI("cLLI"); ///< Content light level
inline constexpr ChunkType eXIf("eXIf"); ///< EXIF metadata
inline constexpr ChunkType tEXt("tEXt"); ///< Latin-1 text
inline constexpr ChunkType zTXt("zTXt"); ///< Compressed Latin-1 text
inline constexpr ChunkType iTXt("iTXt"); ///< UTF-8 text
inline constexpr ChunkType sBIT("sBIT"); ///< Significant bits

// -- Animation chunks --
inline constexpr ChunkType acTL("acTL"); ///< Animation control
inline constexpr ChunkType fcTL("fcTL"); ///< Frame control
inline constexpr ChunkType fdAT("fdAT"); ///< Frame data

namespace detail {
inline constexpr uint8_t PROPERTY_BIT = 32;
} // namespace detail

/// Critical chunks must be understood by every decoder.
constexpr bool isCritical(const ChunkType &type) {
  return (type.bytes[0] & detail::PROPERTY_BIT) == 0;
}

/// Private chunks are not registered with the PNG specification.
constexpr bool isPrivate(const ChunkType &type) {
  return (type.bytes[1] & detail::PROPERTY_BIT) != 0;
}

/// A set reserved bit makes the chunk name invalid.
constexpr bool reservedSet(const ChunkType &type) {
  return (type.bytes[2] & detail::PROPERTY_BIT) != 0;
}

/// Unknown safe-to-copy chunks may be copied by editors that alter the image.
constexpr bool safeToCopy(const ChunkType &type) {
  return (type.bytes[3] & detail::PROPERTY_BIT) != 0;
}

struct ChunkTypeHash {
  size_t operator()(const ChunkType &type) const noexcept;
};

/**
 * @brief Table of the chunk types recognised by name.
 * @return Map from chunk type to a short description; built once.
 */
const std::unordered_map<ChunkType, std::string_view, ChunkTypeHash> &
knownChunkTypes();

bool isKnown(const ChunkType &type);

/**
 * @brief Description of a recognised chunk type.
 * @return The description, or std::nullopt for unrecognised codes.
 */
std::optional<std::string_view> describe(const ChunkType &type);

} // namespace pngstego::png

template <> struct std::hash<pngstego::png::ChunkType> {
  size_t operator()(const pngstego::png::ChunkType &type) const noexcept {
    return pngstego::png::ChunkTypeHash{}(type);
  }
};

#endif // PNGSTEGO_CHUNKTYPE_HPP
