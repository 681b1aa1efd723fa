#include "ChunkType.hpp"

#include <fmt/format.h>

namespace pngstego::png {

std::string ChunkType::toString() const {
  std::string text;
  for (uint8_t b : bytes) {
    if (b >= 0x20 && b < 0x7F) {
      text += static_cast<char>(b);
    } else {
      text += fmt::format("\\x{:02X}", b);
    }
  }
  return text;
}

size_t ChunkTypeHash::operator()(const ChunkType &type) const noexcept {
  const uint32_t packed = (static_cast<uint32_t>(type.bytes[0]) << 24) |
                          (static_cast<uint32_t>(type.bytes[1]) << 16) |
                          (static_cast<uint32_t>(type.bytes[2]) << 8) |
                          static_cast<uint32_t>(type.bytes[3]);
  return std::hash<uint32_t>{}(packed);
}

const std::unordered_map<ChunkType, std::string_view, ChunkTypeHash> &
knownChunkTypes() {
  static const std::unordered_map<ChunkType, std::string_view, ChunkTypeHash>
      table{
          {IHDR, "Image header"},
          {PLTE, "Palette"},
          {IDAT, "Image data"},
          {IEND, "Image trailer"},
          {tRNS, "Transparency"},
          {bKGD, "Background colour"},
          {tIME, "Image last-modification time"},
          {pHYs, "Physical pixel dimensions"},
          {cHRM, "Primary chromaticities and white point"},
          {gAMA, "Image gamma"},
          {sRGB, "Standard RGB colour space"},
          {iCCP, "Embedded ICC profile"},
          {cICP, "Coding-independent code points"},
          {mDCV, "Mastering display colour volume"},
          {cLLI, "Content light level information"},
          {eXIf, "Exchangeable image file profile"},
          {tEXt, "Textual data"},
          {zTXt, "Compressed textual data"},
          {iTXt, "International textual data"},
          {sBIT, "Significant bits"},
          {acTL, "Animation control"},
          {fcTL, "Frame control"},
          {fdAT, "Frame data"},
      };
  return table;
}

bool isKnown(const ChunkType &type) {
  return knownChunkTypes().contains(type);
}

std::optional<std::string_view> describe(const ChunkType &type) {
  const auto &table = knownChunkTypes();
  if (auto it = table.find(type); it != table.end()) {
    return it->second;
  }
  return std::nullopt;
}

} // namespace pngstego::png
