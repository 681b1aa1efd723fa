#include "Header.hpp"
#include "stego/StegoError.hpp"
#include "utils/Logger.hpp"

#include <fmt/format.h>

namespace pngstego::png {

namespace {
uint32_t read_be32(std::span<const uint8_t> data, size_t offset) {
  return (static_cast<uint32_t>(data[offset]) << 24) |
         (static_cast<uint32_t>(data[offset + 1]) << 16) |
         (static_cast<uint32_t>(data[offset + 2]) << 8) |
         static_cast<uint32_t>(data[offset + 3]);
}

void write_be32(uint8_t *out, uint32_t value) {
  out[0] = static_cast<uint8_t>(value >> 24);
  out[1] = static_cast<uint8_t>(value >> 16);
  out[2] = static_cast<uint8_t>(value >> 8);
  out[3] = static_cast<uint8_t>(value);
}
} // namespace

HeaderFields parseHeader(std::span<const uint8_t> data) {
  if (data.size() < HEADER_DATA_SIZE) {
    auto message = fmt::format("IHDR data too short: need {} bytes, got {}",
                               HEADER_DATA_SIZE, data.size());
    Logger::getInstance()->error(message);
    throw StegoException(ErrorKind::MalformedHeader, message);
  }

  HeaderFields fields;
  fields.width = read_be32(data, 0);
  fields.height = read_be32(data, 4);
  fields.bit_depth = data[8];
  fields.color_type = data[9];
  fields.compression_method = data[10];
  fields.filter_method = data[11];
  fields.interlace_method = data[12];

  Logger::getInstance()->debug(
      "IHDR: {}x{}, bit depth {}, colour type {}, interlace {}", fields.width,
      fields.height, fields.bit_depth, fields.color_type,
      fields.interlace_method);
  return fields;
}

std::array<uint8_t, HEADER_DATA_SIZE>
serializeHeader(const HeaderFields &fields) {
  std::array<uint8_t, HEADER_DATA_SIZE> data{};
  write_be32(data.data(), fields.width);
  write_be32(data.data() + 4, fields.height);
  data[8] = fields.bit_depth;
  data[9] = fields.color_type;
  data[10] = fields.compression_method;
  data[11] = fields.filter_method;
  data[12] = fields.interlace_method;
  return data;
}

std::optional<int> channelsForColorType(uint8_t color_type) {
  switch (color_type) {
  case COLOR_GRAY:
  case COLOR_PALETTE:
    return 1;
  case COLOR_GRAY_ALPHA:
    return 2;
  case COLOR_RGB:
    return 3;
  case COLOR_RGBA:
    return 4;
  default:
    return std::nullopt;
  }
}

std::optional<int> alphaChannelIndex(uint8_t color_type) {
  switch (color_type) {
  case COLOR_GRAY_ALPHA:
    return 1;
  case COLOR_RGBA:
    return 3;
  default:
    return std::nullopt;
  }
}

} // namespace pngstego::png
