#pragma once

#include "EncodingSupport.hpp"
#include "png/ChunkStream.hpp"

namespace pngstego::stego {

/**
 * @brief PNG implementation of FileEncodingSupport.
 *
 * The carrier is taken from the raw bytes stored in the IDAT chunks, read as
 * scan-lines of one filter-type byte followed by the pixel samples. Filter
 * bytes are never modified and the IDAT chunk lengths are preserved.
 * Interlaced images and bit depths below 8 are not supported.
 */
class PngEncodingSupport : public FileEncodingSupport {
public:
  explicit PngEncodingSupport(png::ReadOptions options = {})
      : options_(options) {}

  std::string_view formatName() const noexcept override { return "PNG"; }

  bool supports(EncodingMethod method) const noexcept override;

  std::unique_ptr<CarrierContainer>
  parseContainer(std::span<const uint8_t> file,
                 const ChannelConfig &config) const override;

private:
  png::ReadOptions options_;
};

} // namespace pngstego::stego
