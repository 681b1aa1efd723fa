#ifndef PNGSTEGO_ENCODINGSUPPORT_HPP
#define PNGSTEGO_ENCODINGSUPPORT_HPP

#include "Channels.hpp"
#include "StegoError.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <opencv2/core.hpp>
#include <span>
#include <string_view>
#include <vector>

namespace pngstego::stego {

/**
 * @brief A parsed container whose pixel channels are exposed as a carrier.
 */
class CarrierContainer {
public:
  virtual ~CarrierContainer() = default;

  /**
   * @brief Carrier bytes in traversal order, CV_8UC(n) with one element per
   * pixel. Modifications are picked up by reassemble().
   */
  virtual cv::Mat &carrier() = 0;

  /**
   * @brief Serializes the container with the carrier written back.
   */
  virtual std::vector<uint8_t> reassemble() = 0;
};

/**
 * @brief Per-format capability set used by the encoding entry points.
 */
class FileEncodingSupport {
public:
  virtual ~FileEncodingSupport() = default;

  virtual std::string_view formatName() const noexcept = 0;

  /**
   * @brief Whether the format implements a derivation.
   */
  virtual bool supports(EncodingMethod method) const noexcept = 0;

  /**
   * @brief Parses a file and exposes the channels selected by config.
   * @throws StegoException on structural errors.
   */
  virtual std::unique_ptr<CarrierContainer>
  parseContainer(std::span<const uint8_t> file,
                 const ChannelConfig &config) const = 0;
};

/**
 * @brief Hides payload bytes in a file.
 * @param support Container format handler.
 * @param file Original file bytes.
 * @param payload Bytes to embed, most significant bit first.
 * @param method Embedding derivation.
 * @return The modified file bytes or an error.
 */
auto embedPayload(const FileEncodingSupport &support,
                  std::span<const uint8_t> file,
                  std::span<const uint8_t> payload,
                  EncodingMethod method) noexcept
    -> std::expected<std::vector<uint8_t>, StegoError>;

/**
 * @brief Recovers bits hidden by embedPayload.
 * @param expectedBitCount Number of bits to read.
 * @return The bits packed into bytes; a trailing partial byte is zero padded.
 */
auto extractPayload(const FileEncodingSupport &support,
                    std::span<const uint8_t> file, size_t expectedBitCount,
                    EncodingMethod method) noexcept
    -> std::expected<std::vector<uint8_t>, StegoError>;

/**
 * @brief Number of payload bits a file can hold with the given method.
 */
auto payloadCapacity(const FileEncodingSupport &support,
                     std::span<const uint8_t> file,
                     EncodingMethod method) noexcept
    -> std::expected<size_t, StegoError>;

} // namespace pngstego::stego

#endif // PNGSTEGO_ENCODINGSUPPORT_HPP
