#pragma once

#include <cstdint>
#include <opencv2/core.hpp>
#include <span>
#include <vector>

namespace pngstego::stego {

/**
 * @brief Class for buffering payload bytes as a bit stream.
 *
 * Bits are emitted most significant bit first within each byte.
 */
class BitStreamBuffer {
public:
  /**
   * @brief Constructs a BitStreamBuffer from payload bytes.
   * @param payload The bytes to expand.
   */
  explicit BitStreamBuffer(std::span<const uint8_t> payload);

  /**
   * @brief Gets the buffered bits.
   * @return A reference to the vector of bits.
   */
  const std::vector<bool> &getBits() const;

  /**
   * @brief Gets the size of the buffered bits.
   * @return The size of the buffered bits.
   */
  size_t size() const;

private:
  std::vector<bool> bits; ///< The buffered bits
};

/**
 * @brief Packs bits into bytes, most significant bit first.
 *
 * A trailing partial byte is padded with zero bits.
 */
std::vector<uint8_t> packBits(const std::vector<bool> &bits);

/**
 * @brief Number of payload bits a carrier can hold.
 * @param carrier 8-bit carrier, one element per pixel.
 * @param bitsPerChannel Low-order bits used in every carrier byte.
 */
size_t carrierCapacity(const cv::Mat &carrier, int bitsPerChannel = 1);

/**
 * @brief Embeds bits into the low-order bits of a carrier.
 *
 * Bytes are visited row by row, all channels of a pixel before the next
 * pixel; within a byte bit 0 is written first. Higher bits are preserved.
 *
 * @param carrier The carrier, modified in place (depth must be CV_8U).
 * @param bits The bits to embed.
 * @param bitsPerChannel Low-order bits used per carrier byte (1-8).
 * @throws StegoException (PayloadTooLarge) if bits exceed the capacity.
 */
void embedLSB(cv::Mat &carrier, const std::vector<bool> &bits,
              int bitsPerChannel = 1);

/**
 * @brief Reads bits back in the order embedLSB writes them.
 * @param carrier The carrier (depth must be CV_8U).
 * @param bitCount Number of bits to read.
 * @param bitsPerChannel Low-order bits used per carrier byte (1-8).
 * @return Exactly bitCount bits.
 * @throws StegoException (InsufficientCapacity) if bitCount exceeds the
 * capacity.
 */
std::vector<bool> extractLSB(const cv::Mat &carrier, size_t bitCount,
                             int bitsPerChannel = 1);

} // namespace pngstego::stego
