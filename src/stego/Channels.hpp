#pragma once

#include <opencv2/core.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace pngstego::stego {

/**
 * @brief Embedding derivations selectable by callers.
 */
enum class EncodingMethod {
  OneBitPerChannel,  ///< Bit 0 of every channel
  TwoBitsPerChannel, ///< Bits 0 and 1 of every channel
  OneBitColorOnly    ///< Bit 0 of every non-alpha channel
};

/**
 * @brief Configuration structure for channel steganography.
 */
struct ChannelConfig {
  int bitsPerChannel = 1; ///< Number of bits to use per channel
  bool useAlpha = true;   ///< Use the alpha channel

  bool operator==(const ChannelConfig &) const = default;
};

/**
 * @brief Maps a method to its channel configuration.
 * @throws StegoException (UnsupportedEncodingMethod) for values outside the
 * enumeration.
 */
ChannelConfig deriveChannelConfig(EncodingMethod method);

std::string_view methodToString(EncodingMethod method) noexcept;

/**
 * @brief Parses "one-bit", "two-bits" or "color-only".
 */
std::optional<EncodingMethod> methodFromString(std::string_view name) noexcept;

/**
 * @brief Byte layout of one pixel in the raw image data.
 */
struct SampleLayout {
  int channels = 0;                ///< Samples per pixel
  int bytesPerSample = 1;          ///< 1 for 8-bit, 2 for 16-bit samples
  std::optional<int> alphaIndex;   ///< Alpha sample index, if any
};

/**
 * @brief Offsets, within one pixel, of the bytes used as carrier.
 *
 * For multi-byte samples the low-order (last, big-endian) byte is used.
 * Alpha is skipped unless config.useAlpha is set.
 */
std::vector<int> carrierByteOffsets(const SampleLayout &layout,
                                    const ChannelConfig &config);

/**
 * @brief Copies the selected bytes of every pixel into a compact carrier.
 * @param pixels Pixel view, CV_8UC(channels * bytesPerSample).
 * @param offsets Byte offsets from carrierByteOffsets.
 * @return CV_8UC(offsets.size()) matrix of the same size.
 */
cv::Mat gatherChannels(const cv::Mat &pixels, const std::vector<int> &offsets);

/**
 * @brief Writes a compact carrier back into the pixel view.
 */
void scatterChannels(const cv::Mat &carrier, cv::Mat &pixels,
                     const std::vector<int> &offsets);

} // namespace pngstego::stego
