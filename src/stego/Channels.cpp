#include "Channels.hpp"
#include "StegoError.hpp"

#include <fmt/format.h>

namespace pngstego::stego {

ChannelConfig deriveChannelConfig(EncodingMethod method) {
  switch (method) {
  case EncodingMethod::OneBitPerChannel:
    return {1, true};
  case EncodingMethod::TwoBitsPerChannel:
    return {2, true};
  case EncodingMethod::OneBitColorOnly:
    return {1, false};
  }
  throw StegoException(
      ErrorKind::UnsupportedEncodingMethod,
      fmt::format("Unknown encoding method {}", static_cast<int>(method)));
}

std::string_view methodToString(EncodingMethod method) noexcept {
  switch (method) {
  case EncodingMethod::OneBitPerChannel:
    return "one-bit";
  case EncodingMethod::TwoBitsPerChannel:
    return "two-bits";
  case EncodingMethod::OneBitColorOnly:
    return "color-only";
  }
  return "unknown";
}

std::optional<EncodingMethod> methodFromString(std::string_view name) noexcept {
  for (auto method :
       {EncodingMethod::OneBitPerChannel, EncodingMethod::TwoBitsPerChannel,
        EncodingMethod::OneBitColorOnly}) {
    if (methodToString(method) == name) {
      return method;
    }
  }
  return std::nullopt;
}

std::vector<int> carrierByteOffsets(const SampleLayout &layout,
                                    const ChannelConfig &config) {
  std::vector<int> offsets;
  offsets.reserve(layout.channels);
  for (int c = 0; c < layout.channels; ++c) {
    if (!config.useAlpha && layout.alphaIndex == c) {
      continue;
    }
    offsets.push_back(c * layout.bytesPerSample + layout.bytesPerSample - 1);
  }
  return offsets;
}

cv::Mat gatherChannels(const cv::Mat &pixels, const std::vector<int> &offsets) {
  if (pixels.empty() || offsets.empty()) {
    return {};
  }
  CV_Assert(pixels.depth() == CV_8U);

  cv::Mat carrier(pixels.rows, pixels.cols,
                  CV_8UC(static_cast<int>(offsets.size())));
  std::vector<int> from_to;
  from_to.reserve(offsets.size() * 2);
  for (size_t i = 0; i < offsets.size(); ++i) {
    from_to.push_back(offsets[i]);
    from_to.push_back(static_cast<int>(i));
  }
  cv::mixChannels(&pixels, 1, &carrier, 1, from_to.data(), offsets.size());
  return carrier;
}

void scatterChannels(const cv::Mat &carrier, cv::Mat &pixels,
                     const std::vector<int> &offsets) {
  if (pixels.empty() || offsets.empty()) {
    return;
  }
  CV_Assert(carrier.size() == pixels.size());
  CV_Assert(carrier.channels() == static_cast<int>(offsets.size()));

  std::vector<int> from_to;
  from_to.reserve(offsets.size() * 2);
  for (size_t i = 0; i < offsets.size(); ++i) {
    from_to.push_back(static_cast<int>(i));
    from_to.push_back(offsets[i]);
  }
  cv::mixChannels(&carrier, 1, &pixels, 1, from_to.data(), offsets.size());
}

} // namespace pngstego::stego
