#include "PngSupport.hpp"
#include "utils/Logger.hpp"

#include <algorithm>
#include <climits>
#include <fmt/format.h>
#include <utility>

namespace pngstego::stego {

namespace {

[[noreturn]] void fail(ErrorKind kind, const std::string &message) {
  Logger::getInstance()->error(message);
  throw StegoException(kind, message);
}

SampleLayout layout_for(const png::HeaderFields &header) {
  if (header.interlace_method != 0) {
    fail(ErrorKind::UnsupportedEncodingMethod,
         "Interlaced PNG images are not supported");
  }

  auto channels = png::channelsForColorType(header.color_type);
  if (!channels) {
    fail(ErrorKind::MalformedHeader,
         fmt::format("Unknown PNG colour type {}", header.color_type));
  }

  if (header.bit_depth != 8 && header.bit_depth != 16) {
    fail(ErrorKind::UnsupportedEncodingMethod,
         fmt::format("Bit depth {} is not supported, need 8 or 16",
                     header.bit_depth));
  }
  if (header.color_type == png::COLOR_PALETTE && header.bit_depth != 8) {
    fail(ErrorKind::MalformedHeader, "Palette images must use 8-bit indices");
  }

  SampleLayout layout;
  layout.channels = *channels;
  layout.bytesPerSample = header.bit_depth / 8;
  layout.alphaIndex = png::alphaChannelIndex(header.color_type);
  return layout;
}

class PngCarrier : public CarrierContainer {
public:
  PngCarrier(png::PngFile file, const ChannelConfig &config,
             png::ChecksumScope scope)
      : file_(std::move(file)), scope_(scope) {
    const auto &header = file_.header;
    const SampleLayout layout = layout_for(header);
    offsets_ = carrierByteOffsets(layout, config);
    if (offsets_.empty()) {
      fail(ErrorKind::UnsupportedEncodingMethod,
           "No carrier channels left for the selected method");
    }

    for (size_t i = 0; i < file_.chunks.size(); ++i) {
      const auto &chunk = file_.chunks[i];
      if (chunk.type == png::IDAT) {
        idat_indices_.push_back(i);
        image_data_.insert(image_data_.end(), chunk.data.begin(),
                           chunk.data.end());
      }
    }

    auto logger = Logger::getInstance();
    if (idat_indices_.empty()) {
      logger->warn("PNG has no IDAT chunk; carrier is empty");
    }

    const int pixel_bytes = layout.channels * layout.bytesPerSample;
    if (header.width > static_cast<uint32_t>(INT_MAX / pixel_bytes)) {
      fail(ErrorKind::MalformedHeader,
           fmt::format("Image width {} is too large", header.width));
    }

    const size_t stride = 1 + static_cast<size_t>(header.width) *
                                  static_cast<size_t>(pixel_bytes);
    const size_t rows =
        std::min<size_t>(header.height, image_data_.size() / stride);
    if (rows < header.height) {
      logger->warn("Image data holds {} of {} scan-lines of {} bytes", rows,
                   header.height, stride);
    }

    if (rows > 0 && header.width > 0) {
      pixels_ = cv::Mat(static_cast<int>(rows), static_cast<int>(header.width),
                        CV_8UC(pixel_bytes), image_data_.data() + 1, stride);
      carrier_ = gatherChannels(pixels_, offsets_);
    }

    logger->debug("PNG carrier: {} rows, {} carrier bytes per pixel", rows,
                  offsets_.size());
  }

  PngCarrier(const PngCarrier &) = delete;
  PngCarrier &operator=(const PngCarrier &) = delete;

  cv::Mat &carrier() override { return carrier_; }

  std::vector<uint8_t> reassemble() override {
    if (!carrier_.empty()) {
      scatterChannels(carrier_, pixels_, offsets_);
    }

    size_t pos = 0;
    for (size_t index : idat_indices_) {
      auto &data = file_.chunks[index].data;
      std::copy_n(image_data_.begin() + static_cast<std::ptrdiff_t>(pos),
                  data.size(), data.begin());
      pos += data.size();
    }
    return png::writePng(file_, scope_);
  }

private:
  png::PngFile file_;
  png::ChecksumScope scope_;
  std::vector<size_t> idat_indices_;
  std::vector<uint8_t> image_data_; ///< Concatenated IDAT data
  std::vector<int> offsets_;
  cv::Mat pixels_;  ///< Header over image_data_, filter bytes excluded
  cv::Mat carrier_; ///< Gathered carrier bytes
};

} // namespace

bool PngEncodingSupport::supports(EncodingMethod method) const noexcept {
  switch (method) {
  case EncodingMethod::OneBitPerChannel:
  case EncodingMethod::TwoBitsPerChannel:
  case EncodingMethod::OneBitColorOnly:
    return true;
  }
  return false;
}

std::unique_ptr<CarrierContainer>
PngEncodingSupport::parseContainer(std::span<const uint8_t> file,
                                   const ChannelConfig &config) const {
  return std::make_unique<PngCarrier>(png::readPng(file, options_), config,
                                      options_.checksumScope);
}

} // namespace pngstego::stego
