#include "LSB.hpp"
#include "StegoError.hpp"
#include "utils/Logger.hpp"

#include <fmt/format.h>

namespace pngstego::stego {

namespace {
void check_carrier(const cv::Mat &carrier, int bitsPerChannel) {
  CV_Assert(carrier.empty() || carrier.depth() == CV_8U);
  CV_Assert(carrier.dims <= 2);
  CV_Assert(bitsPerChannel >= 1 && bitsPerChannel <= 8);
}
} // namespace

BitStreamBuffer::BitStreamBuffer(std::span<const uint8_t> payload) {
  bits.reserve(payload.size() * 8);
  for (uint8_t byte : payload) {
    for (int i = 7; i >= 0; --i) {
      bits.push_back(((byte >> i) & 1) != 0);
    }
  }
}

const std::vector<bool> &BitStreamBuffer::getBits() const { return bits; }
size_t BitStreamBuffer::size() const { return bits.size(); }

std::vector<uint8_t> packBits(const std::vector<bool> &bits) {
  std::vector<uint8_t> bytes((bits.size() + 7) / 8, 0);
  for (size_t i = 0; i < bits.size(); ++i) {
    if (bits[i]) {
      bytes[i / 8] |= static_cast<uint8_t>(0x80 >> (i % 8));
    }
  }
  return bytes;
}

size_t carrierCapacity(const cv::Mat &carrier, int bitsPerChannel) {
  if (carrier.empty()) {
    return 0;
  }
  return carrier.total() * static_cast<size_t>(carrier.channels()) *
         static_cast<size_t>(bitsPerChannel);
}

void embedLSB(cv::Mat &carrier, const std::vector<bool> &bits,
              int bitsPerChannel) {
  check_carrier(carrier, bitsPerChannel);

  const size_t capacity = carrierCapacity(carrier, bitsPerChannel);
  if (bits.size() > capacity) {
    auto message = fmt::format(
        "Payload too large: {} bits required, carrier holds {} bits",
        bits.size(), capacity);
    Logger::getInstance()->error(message);
    throw StegoException(ErrorKind::PayloadTooLarge, message);
  }

  const size_t row_bytes =
      static_cast<size_t>(carrier.cols) * carrier.channels();
  size_t bit_idx = 0;
  for (int r = 0; r < carrier.rows && bit_idx < bits.size(); ++r) {
    uchar *row = carrier.ptr<uchar>(r);
    for (size_t i = 0; i < row_bytes && bit_idx < bits.size(); ++i) {
      for (int b = 0; b < bitsPerChannel && bit_idx < bits.size();
           ++b, ++bit_idx) {
        const auto mask = static_cast<uchar>(1u << b);
        row[i] = bits[bit_idx] ? static_cast<uchar>(row[i] | mask)
                               : static_cast<uchar>(row[i] & ~mask);
      }
    }
  }

  Logger::getInstance()->debug("Embedded {} bits ({} per channel), capacity {}",
                               bits.size(), bitsPerChannel, capacity);
}

std::vector<bool> extractLSB(const cv::Mat &carrier, size_t bitCount,
                             int bitsPerChannel) {
  check_carrier(carrier, bitsPerChannel);

  const size_t capacity = carrierCapacity(carrier, bitsPerChannel);
  if (bitCount > capacity) {
    auto message = fmt::format(
        "Insufficient capacity: {} bits requested, carrier holds {} bits",
        bitCount, capacity);
    Logger::getInstance()->error(message);
    throw StegoException(ErrorKind::InsufficientCapacity, message);
  }

  std::vector<bool> bits;
  bits.reserve(bitCount);

  const size_t row_bytes =
      static_cast<size_t>(carrier.cols) * carrier.channels();
  for (int r = 0; r < carrier.rows && bits.size() < bitCount; ++r) {
    const uchar *row = carrier.ptr<uchar>(r);
    for (size_t i = 0; i < row_bytes && bits.size() < bitCount; ++i) {
      for (int b = 0; b < bitsPerChannel && bits.size() < bitCount; ++b) {
        bits.push_back(((row[i] >> b) & 1) != 0);
      }
    }
  }
  return bits;
}

} // namespace pngstego::stego
