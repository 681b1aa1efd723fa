#include "EncodingSupport.hpp"
#include "LSB.hpp"
#include "utils/Logger.hpp"

#include <fmt/format.h>

namespace pngstego::stego {

namespace {
// Resolves the derivation and parses the container for it
std::unique_ptr<CarrierContainer> open_container(
    const FileEncodingSupport &support, std::span<const uint8_t> file,
    EncodingMethod method, ChannelConfig &config) {
  config = deriveChannelConfig(method);
  if (!support.supports(method)) {
    throw StegoException(ErrorKind::UnsupportedEncodingMethod,
                         fmt::format("Method {} is not implemented for {}",
                                     methodToString(method),
                                     support.formatName()));
  }
  return support.parseContainer(file, config);
}

StegoError from_cv(const cv::Exception &e) {
  auto message = fmt::format("Carrier layout not supported: {}", e.what());
  Logger::getInstance()->error(message);
  return {ErrorKind::UnsupportedEncodingMethod, message};
}

StegoError from_std(const std::exception &e) {
  auto message = fmt::format("Internal error: {}", e.what());
  Logger::getInstance()->error(message);
  return {ErrorKind::InternalError, message};
}
} // namespace

auto embedPayload(const FileEncodingSupport &support,
                  std::span<const uint8_t> file,
                  std::span<const uint8_t> payload,
                  EncodingMethod method) noexcept
    -> std::expected<std::vector<uint8_t>, StegoError> {
  try {
    ChannelConfig config;
    auto container = open_container(support, file, method, config);

    BitStreamBuffer bit_buffer(payload);
    embedLSB(container->carrier(), bit_buffer.getBits(), config.bitsPerChannel);

    auto output = container->reassemble();
    Logger::getInstance()->info("Embedded {} payload bytes into {} using {}",
                                payload.size(), support.formatName(),
                                methodToString(method));
    return output;
  } catch (const StegoException &e) {
    return std::unexpected(e.toError());
  } catch (const cv::Exception &e) {
    return std::unexpected(from_cv(e));
  } catch (const std::exception &e) {
    return std::unexpected(from_std(e));
  }
}

auto extractPayload(const FileEncodingSupport &support,
                    std::span<const uint8_t> file, size_t expectedBitCount,
                    EncodingMethod method) noexcept
    -> std::expected<std::vector<uint8_t>, StegoError> {
  try {
    ChannelConfig config;
    auto container = open_container(support, file, method, config);

    auto bits = extractLSB(container->carrier(), expectedBitCount,
                           config.bitsPerChannel);
    Logger::getInstance()->info("Extracted {} bits from {} using {}",
                                bits.size(), support.formatName(),
                                methodToString(method));
    return packBits(bits);
  } catch (const StegoException &e) {
    return std::unexpected(e.toError());
  } catch (const cv::Exception &e) {
    return std::unexpected(from_cv(e));
  } catch (const std::exception &e) {
    return std::unexpected(from_std(e));
  }
}

auto payloadCapacity(const FileEncodingSupport &support,
                     std::span<const uint8_t> file,
                     EncodingMethod method) noexcept
    -> std::expected<size_t, StegoError> {
  try {
    ChannelConfig config;
    auto container = open_container(support, file, method, config);
    return carrierCapacity(container->carrier(), config.bitsPerChannel);
  } catch (const StegoException &e) {
    return std::unexpected(e.toError());
  } catch (const cv::Exception &e) {
    return std::unexpected(from_cv(e));
  } catch (const std::exception &e) {
    return std::unexpected(from_std(e));
  }
}

} // namespace pngstego::stego
