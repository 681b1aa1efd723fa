#pragma once

#include "png/ChunkStream.hpp"
#include "stego/Channels.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <spdlog/common.h>
#include <string>

namespace pngstego {

using json = nlohmann::json;

/**
 * @brief Runtime settings for the encoding layer and its logging.
 *
 * JSON form (every key optional):
 * @code
 * { "method": "one-bit", "checksum_scope": "type+data",
 *   "strict_chunk_types": false, "log_level": "info",
 *   "log_file": "logs/pngstego.log" }
 * @endcode
 */
struct StegoConfig {
  stego::EncodingMethod method = stego::EncodingMethod::OneBitPerChannel;
  png::ChecksumScope checksumScope = png::ChecksumScope::TypeAndData;
  bool strictChunkTypes = false;
  spdlog::level::level_enum logLevel = spdlog::level::info;
  std::string logFile = "logs/pngstego.log";

  [[nodiscard]] json to_json() const;

  /**
   * @throws StegoException (ConfigurationError) on wrong types or unknown
   * enum names.
   */
  [[nodiscard]] static StegoConfig from_json(const json &j);

  /**
   * @brief Reads a JSON configuration file.
   * @throws StegoException (ConfigurationError) if the file cannot be read or
   * parsed.
   */
  [[nodiscard]] static StegoConfig load(const std::filesystem::path &path);

  [[nodiscard]] png::ReadOptions readOptions() const {
    return {checksumScope, strictChunkTypes};
  }
};

std::string_view scopeToString(png::ChecksumScope scope) noexcept;

/**
 * @brief Points the shared logger at the configured file and level.
 */
void applyLogging(const StegoConfig &config);

} // namespace pngstego
