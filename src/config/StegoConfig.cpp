#include "StegoConfig.hpp"
#include "stego/StegoError.hpp"
#include "utils/Logger.hpp"

#include <fmt/format.h>
#include <fstream>

namespace pngstego {

namespace {
[[noreturn]] void config_error(const std::string &message) {
  throw StegoException(ErrorKind::ConfigurationError, message);
}

png::ChecksumScope scope_from_string(const std::string &name) {
  if (name == scopeToString(png::ChecksumScope::TypeAndData)) {
    return png::ChecksumScope::TypeAndData;
  }
  if (name == scopeToString(png::ChecksumScope::TypeOnly)) {
    return png::ChecksumScope::TypeOnly;
  }
  config_error(fmt::format("Unknown checksum scope '{}'", name));
}

spdlog::level::level_enum level_from_string(const std::string &name) {
  auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    config_error(fmt::format("Unknown log level '{}'", name));
  }
  return level;
}
} // namespace

std::string_view scopeToString(png::ChecksumScope scope) noexcept {
  switch (scope) {
  case png::ChecksumScope::TypeAndData:
    return "type+data";
  case png::ChecksumScope::TypeOnly:
    return "type-only";
  }
  return "unknown";
}

json StegoConfig::to_json() const {
  json j;
  j["method"] = std::string(stego::methodToString(method));
  j["checksum_scope"] = std::string(scopeToString(checksumScope));
  j["strict_chunk_types"] = strictChunkTypes;
  auto level = spdlog::level::to_string_view(logLevel);
  j["log_level"] = std::string(level.data(), level.size());
  j["log_file"] = logFile;
  return j;
}

StegoConfig StegoConfig::from_json(const json &j) {
  StegoConfig config;
  if (!j.is_object()) {
    config_error("Configuration must be a JSON object");
  }
  try {
    if (j.contains("method")) {
      auto name = j.at("method").get<std::string>();
      auto method = stego::methodFromString(name);
      if (!method) {
        config_error(fmt::format("Unknown encoding method '{}'", name));
      }
      config.method = *method;
    }
    if (j.contains("checksum_scope")) {
      config.checksumScope =
          scope_from_string(j.at("checksum_scope").get<std::string>());
    }
    if (j.contains("strict_chunk_types")) {
      config.strictChunkTypes = j.at("strict_chunk_types").get<bool>();
    }
    if (j.contains("log_level")) {
      config.logLevel = level_from_string(j.at("log_level").get<std::string>());
    }
    if (j.contains("log_file")) {
      config.logFile = j.at("log_file").get<std::string>();
    }
  } catch (const json::exception &e) {
    config_error(std::string("JSON parsing error: ") + e.what());
  }
  return config;
}

StegoConfig StegoConfig::load(const std::filesystem::path &path) {
  std::ifstream input(path);
  if (!input) {
    config_error(
        fmt::format("Cannot open configuration file {}", path.string()));
  }
  json j;
  try {
    input >> j;
  } catch (const json::exception &e) {
    config_error(
        fmt::format("Invalid JSON in {}: {}", path.string(), e.what()));
  }
  return from_json(j);
}

void applyLogging(const StegoConfig &config) {
  Logger::setLogFile(config.logFile);
  Logger::setLevel(config.logLevel);
}

} // namespace pngstego
