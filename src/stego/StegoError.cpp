#include "StegoError.hpp"

namespace pngstego {

std::string_view errorToString(ErrorKind kind) noexcept {
  switch (kind) {
  case ErrorKind::InvalidSignature:
    return "InvalidSignature";
  case ErrorKind::TruncatedStream:
    return "TruncatedStream";
  case ErrorKind::ChecksumMismatch:
    return "ChecksumMismatch";
  case ErrorKind::MalformedHeader:
    return "MalformedHeader";
  case ErrorKind::PayloadTooLarge:
    return "PayloadTooLarge";
  case ErrorKind::InsufficientCapacity:
    return "InsufficientCapacity";
  case ErrorKind::UnsupportedEncodingMethod:
    return "UnsupportedEncodingMethod";
  case ErrorKind::InvalidChunkType:
    return "InvalidChunkType";
  case ErrorKind::ConfigurationError:
    return "ConfigurationError";
  case ErrorKind::InternalError:
    return "InternalError";
  }
  return "Unknown";
}

} // namespace pngstego
