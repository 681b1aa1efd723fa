#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace pngstego {

// Error kinds reported by the container and pixel layers
enum class ErrorKind {
  InvalidSignature,
  TruncatedStream,
  ChecksumMismatch,
  MalformedHeader,
  PayloadTooLarge,
  InsufficientCapacity,
  UnsupportedEncodingMethod,
  InvalidChunkType,
  ConfigurationError,
  InternalError ///< Unexpected failure, e.g. allocation
};

/**
 * @brief Error value returned by the encoding support entry points.
 */
struct StegoError {
  ErrorKind kind;      ///< What went wrong
  std::string message; ///< Diagnostic text with offsets / counts
};

/**
 * @brief Exception thrown inside the core; carries an ErrorKind.
 */
class StegoException : public std::runtime_error {
public:
  StegoException(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

  StegoError toError() const { return {kind_, what()}; }

private:
  ErrorKind kind_;
};

// String representation for ErrorKind
std::string_view errorToString(ErrorKind kind) noexcept;

} // namespace pngstego
