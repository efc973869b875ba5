#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace hdt {

// Error handling - using std::expected pattern
enum class ErrorCode {
  kInvalidArgument = 1,
  kFileWriteError,
  kParseError,
  kInvalidFormat,
  kProcessingError,
  kInternalError,
  kConfigError
};

// Convert error code to string
std::string_view errorCodeToString(ErrorCode code);

// Error class for detailed error information
class Error {
 public:
  Error(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }

 private:
  ErrorCode code_;
  std::string message_;
};

// Result type alias
template <typename T>
using Result = std::expected<T, Error>;

// Convenience function for creating errors
inline Error makeError(ErrorCode code, const std::string& message) {
  return Error(code, message);
}

// Version information
struct Version {
  int major;
  int minor;
  int patch;
  std::string build;

  std::string toString() const;
};

// Get version information
Version getVersion();

}  // namespace hdt
