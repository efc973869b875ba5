#include "hdt/common.hpp"

#include <sstream>

#ifndef HDT_VERSION_MAJOR
#define HDT_VERSION_MAJOR 0
#define HDT_VERSION_MINOR 1
#define HDT_VERSION_PATCH 0
#endif

namespace hdt {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kFileWriteError:
      return "File write error";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kInvalidFormat:
      return "Invalid format";
    case ErrorCode::kProcessingError:
      return "Processing error";
    case ErrorCode::kInternalError:
      return "Internal error";
    case ErrorCode::kConfigError:
      return "Configuration error";
  }
  return "Unknown error";
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
#ifdef HDT_VERSION_BUILD
  return Version{HDT_VERSION_MAJOR, HDT_VERSION_MINOR, HDT_VERSION_PATCH, HDT_VERSION_BUILD};
#else
  return Version{HDT_VERSION_MAJOR, HDT_VERSION_MINOR, HDT_VERSION_PATCH, ""};
#endif
}

}  // namespace hdt
