#include "scapi/common.hpp"

#include <sstream>

namespace scapi {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kInvalidOperation:
      return "Invalid operation";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kFileReadError:
      return "File read error";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kValidationError:
      return "Validation error";
    case ErrorCode::kNetworkError:
      return "Network error";
    case ErrorCode::kHttpError:
      return "HTTP error";
    case ErrorCode::kEncryptionError:
      return "Encryption error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kSystemError:
      return "System error";
    case ErrorCode::kUnknownError:
      return "Unknown error";
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
#ifdef SCAPI_VERSION_BUILD
  return Version{SCAPI_VERSION_MAJOR, SCAPI_VERSION_MINOR, SCAPI_VERSION_PATCH, SCAPI_VERSION_BUILD};
#else
  return Version{0, 1, 0, ""};
#endif
}

}  // namespace scapi
