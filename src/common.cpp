#include "hrec/common.hpp"

#include <sstream>

#ifndef HREC_VERSION_MAJOR
#define HREC_VERSION_MAJOR 0
#define HREC_VERSION_MINOR 1
#define HREC_VERSION_PATCH 0
#endif

namespace hrec {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kFileReadError:
      return "File read error";
    case ErrorCode::kFileWriteError:
      return "File write error";
    case ErrorCode::kFilePermissionDenied:
      return "File permission denied";
    case ErrorCode::kDirectoryNotFound:
      return "Directory not found";
    case ErrorCode::kDirectoryCreateError:
      return "Directory create error";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kValidationError:
      return "Validation error";
    case ErrorCode::kDatabaseError:
      return "Database error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kSecurityError:
      return "Security error";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kAlreadyExists:
      return "Already exists";
    case ErrorCode::kConstraintViolation:
      return "Constraint violation";
    case ErrorCode::kNameTooLong:
      return "Name too long";
    case ErrorCode::kSourceNotFound:
      return "Source not found";
    case ErrorCode::kStoreIoError:
      return "Store I/O error";
    case ErrorCode::kInvalidState:
      return "Invalid state";
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
#ifdef HREC_VERSION_BUILD
  return Version{HREC_VERSION_MAJOR, HREC_VERSION_MINOR, HREC_VERSION_PATCH, HREC_VERSION_BUILD};
#else
  return Version{HREC_VERSION_MAJOR, HREC_VERSION_MINOR, HREC_VERSION_PATCH, ""};
#endif
}

}  // namespace hrec
