#include "common/error.h"

#include <cstring>

namespace threadrunner {

const char *ErrorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kModelLoad:
    return "ModelLoad";
  case ErrorKind::kProtocol:
    return "Protocol";
  case ErrorKind::kIo:
    return "Io";
  case ErrorKind::kTimeout:
    return "Timeout";
  case ErrorKind::kUnknown:
    return "Unknown";
  }
  return "Unknown";
}

std::optional<ErrorKind> ParseErrorKind(const std::string &name) {
  for (auto kind : {ErrorKind::kModelLoad, ErrorKind::kProtocol,
                    ErrorKind::kIo, ErrorKind::kTimeout, ErrorKind::kUnknown}) {
    if (name == ErrorKindName(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

int ExitCodeFor(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kIo:
    return 2;
  case ErrorKind::kModelLoad:
    return 3;
  case ErrorKind::kTimeout:
    return 4;
  case ErrorKind::kProtocol:
  case ErrorKind::kUnknown:
    return 1;
  }
  return 1;
}

Error IoError(const std::string &what, int err) {
  return Error(ErrorKind::kIo, what + ": " + std::strerror(err));
}

} // namespace threadrunner
