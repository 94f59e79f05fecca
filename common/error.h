#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace threadrunner {

// Closed set of failure classes shared by the daemon, the wire protocol and
// the client exit codes.
enum class ErrorKind { kModelLoad, kProtocol, kIo, kTimeout, kUnknown };

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

// Wire name of a kind ("ModelLoad", "Protocol", ...).
const char *ErrorKindName(ErrorKind kind);

// Inverse of ErrorKindName. Returns nullopt for names outside the set.
std::optional<ErrorKind> ParseErrorKind(const std::string &name);

// Process exit status the client uses for a failure of `kind`.
int ExitCodeFor(ErrorKind kind);

// Builds an Io error from the current errno: "<what>: <strerror>".
Error IoError(const std::string &what, int err);

} // namespace threadrunner
