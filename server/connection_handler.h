#pragma once

#include "common/error.h"
#include "scheduler/model_slot.h"

#include <string>

namespace threadrunner {

// Serves exactly one request on an accepted connection: read the prompt
// frame, stream token frames until eos, or answer with one error frame.
class ConnectionHandler {
public:
  explicit ConnectionHandler(ModelSlot &slot) : slot_(slot) {}

  // Never throws. Failures are logged and reported to the peer when the
  // socket still accepts writes. The caller owns and closes `fd`.
  void Handle(int fd);

private:
  void Serve(int fd);
  void SendError(int fd, ErrorKind kind, const std::string &message);

  ModelSlot &slot_;
};

} // namespace threadrunner
