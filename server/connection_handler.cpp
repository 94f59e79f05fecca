#include "server/connection_handler.h"

#include "common/error.h"
#include "net/frame_codec.h"
#include "net/wire_protocol.h"
#include "server/logging/logger.h"

namespace threadrunner {

void ConnectionHandler::Handle(int fd) {
  try {
    Serve(fd);
  } catch (const Error &e) {
    log::Error("connection", e.what(),
               std::string("kind=") + ErrorKindName(e.kind()));
    SendError(fd, e.kind(), e.what());
  } catch (const std::exception &e) {
    log::Error("connection", e.what(), "kind=Unknown");
    SendError(fd, ErrorKind::kUnknown, e.what());
  }
}

void ConnectionHandler::Serve(int fd) {
  auto request = DecodeRequest(ReadFrame(fd));
  CheckProtocolVersion(request);
  log::Debug("connection", "request received",
             "prompt_bytes=" + std::to_string(request.prompt.size()));

  auto lease = slot_.Acquire();
  slot_.Prompt(lease, request.prompt);
  std::size_t sent = 0;
  while (true) {
    auto token = slot_.NextToken(lease);
    if (!token) {
      break;
    }
    WriteFrame(fd, EncodeResponse(TokenResponse{std::move(token), false}));
    ++sent;
  }
  WriteFrame(fd, EncodeResponse(TokenResponse{std::nullopt, true}));
  log::Debug("connection", "stream complete", "tokens=" + std::to_string(sent));
}

void ConnectionHandler::SendError(int fd, ErrorKind kind,
                                  const std::string &message) {
  try {
    WriteFrame(fd, EncodeResponse(ErrorResponse{message, kind}));
  } catch (const std::exception &e) {
    log::Warn("connection",
              std::string("failed to send error frame: ") + e.what());
  }
}

} // namespace threadrunner
