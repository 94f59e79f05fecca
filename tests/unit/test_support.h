#pragma once

#include "common/error.h"
#include "net/frame_codec.h"
#include "net/unix_socket.h"
#include "net/wire_protocol.h"
#include "runtime/backends/backend_factory.h"
#include "runtime/backends/backend_handle.h"
#include "scheduler/model_slot.h"
#include "server/daemon_server.h"

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace threadrunner {
namespace testing {

// Fresh directory under /tmp, removed with its contents on destruction.
// Paths stay short so sockets fit in sun_path.
class TempDir {
public:
  TempDir() {
    char pattern[] = "/tmp/trtest.XXXXXX";
    const char *made = ::mkdtemp(pattern);
    if (made == nullptr) {
      throw IoError("mkdtemp", errno);
    }
    path_ = made;
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::filesystem::path &path() const { return path_; }
  std::filesystem::path operator/(const std::string &name) const {
    return path_ / name;
  }

private:
  std::filesystem::path path_;
};

inline std::string ReadFile(const std::filesystem::path &path) {
  std::ifstream in(path);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

// In-process daemon on the dummy backend.
class DummyDaemon {
public:
  explicit DummyDaemon(int workers = 4)
      : slot_([this] {
          ++loads_;
          return BackendFactory::Load(BackendKind::kDummy, "/dev/null");
        }),
        server_(DaemonServerOptions{dir_ / "d.sock", workers, 2000}, slot_) {
    server_.Start();
  }
  ~DummyDaemon() { server_.Stop(); }

  std::filesystem::path socket() const { return server_.socket_path(); }
  ModelSlot &slot() { return slot_; }
  DaemonServer &server() { return server_; }
  int loads() const { return loads_.load(); }

private:
  TempDir dir_;
  std::atomic<int> loads_{0};
  ModelSlot slot_;
  DaemonServer server_;
};

inline UniqueFd Connect(const std::filesystem::path &socket) {
  int err = 0;
  UniqueFd fd = ConnectUnix(socket, &err);
  if (!fd.valid()) {
    throw IoError("connect " + socket.string(), err);
  }
  SetSocketTimeouts(fd.get(), 5000, 5000);
  return fd;
}

// Reads response frames until eos, an error frame or end of stream.
inline std::vector<Response> ReadResponses(int fd) {
  std::vector<Response> responses;
  while (true) {
    std::string frame;
    try {
      frame = ReadFrame(fd);
    } catch (const Error &) {
      return responses; // daemon closed the connection
    }
    responses.push_back(DecodeResponse(frame));
    if (auto *token = std::get_if<TokenResponse>(&responses.back())) {
      if (token->eos) {
        return responses;
      }
    } else {
      return responses;
    }
  }
}

inline std::vector<Response> Exchange(const std::filesystem::path &socket,
                                      const std::string &payload) {
  UniqueFd fd = Connect(socket);
  WriteFrame(fd.get(), payload);
  return ReadResponses(fd.get());
}

inline std::vector<Response> Ask(const std::filesystem::path &socket,
                                 const std::string &prompt) {
  PromptRequest request;
  request.prompt = prompt;
  return Exchange(socket, EncodeRequest(request));
}

// Token strings of a successful stream (eos frame excluded).
inline std::vector<std::string> Tokens(const std::vector<Response> &responses) {
  std::vector<std::string> tokens;
  for (const auto &r : responses) {
    if (auto *token = std::get_if<TokenResponse>(&r)) {
      if (token->token) {
        tokens.push_back(*token->token);
      }
    }
  }
  return tokens;
}

inline std::size_t EosCount(const std::vector<Response> &responses) {
  std::size_t count = 0;
  for (const auto &r : responses) {
    if (auto *token = std::get_if<TokenResponse>(&r)) {
      count += token->eos ? 1 : 0;
    }
  }
  return count;
}

} // namespace testing
} // namespace threadrunner
