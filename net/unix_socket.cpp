#include "net/unix_socket.h"

#include "common/error.h"

#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

namespace threadrunner {

namespace {

sockaddr_un MakeAddress(const std::filesystem::path &path) {
  sockaddr_un addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  const std::string native = path.string();
  if (native.size() >= sizeof(addr.sun_path)) {
    throw Error(ErrorKind::kIo, "socket path too long: " + native);
  }
  std::memcpy(addr.sun_path, native.c_str(), native.size() + 1);
  return addr;
}

timeval ToTimeval(int ms) {
  timeval tv;
  tv.tv_sec = ms / 1000;
  tv.tv_usec = (ms % 1000) * 1000;
  return tv;
}

} // namespace

UniqueFd::~UniqueFd() { Reset(); }

UniqueFd &UniqueFd::operator=(UniqueFd &&other) noexcept {
  if (this != &other) {
    Reset(other.Release());
  }
  return *this;
}

int UniqueFd::Release() {
  int fd = fd_;
  fd_ = -1;
  return fd;
}

void UniqueFd::Reset(int fd) {
  if (fd_ >= 0) {
    ::close(fd_);
  }
  fd_ = fd;
}

UniqueFd ConnectUnix(const std::filesystem::path &path, int *err) {
  auto addr = MakeAddress(path);
  UniqueFd sock(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (!sock.valid()) {
    *err = errno;
    return UniqueFd();
  }
  int rc;
  do {
    rc = ::connect(sock.get(), reinterpret_cast<sockaddr *>(&addr),
                   sizeof(addr));
  } while (rc < 0 && errno == EINTR);
  if (rc < 0) {
    *err = errno;
    return UniqueFd();
  }
  *err = 0;
  return sock;
}

UniqueFd ListenUnix(const std::filesystem::path &path, int backlog) {
  auto addr = MakeAddress(path);
  int probe_err = 0;
  if (ConnectUnix(path, &probe_err).valid()) {
    throw IoError("bind " + path.string(), EADDRINUSE);
  }
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    throw Error(ErrorKind::kIo, "failed to remove stale socket " +
                                    path.string() + ": " + ec.message());
  }
  UniqueFd sock(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (!sock.valid()) {
    throw IoError("socket", errno);
  }
  if (::bind(sock.get(), reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) <
      0) {
    throw IoError("bind " + path.string(), errno);
  }
  if (::listen(sock.get(), backlog) < 0) {
    throw IoError("listen " + path.string(), errno);
  }
  return sock;
}

void SendAll(int fd, const char *data, std::size_t length) {
  std::size_t sent = 0;
  while (sent < length) {
    ssize_t n = ::send(fd, data + sent, length - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw IoError("write", errno);
    }
    sent += static_cast<std::size_t>(n);
  }
}

void RecvExact(int fd, char *buffer, std::size_t length) {
  std::size_t received = 0;
  while (received < length) {
    ssize_t n = ::recv(fd, buffer + received, length - received, 0);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        throw Error(ErrorKind::kTimeout,
                    "timed out after " + std::to_string(received) + " of " +
                        std::to_string(length) + " bytes");
      }
      throw IoError("read", errno);
    }
    if (n == 0) {
      throw Error(ErrorKind::kIo, "unexpected end of stream after " +
                                      std::to_string(received) + " of " +
                                      std::to_string(length) + " bytes");
    }
    received += static_cast<std::size_t>(n);
  }
}

void SetSocketTimeouts(int fd, int send_timeout_ms, int recv_timeout_ms) {
  if (send_timeout_ms > 0) {
    auto tv = ToTimeval(send_timeout_ms);
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  }
  if (recv_timeout_ms > 0) {
    auto tv = ToTimeval(recv_timeout_ms);
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  }
}

} // namespace threadrunner
