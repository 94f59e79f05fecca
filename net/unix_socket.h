#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace threadrunner {

// Owns a file descriptor; closes it on destruction.
class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  ~UniqueFd();
  UniqueFd(const UniqueFd &) = delete;
  UniqueFd &operator=(const UniqueFd &) = delete;
  UniqueFd(UniqueFd &&other) noexcept : fd_(other.Release()) {}
  UniqueFd &operator=(UniqueFd &&other) noexcept;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  int Release();
  void Reset(int fd = -1);

private:
  int fd_{-1};
};

// Connects a stream socket to `path`. On failure returns an invalid fd and
// stores errno in *err (ENOENT / ECONNREFUSED when nobody listens).
UniqueFd ConnectUnix(const std::filesystem::path &path, int *err);

// Removes a stale socket file at `path`, binds and listens. Throws Io, also
// when a live listener already answers on `path`.
UniqueFd ListenUnix(const std::filesystem::path &path, int backlog = 128);

// Writes all `length` bytes. Throws Io on failure (including EPIPE).
void SendAll(int fd, const char *data, std::size_t length);

// Reads exactly `length` bytes. Throws Io on failure or when the peer closes
// before `length` bytes arrived, Timeout when SO_RCVTIMEO expires.
void RecvExact(int fd, char *buffer, std::size_t length);

// Sets SO_SNDTIMEO/SO_RCVTIMEO; a zero value leaves the option untouched.
void SetSocketTimeouts(int fd, int send_timeout_ms, int recv_timeout_ms);

} // namespace threadrunner
