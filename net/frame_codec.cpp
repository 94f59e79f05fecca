#include "net/frame_codec.h"

#include "common/error.h"
#include "net/unix_socket.h"

namespace threadrunner {

std::array<char, 4> EncodeLength(std::uint32_t length) {
  return {static_cast<char>(length & 0xFFu),
          static_cast<char>((length >> 8) & 0xFFu),
          static_cast<char>((length >> 16) & 0xFFu),
          static_cast<char>((length >> 24) & 0xFFu)};
}

std::uint32_t DecodeLength(const std::array<char, 4> &prefix) {
  std::uint32_t value = 0;
  for (int i = 3; i >= 0; --i) {
    value = (value << 8) | static_cast<unsigned char>(prefix[i]);
  }
  return value;
}

void WriteFrame(int fd, const std::string &payload) {
  if (payload.size() > kMaxFrameBytes) {
    throw Error(ErrorKind::kProtocol,
                "frame of " + std::to_string(payload.size()) +
                    " bytes exceeds limit of " +
                    std::to_string(kMaxFrameBytes));
  }
  auto prefix = EncodeLength(static_cast<std::uint32_t>(payload.size()));
  SendAll(fd, prefix.data(), prefix.size());
  SendAll(fd, payload.data(), payload.size());
}

std::string ReadFrame(int fd) {
  std::array<char, 4> prefix{};
  RecvExact(fd, prefix.data(), prefix.size());
  auto length = DecodeLength(prefix);
  if (length > kMaxFrameBytes) {
    throw Error(ErrorKind::kProtocol,
                "announced frame length " + std::to_string(length) +
                    " exceeds limit of " + std::to_string(kMaxFrameBytes));
  }
  std::string payload(length, '\0');
  RecvExact(fd, payload.data(), payload.size());
  return payload;
}

} // namespace threadrunner
