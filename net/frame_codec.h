#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace threadrunner {

// Largest payload accepted by ReadFrame.
inline constexpr std::uint32_t kMaxFrameBytes = 16u * 1024u * 1024u;

// 4-byte little-endian length prefix.
std::array<char, 4> EncodeLength(std::uint32_t length);
std::uint32_t DecodeLength(const std::array<char, 4> &prefix);

// Writes one frame (prefix then payload). Throws Protocol when the payload
// exceeds kMaxFrameBytes, Io on socket failure.
void WriteFrame(int fd, const std::string &payload);

// Reads one frame. Throws Io on short reads or socket failure, Timeout when
// the receive timeout expires, and Protocol when the announced length exceeds
// kMaxFrameBytes.
std::string ReadFrame(int fd);

} // namespace threadrunner
