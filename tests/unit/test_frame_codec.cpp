#include <catch2/catch_test_macros.hpp>

#include "common/error.h"
#include "net/frame_codec.h"
#include "net/unix_socket.h"

#include <sys/socket.h>
#include <unistd.h>

using namespace threadrunner;

namespace {

struct SocketPair {
  SocketPair() {
    int fds[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
    a.Reset(fds[0]);
    b.Reset(fds[1]);
  }
  UniqueFd a;
  UniqueFd b;
};

} // namespace

TEST_CASE("Length prefix is little-endian", "[frame]") {
  auto prefix = EncodeLength(0x01020304u);
  REQUIRE(static_cast<unsigned char>(prefix[0]) == 0x04);
  REQUIRE(static_cast<unsigned char>(prefix[1]) == 0x03);
  REQUIRE(static_cast<unsigned char>(prefix[2]) == 0x02);
  REQUIRE(static_cast<unsigned char>(prefix[3]) == 0x01);
  REQUIRE(DecodeLength(prefix) == 0x01020304u);
  REQUIRE(DecodeLength(EncodeLength(0xFFFFFFFFu)) == 0xFFFFFFFFu);
}

TEST_CASE("Frames survive a socket round trip", "[frame]") {
  SocketPair pair;
  WriteFrame(pair.a.get(), "{\"v\":1}");
  WriteFrame(pair.a.get(), "");
  std::string binary("a\0b\xff", 4);
  WriteFrame(pair.a.get(), binary);

  REQUIRE(ReadFrame(pair.b.get()) == "{\"v\":1}");
  REQUIRE(ReadFrame(pair.b.get()).empty());
  REQUIRE(ReadFrame(pair.b.get()) == binary);
}

TEST_CASE("Frame prefix matches payload length on the wire", "[frame]") {
  SocketPair pair;
  WriteFrame(pair.a.get(), "hello");
  char raw[9];
  RecvExact(pair.b.get(), raw, sizeof(raw));
  REQUIRE(raw[0] == 5);
  REQUIRE(raw[1] == 0);
  REQUIRE(raw[2] == 0);
  REQUIRE(raw[3] == 0);
  REQUIRE(std::string(raw + 4, 5) == "hello");
}

TEST_CASE("Truncated frames are Io errors", "[frame]") {
  SocketPair pair;
  SECTION("peer closes inside the prefix") {
    char two[2] = {5, 0};
    SendAll(pair.a.get(), two, sizeof(two));
    pair.a.Reset();
    try {
      ReadFrame(pair.b.get());
      FAIL("expected an Io error");
    } catch (const Error &e) {
      REQUIRE(e.kind() == ErrorKind::kIo);
    }
  }
  SECTION("peer closes inside the payload") {
    auto prefix = EncodeLength(100);
    SendAll(pair.a.get(), prefix.data(), prefix.size());
    SendAll(pair.a.get(), "0123456789", 10);
    pair.a.Reset();
    try {
      ReadFrame(pair.b.get());
      FAIL("expected an Io error");
    } catch (const Error &e) {
      REQUIRE(e.kind() == ErrorKind::kIo);
      REQUIRE(std::string(e.what()).find("10 of 100") != std::string::npos);
    }
  }
}

TEST_CASE("Oversized frames are Protocol errors", "[frame]") {
  SocketPair pair;
  SECTION("reader rejects an announced length above the limit") {
    auto prefix = EncodeLength(kMaxFrameBytes + 1);
    SendAll(pair.a.get(), prefix.data(), prefix.size());
    try {
      ReadFrame(pair.b.get());
      FAIL("expected a Protocol error");
    } catch (const Error &e) {
      REQUIRE(e.kind() == ErrorKind::kProtocol);
    }
  }
  SECTION("writer refuses a payload above the limit") {
    std::string big(kMaxFrameBytes + 1, 'x');
    try {
      WriteFrame(pair.a.get(), big);
      FAIL("expected a Protocol error");
    } catch (const Error &e) {
      REQUIRE(e.kind() == ErrorKind::kProtocol);
    }
  }
}
