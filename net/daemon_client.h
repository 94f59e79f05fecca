#pragma once

#include "net/unix_socket.h"
#include "net/wire_protocol.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace threadrunner {

struct ClientOptions {
  std::filesystem::path socket_path;
  std::filesystem::path daemon_path;
  std::chrono::milliseconds spawn_timeout{5000};
  std::chrono::milliseconds retry_interval{100};
  std::uint8_t protocol_version{kProtocolVersion};
  // Variables set in the environment of a daemon this client spawns.
  std::vector<std::pair<std::string, std::string>> daemon_env;
};

// Connects to the daemon socket. When nobody listens (ENOENT, ECONNREFUSED)
// the daemon is spawned and the connect retried until `spawn_timeout`, which
// raises Timeout. Other connect failures raise Io.
UniqueFd ConnectOrSpawn(const ClientOptions &options);

// Starts `daemon` fully detached (double fork, new session, stdio on
// /dev/null) with `--socket <socket>`. Throws Io when the executable is
// missing or the fork fails.
void SpawnDaemon(const std::filesystem::path &daemon,
                 const std::filesystem::path &socket,
                 const std::vector<std::pair<std::string, std::string>> &env);

// Sends one prompt and copies the token stream to `out`, flushing after each
// token and ending with a newline at eos. An error frame raises Error with
// the daemon's kind and message.
void StreamPrompt(int fd, const std::string &prompt, std::ostream &out,
                  std::uint8_t version = kProtocolVersion);

// Prompt words joined by single spaces.
std::string JoinPromptWords(const std::vector<std::string> &words);

} // namespace threadrunner
