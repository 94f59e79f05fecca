#pragma once

#include "net/daemon_client.h"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace threadrunner {

struct ClientCommand {
  bool help{false};
  bool version{false};
  std::optional<std::string> backend;
  std::optional<std::string> socket;
  std::vector<std::string> words;
};

// Parses the client's arguments (without argv[0]). Options are recognized
// until the first prompt word or "--". Throws std::invalid_argument.
ClientCommand ParseClientArgs(const std::vector<std::string> &args);

std::string ClientUsage();

// Runs one prompt against the daemon and returns the process exit status.
// `options` supplies the daemon path and timeouts; the socket defaults to
// options.socket_path unless the command overrides it. Tokens go to `out`;
// a single diagnostic line goes to `err` on failure.
int RunClient(const ClientCommand &command, ClientOptions options,
              std::ostream &out, std::ostream &err);

} // namespace threadrunner
