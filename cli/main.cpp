#include "cli/client_app.h"
#include "common/error.h"
#include "common/paths.h"

#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char **argv) {
  using namespace threadrunner;

  std::vector<std::string> args(argv + 1, argv + argc);
  ClientCommand command;
  try {
    command = ParseClientArgs(args);
  } catch (const std::invalid_argument &e) {
    std::cerr << "threadrunner: " << e.what() << "\n" << ClientUsage();
    return 1;
  }

  // A closed stdout pipe should surface as a write error, not kill us.
  std::signal(SIGPIPE, SIG_IGN);

  ClientOptions options;
  options.socket_path = DefaultSocketPath();
  try {
    options.daemon_path = DaemonExecutableFor(CurrentExecutable());
  } catch (const Error &e) {
    std::cerr << "threadrunner: " << ErrorKindName(e.kind()) << ": "
              << e.what() << std::endl;
    return ExitCodeFor(e.kind());
  }
  return RunClient(command, options, std::cout, std::cerr);
}
