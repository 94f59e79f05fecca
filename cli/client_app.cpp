#include "cli/client_app.h"

#include "common/error.h"
#include "common/version.h"
#include "runtime/backends/backend_factory.h"

#include <stdexcept>

namespace threadrunner {

ClientCommand ParseClientArgs(const std::vector<std::string> &args) {
  ClientCommand command;
  bool options_done = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (options_done) {
      command.words.push_back(arg);
      continue;
    }
    if (arg == "--") {
      options_done = true;
    } else if (arg == "-h" || arg == "--help") {
      command.help = true;
    } else if (arg == "-V" || arg == "--version") {
      command.version = true;
    } else if (arg == "--backend" || arg == "--socket") {
      if (i + 1 >= args.size()) {
        throw std::invalid_argument("missing value for " + arg);
      }
      (arg == "--backend" ? command.backend : command.socket) = args[++i];
    } else if (arg.rfind("--backend=", 0) == 0) {
      command.backend = arg.substr(10);
    } else if (arg.rfind("--socket=", 0) == 0) {
      command.socket = arg.substr(9);
    } else if (arg.size() > 1 && arg[0] == '-' && command.words.empty()) {
      throw std::invalid_argument(
          "unknown option " + arg +
          " (put -- before prompt words that start with '-')");
    } else {
      options_done = true;
      command.words.push_back(arg);
    }
  }
  return command;
}

std::string ClientUsage() {
  return "Usage: threadrunner [--backend NAME] [--socket PATH] <prompt "
         "words...>\n"
         "\n"
         "Streams a completion for the prompt from the local threadrunner\n"
         "daemon, starting the daemon when it is not running.\n"
         "\n"
         "Options:\n"
         "  --backend NAME   backend for a newly started daemon (" +
         BackendFactory::CompiledNames() +
         ")\n"
         "  --socket PATH    daemon socket (default $THREADRUNNER_SOCKET or "
         "/tmp/threadrunner.sock)\n"
         "  -h, --help       show this help\n"
         "  -V, --version    show the version\n"
         "  --               end of options; the rest is the prompt\n"
         "\n"
         "Use -- before a prompt whose first word starts with '-',\n"
         "for example: threadrunner -- -5 degrees in kelvin\n";
}

int RunClient(const ClientCommand &command, ClientOptions options,
              std::ostream &out, std::ostream &err) {
  if (command.help) {
    out << ClientUsage();
    return 0;
  }
  if (command.version) {
    out << "threadrunner " << kVersion << "\n";
    return 0;
  }
  if (command.backend) {
    auto kind = BackendFactory::Parse(*command.backend);
    if (!kind) {
      err << "threadrunner: unknown backend '" << *command.backend
          << "'. Available backends: " << BackendFactory::CompiledNames()
          << std::endl;
      return 1;
    }
    options.daemon_env.emplace_back("THREADRUNNER_BACKEND",
                                    BackendKindName(*kind));
  }
  if (command.socket) {
    options.socket_path = *command.socket;
  }

  try {
    UniqueFd fd = ConnectOrSpawn(options);
    StreamPrompt(fd.get(), JoinPromptWords(command.words), out,
                 options.protocol_version);
    return 0;
  } catch (const Error &e) {
    out.flush();
    err << "threadrunner: " << ErrorKindName(e.kind()) << ": " << e.what()
        << std::endl;
    return ExitCodeFor(e.kind());
  } catch (const std::exception &e) {
    out.flush();
    err << "threadrunner: " << ErrorKindName(ErrorKind::kUnknown) << ": "
        << e.what() << std::endl;
    return ExitCodeFor(ErrorKind::kUnknown);
  }
}

} // namespace threadrunner
