#include "common/error.h"
#include "common/paths.h"
#include "runtime/backends/backend_factory.h"
#include "runtime/backends/backend_handle.h"
#include "scheduler/idle_reaper.h"
#include "scheduler/model_slot.h"
#include "server/daemon_config.h"
#include "server/daemon_server.h"
#include "server/logging/logger.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>

namespace {

std::atomic<bool> g_running{true};

void SignalHandler(int) { g_running = false; }

void ConfigureLogging(const threadrunner::DaemonConfig &config) {
  namespace log = threadrunner::log;
  log::SetJsonMode(config.log_json);
  if (auto level = log::ParseLevel(config.log_level)) {
    log::SetMinLevel(*level);
  } else {
    log::Warn("daemon", "unknown log level; using info",
              "level=" + config.log_level);
  }
  // Spawned daemons have stderr on /dev/null; the file is the only sink.
  log::SetStderrEnabled(::isatty(STDERR_FILENO) == 1);
  if (!log::SetLogFile(config.log_dir, "threadrunner-daemon.log")) {
    log::SetStderrEnabled(true);
    log::Warn("daemon", "cannot open log file; logging to stderr",
              "dir=" + config.log_dir.string());
  }
}

} // namespace

int main(int argc, char **argv) {
  using namespace threadrunner;

  DaemonFlags flags;
  try {
    flags = ParseDaemonFlags(argc, argv);
  } catch (const std::invalid_argument &e) {
    std::cerr << "threadrunner-daemon: " << e.what() << "\n"
              << DaemonUsage(argv[0]);
    return 1;
  }
  if (flags.help) {
    std::cout << DaemonUsage(argv[0]);
    return 0;
  }

  DaemonConfig config = LoadDaemonConfig(flags);
  ConfigureLogging(config);
  for (const auto &warning : config.warnings) {
    log::Warn("config", warning);
  }

  std::signal(SIGPIPE, SIG_IGN);
  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  ModelSlot slot([config]() {
    auto kind = BackendFactory::Resolve(config.backend);
    auto path = BackendFactory::ModelPathFor(kind, config.model_path);
    return BackendFactory::Load(kind, path, config.llama);
  });

  DaemonServer server(ServerOptionsFor(config), slot);
  try {
    server.Start();
  } catch (const Error &e) {
    log::Error("daemon", e.what(),
               std::string("kind=") + ErrorKindName(e.kind()));
    std::cerr << "threadrunner-daemon: " << e.what() << std::endl;
    return 1;
  }

  IdleReaper reaper(slot, std::chrono::seconds(config.idle_timeout_secs),
                    std::chrono::seconds(config.idle_check_interval_secs));
  reaper.Start();
  log::Info("daemon", "threadrunner daemon ready",
            "pid=" + std::to_string(::getpid()) +
                " backend=" + (config.backend.empty() ? "default" : config.backend));

  while (g_running && server.Running()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  log::Info("daemon", "shutting down");
  reaper.Stop();
  server.Stop();
  log::CloseLogFile();
  return 0;
}
