#pragma once

#include "runtime/backends/llama/llama_backend_config.h"
#include "server/daemon_server.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace threadrunner {

// Effective daemon settings. Layers, later ones winning: built-in defaults,
// YAML file, environment, command-line flags.
struct DaemonConfig {
  std::filesystem::path socket_path;
  int workers{16};
  int idle_timeout_secs{300};
  int idle_check_interval_secs{5};
  int write_timeout_secs{30};
  int read_timeout_secs{10};

  // Backend name as configured; resolved at load time so that an unknown
  // name reaches the client as a ModelLoad error.
  std::string backend;
  std::string model_path;
  LlamaBackendConfig llama;

  std::string log_level{"info"};
  bool log_json{false};
  std::filesystem::path log_dir;

  // Problems found while layering (bad numbers, unreadable YAML). Logged by
  // the daemon once logging is configured.
  std::vector<std::string> warnings;
};

struct DaemonFlags {
  std::optional<std::string> socket;
  std::optional<std::string> config;
  std::optional<int> idle_timeout_secs;
  std::optional<int> workers;
  std::optional<std::string> backend;
  std::optional<std::string> model;
  bool help{false};
};

// Returns the value of an environment variable, nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const char *)>;
std::optional<std::string> ProcessEnv(const char *name);

DaemonConfig DefaultDaemonConfig();

// Throws std::invalid_argument for unknown flags, missing values and
// malformed numbers.
DaemonFlags ParseDaemonFlags(int argc, char **argv);

// Missing files are skipped silently; malformed ones add a warning and leave
// `config` at its previous values.
void ApplyConfigFile(const std::filesystem::path &path, DaemonConfig *config);
void ApplyEnvironment(DaemonConfig *config,
                      const EnvLookup &env = ProcessEnv);
void ApplyFlags(const DaemonFlags &flags, DaemonConfig *config);

// Runs every layer in order. The YAML path is --config, else
// <home>/config.yaml.
DaemonConfig LoadDaemonConfig(const DaemonFlags &flags,
                              const EnvLookup &env = ProcessEnv);

// Server settings derived from `config`. Seconds are converted without
// overflow; very large values saturate.
DaemonServerOptions ServerOptionsFor(const DaemonConfig &config);

std::string DaemonUsage(const std::string &program);

} // namespace threadrunner
