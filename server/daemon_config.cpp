#include "server/daemon_config.h"

#include "common/paths.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace threadrunner {

namespace {

std::string ExpandHome(const std::string &path) {
  if (path.size() >= 1 && path[0] == '~' &&
      (path.size() == 1 || path[1] == '/')) {
    if (const char *home = std::getenv("HOME")) {
      return std::string(home) + path.substr(1);
    }
  }
  return path;
}

std::optional<int> ParseInt(const std::string &text) {
  try {
    std::size_t used = 0;
    int value = std::stoi(text, &used, 0);
    if (used != text.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::optional<std::uint32_t> ParseSeed(const std::string &text) {
  try {
    std::size_t used = 0;
    unsigned long value = std::stoul(text, &used, 0);
    if (used != text.size() || value > 0xFFFFFFFFul) {
      return std::nullopt;
    }
    return static_cast<std::uint32_t>(value);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

// Positive integers only; anything else is reported and ignored.
void ApplyPositive(const std::string &source, const std::string &text,
                   int *target, DaemonConfig *config) {
  auto value = ParseInt(text);
  if (!value || *value <= 0) {
    config->warnings.push_back("ignoring invalid value '" + text + "' for " +
                               source);
    return;
  }
  *target = *value;
}

} // namespace

std::optional<std::string> ProcessEnv(const char *name) {
  if (const char *value = std::getenv(name)) {
    return std::string(value);
  }
  return std::nullopt;
}

DaemonConfig DefaultDaemonConfig() {
  DaemonConfig config;
  config.socket_path = kDefaultSocketPath;
  config.log_dir = CacheDir();
  return config;
}

DaemonFlags ParseDaemonFlags(int argc, char **argv) {
  DaemonFlags flags;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto value = [&]() -> std::string {
      if (i + 1 >= argc) {
        throw std::invalid_argument("missing value for " + arg);
      }
      return argv[++i];
    };
    auto number = [&]() -> int {
      std::string text = value();
      auto parsed = ParseInt(text);
      if (!parsed || *parsed <= 0) {
        throw std::invalid_argument("invalid value '" + text + "' for " + arg);
      }
      return *parsed;
    };
    if (arg == "--socket") {
      flags.socket = value();
    } else if (arg == "--config") {
      flags.config = value();
    } else if (arg == "--idle-timeout") {
      flags.idle_timeout_secs = number();
    } else if (arg == "--workers") {
      flags.workers = number();
    } else if (arg == "--backend") {
      flags.backend = value();
    } else if (arg == "--model") {
      flags.model = value();
    } else if (arg == "-h" || arg == "--help") {
      flags.help = true;
    } else {
      throw std::invalid_argument("unknown argument " + arg);
    }
  }
  return flags;
}

void ApplyConfigFile(const std::filesystem::path &path, DaemonConfig *config) {
  std::error_code ec;
  if (path.empty() || !std::filesystem::exists(path, ec)) {
    return;
  }
  DaemonConfig updated = *config;
  try {
    YAML::Node root = YAML::LoadFile(path.string());

    // Counts and durations must be positive, exactly as from env or flags.
    auto positive = [&updated](const YAML::Node &section, const char *section_name,
                               const char *key, int *target) {
      if (section[key]) {
        ApplyPositive(std::string(section_name) + "." + key,
                      section[key].as<std::string>(), target, &updated);
      }
    };

    if (auto daemon = root["daemon"]) {
      if (daemon["socket"]) updated.socket_path = ExpandHome(daemon["socket"].as<std::string>());
      positive(daemon, "daemon", "workers", &updated.workers);
      positive(daemon, "daemon", "idle_timeout_secs", &updated.idle_timeout_secs);
      positive(daemon, "daemon", "idle_check_interval_secs", &updated.idle_check_interval_secs);
      positive(daemon, "daemon", "write_timeout_secs", &updated.write_timeout_secs);
      positive(daemon, "daemon", "read_timeout_secs", &updated.read_timeout_secs);
    }

    if (auto model = root["model"]) {
      if (model["backend"]) updated.backend = model["backend"].as<std::string>();
      if (model["path"]) updated.model_path = ExpandHome(model["path"].as<std::string>());
      positive(model, "model", "ctx_size", &updated.llama.ctx_size);
      positive(model, "model", "max_tokens", &updated.llama.max_tokens);
      if (model["gpu_layers"]) updated.llama.gpu_layers = model["gpu_layers"].as<int>();
    }

    if (auto sampling = root["sampling"]) {
      if (sampling["temperature"]) updated.llama.temperature = sampling["temperature"].as<float>();
      if (sampling["top_k"]) updated.llama.top_k = sampling["top_k"].as<int32_t>();
      if (sampling["top_p"]) updated.llama.top_p = sampling["top_p"].as<float>();
      if (sampling["seed"]) {
        auto text = sampling["seed"].as<std::string>();
        auto seed = ParseSeed(text);
        if (!seed) {
          throw std::invalid_argument("invalid sampling.seed '" + text + "'");
        }
        updated.llama.seed = *seed;
      }
    }

    if (auto logging = root["logging"]) {
      if (logging["level"]) updated.log_level = logging["level"].as<std::string>();
      if (logging["format"]) updated.log_json = logging["format"].as<std::string>() == "json";
      if (logging["dir"]) updated.log_dir = ExpandHome(logging["dir"].as<std::string>());
    }
  } catch (const YAML::Exception &e) {
    config->warnings.push_back("error parsing config file " + path.string() +
                               ": " + e.what());
    return;
  } catch (const std::invalid_argument &e) {
    config->warnings.push_back("error in config file " + path.string() +
                               ": " + e.what());
    return;
  }
  *config = std::move(updated);
}

void ApplyEnvironment(DaemonConfig *config, const EnvLookup &env) {
  if (auto v = env("THREADRUNNER_BACKEND")) {
    config->backend = *v;
  }
  if (auto v = env("THREADRUNNER_MODEL_PATH")) {
    config->model_path = *v;
  }
  if (auto v = env("THREADRUNNER_SOCKET")) {
    if (!v->empty()) {
      config->socket_path = *v;
    }
  }
  if (auto v = env("THREADRUNNER_IDLE_TIMEOUT_SECS")) {
    ApplyPositive("THREADRUNNER_IDLE_TIMEOUT_SECS", *v,
                  &config->idle_timeout_secs, config);
  }
  if (auto v = env("THREADRUNNER_WORKERS")) {
    ApplyPositive("THREADRUNNER_WORKERS", *v, &config->workers, config);
  }
  if (auto v = env("THREADRUNNER_LOG")) {
    config->log_level = *v;
  }
  if (auto v = env("THREADRUNNER_LOG_FORMAT")) {
    config->log_json = *v == "json";
  }
  if (auto v = env("THREADRUNNER_LOG_DIR")) {
    if (!v->empty()) {
      config->log_dir = *v;
    }
  }
}

void ApplyFlags(const DaemonFlags &flags, DaemonConfig *config) {
  if (flags.socket) config->socket_path = *flags.socket;
  if (flags.idle_timeout_secs) config->idle_timeout_secs = *flags.idle_timeout_secs;
  if (flags.workers) config->workers = *flags.workers;
  if (flags.backend) config->backend = *flags.backend;
  if (flags.model) config->model_path = *flags.model;
}

namespace {

int SecondsToMillis(int seconds) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::seconds(seconds))
                .count();
  return static_cast<int>(std::min<std::int64_t>(
      ms, std::numeric_limits<int>::max()));
}

} // namespace

DaemonServerOptions ServerOptionsFor(const DaemonConfig &config) {
  DaemonServerOptions options;
  options.socket_path = config.socket_path;
  options.workers = config.workers;
  options.write_timeout_ms = SecondsToMillis(config.write_timeout_secs);
  options.read_timeout_ms = SecondsToMillis(config.read_timeout_secs);
  return options;
}

DaemonConfig LoadDaemonConfig(const DaemonFlags &flags, const EnvLookup &env) {
  DaemonConfig config = DefaultDaemonConfig();
  std::filesystem::path config_path =
      flags.config ? std::filesystem::path(ExpandHome(*flags.config))
                   : DefaultConfigPath();
  ApplyConfigFile(config_path, &config);
  ApplyEnvironment(&config, env);
  ApplyFlags(flags, &config);
  return config;
}

std::string DaemonUsage(const std::string &program) {
  return "Usage: " + program +
         " [--socket PATH] [--config FILE] [--idle-timeout SECS]\n"
         "       [--workers N] [--backend dummy|native] [--model PATH]\n"
         "\n"
         "Serves prompts over a Unix socket. Started on demand by the\n"
         "threadrunner client; exits on SIGINT or SIGTERM.\n";
}

} // namespace threadrunner
