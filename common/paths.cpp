#include "common/paths.h"

#include "common/error.h"

#include <cstdlib>
#include <system_error>

namespace threadrunner {

namespace {

const char *NonEmptyEnv(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

} // namespace

std::filesystem::path DefaultSocketPath() {
  if (const char *env = NonEmptyEnv("THREADRUNNER_SOCKET")) {
    return std::filesystem::path(env);
  }
  return std::filesystem::path(kDefaultSocketPath);
}

std::filesystem::path ThreadrunnerHome() {
  if (const char *env = NonEmptyEnv("THREADRUNNER_HOME")) {
    return std::filesystem::path(env);
  }
  if (const char *home = NonEmptyEnv("HOME")) {
    return std::filesystem::path(home) / ".threadrunner";
  }
  return std::filesystem::current_path() / ".threadrunner";
}

std::filesystem::path DefaultModelPath() {
  return ThreadrunnerHome() / "models" / kBundledModelName;
}

std::filesystem::path DefaultConfigPath() {
  return ThreadrunnerHome() / "config.yaml";
}

std::filesystem::path CacheDir() {
  if (const char *env = NonEmptyEnv("XDG_CACHE_HOME")) {
    return std::filesystem::path(env);
  }
  if (const char *home = NonEmptyEnv("HOME")) {
    return std::filesystem::path(home) / ".cache";
  }
  return std::filesystem::current_path() / ".cache";
}

std::filesystem::path CurrentExecutable() {
  std::error_code ec;
  auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec) {
    throw Error(ErrorKind::kIo,
                "failed to resolve current executable: " + ec.message());
  }
  return exe;
}

std::filesystem::path
DaemonExecutableFor(const std::filesystem::path &client) {
  auto name = client.filename().string() + kDaemonSuffix;
  return client.parent_path() / name;
}

} // namespace threadrunner
