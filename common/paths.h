#pragma once

#include <filesystem>
#include <string>

namespace threadrunner {

inline constexpr const char *kDefaultSocketPath = "/tmp/threadrunner.sock";
inline constexpr const char *kBundledModelName =
    "tinyllama-1.1b-chat-v1.0.Q4_K_M.gguf";
inline constexpr const char *kDaemonSuffix = "-daemon";

// $THREADRUNNER_SOCKET, else /tmp/threadrunner.sock.
std::filesystem::path DefaultSocketPath();

// $THREADRUNNER_HOME, else $HOME/.threadrunner, else ./.threadrunner.
std::filesystem::path ThreadrunnerHome();

// <home>/models/<bundled model>.
std::filesystem::path DefaultModelPath();

// <home>/config.yaml.
std::filesystem::path DefaultConfigPath();

// $XDG_CACHE_HOME, else $HOME/.cache, else ./.cache.
std::filesystem::path CacheDir();

// Absolute path of the running executable (/proc/self/exe). Throws Io when
// it cannot be resolved.
std::filesystem::path CurrentExecutable();

// Daemon binary expected next to `client`: <dir>/<client-name>-daemon.
std::filesystem::path DaemonExecutableFor(const std::filesystem::path &client);

} // namespace threadrunner
