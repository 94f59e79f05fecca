#include "net/daemon_client.h"

#include "common/error.h"
#include "net/frame_codec.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char **environ;

namespace threadrunner {

namespace {

bool ShouldSpawn(int err) { return err == ENOENT || err == ECONNREFUSED; }

// Copy of the current environment with `overrides` applied, in execve form.
std::vector<std::string>
BuildEnvironment(const std::vector<std::pair<std::string, std::string>> &overrides) {
  std::vector<std::string> entries;
  for (char **entry = environ; entry && *entry; ++entry) {
    std::string kv = *entry;
    bool replaced = false;
    for (const auto &o : overrides) {
      if (kv.compare(0, o.first.size() + 1, o.first + "=") == 0) {
        replaced = true;
        break;
      }
    }
    if (!replaced) {
      entries.push_back(std::move(kv));
    }
  }
  for (const auto &o : overrides) {
    entries.push_back(o.first + "=" + o.second);
  }
  return entries;
}

} // namespace

void SpawnDaemon(const std::filesystem::path &daemon,
                 const std::filesystem::path &socket,
                 const std::vector<std::pair<std::string, std::string>> &env) {
  if (::access(daemon.c_str(), X_OK) != 0) {
    throw IoError("cannot execute daemon " + daemon.string(), errno);
  }

  // Everything the child needs is prepared before fork.
  std::string program = daemon.string();
  std::string socket_arg = socket.string();
  std::vector<char *> argv = {program.data(),
                              const_cast<char *>("--socket"),
                              socket_arg.data(), nullptr};
  auto env_entries = BuildEnvironment(env);
  std::vector<char *> envp;
  envp.reserve(env_entries.size() + 1);
  for (auto &entry : env_entries) {
    envp.push_back(entry.data());
  }
  envp.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    throw IoError("fork failed", errno);
  }
  if (pid == 0) {
    ::setsid();
    pid_t grandchild = ::fork();
    if (grandchild != 0) {
      ::_exit(grandchild < 0 ? 1 : 0);
    }
    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::dup2(devnull, STDOUT_FILENO);
      ::dup2(devnull, STDERR_FILENO);
      if (devnull > STDERR_FILENO) {
        ::close(devnull);
      }
    }
    ::execve(argv[0], argv.data(), envp.data());
    ::_exit(127);
  }
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
    throw Error(ErrorKind::kIo, "failed to detach daemon process");
  }
}

UniqueFd ConnectOrSpawn(const ClientOptions &options) {
  int err = 0;
  UniqueFd fd = ConnectUnix(options.socket_path, &err);
  if (fd.valid()) {
    return fd;
  }
  if (!ShouldSpawn(err)) {
    throw IoError("cannot connect to " + options.socket_path.string(), err);
  }

  SpawnDaemon(options.daemon_path, options.socket_path, options.daemon_env);

  auto deadline = std::chrono::steady_clock::now() + options.spawn_timeout;
  while (true) {
    std::this_thread::sleep_for(options.retry_interval);
    fd = ConnectUnix(options.socket_path, &err);
    if (fd.valid()) {
      return fd;
    }
    if (!ShouldSpawn(err)) {
      throw IoError("cannot connect to " + options.socket_path.string(), err);
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      auto secs = std::chrono::duration_cast<std::chrono::milliseconds>(
                      options.spawn_timeout)
                      .count();
      throw Error(ErrorKind::kTimeout,
                  "daemon did not start listening on " +
                      options.socket_path.string() + " within " +
                      std::to_string(secs) + " ms");
    }
  }
}

void StreamPrompt(int fd, const std::string &prompt, std::ostream &out,
                  std::uint8_t version) {
  PromptRequest request;
  request.v = version;
  request.prompt = prompt;
  request.stream = true;
  WriteFrame(fd, EncodeRequest(request));

  while (true) {
    Response response = DecodeResponse(ReadFrame(fd));
    if (auto *error = std::get_if<ErrorResponse>(&response)) {
      throw Error(error->error_type, error->error);
    }
    const auto &token = std::get<TokenResponse>(response);
    if (token.token) {
      out << *token.token;
      out.flush();
    }
    if (token.eos) {
      out << '\n';
      out.flush();
      return;
    }
  }
}

std::string JoinPromptWords(const std::vector<std::string> &words) {
  std::string prompt;
  for (std::size_t i = 0; i < words.size(); ++i) {
    if (i > 0) {
      prompt += ' ';
    }
    prompt += words[i];
  }
  return prompt;
}

} // namespace threadrunner
