#include <catch2/catch_test_macros.hpp>

#include "cli/client_app.h"
#include "net/daemon_client.h"
#include "test_support.h"

#include <signal.h>

#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

using namespace threadrunner;
using namespace threadrunner::testing;
using namespace std::chrono_literals;

namespace {

ClientOptions OptionsFor(const std::filesystem::path &socket) {
  ClientOptions options;
  options.socket_path = socket;
  options.daemon_path = "/nonexistent/threadrunner-daemon";
  return options;
}

ClientCommand Command(std::vector<std::string> args) {
  return ParseClientArgs(args);
}

// Terminates daemons started with `--socket <socket>`.
void KillDaemonsFor(const std::filesystem::path &socket) {
  for (const auto &entry : std::filesystem::directory_iterator("/proc")) {
    const auto name = entry.path().filename().string();
    if (name.find_first_not_of("0123456789") != std::string::npos) {
      continue;
    }
    std::string cmdline = ReadFile(entry.path() / "cmdline");
    if (cmdline.find(socket.string()) != std::string::npos &&
        cmdline.find("--socket") != std::string::npos) {
      ::kill(std::stoi(name), SIGTERM);
    }
  }
  auto deadline = std::chrono::steady_clock::now() + 3s;
  while (std::filesystem::exists(socket) &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(20ms);
  }
}

} // namespace

TEST_CASE("Client arguments", "[client]") {
  auto plain = Command({"tell", "me", "a", "joke"});
  REQUIRE(JoinPromptWords(plain.words) == "tell me a joke");
  REQUIRE_FALSE(plain.backend.has_value());

  auto with_backend = Command({"--backend", "dummy", "--socket", "/tmp/s", "hi"});
  REQUIRE(with_backend.backend == std::optional<std::string>("dummy"));
  REQUIRE(with_backend.socket == std::optional<std::string>("/tmp/s"));
  REQUIRE(with_backend.words == std::vector<std::string>{"hi"});

  auto dashed = Command({"--", "--not-a-flag", "x"});
  REQUIRE(JoinPromptWords(dashed.words) == "--not-a-flag x");

  auto later = Command({"count", "-5", "--backend"});
  REQUIRE(JoinPromptWords(later.words) == "count -5 --backend");

  REQUIRE(Command({"--help"}).help);
  REQUIRE(Command({"--version"}).version);
  REQUIRE_THROWS_AS(Command({"--bogus"}), std::invalid_argument);
  REQUIRE_THROWS_AS(Command({"--backend"}), std::invalid_argument);
}

TEST_CASE("A leading dash word needs the -- separator", "[client]") {
  try {
    Command({"-5", "degrees"});
    FAIL("expected invalid_argument");
  } catch (const std::invalid_argument &e) {
    REQUIRE(std::string(e.what()).find("put -- before") != std::string::npos);
  }
  REQUIRE(JoinPromptWords(Command({"--", "-5", "degrees"}).words) ==
          "-5 degrees");
  REQUIRE(ClientUsage().find("threadrunner -- -5") != std::string::npos);
}

TEST_CASE("StreamPrompt prints tokens and a trailing newline", "[client]") {
  DummyDaemon daemon;
  UniqueFd fd = Connect(daemon.socket());
  std::ostringstream out;
  StreamPrompt(fd.get(), "lorem ipsum", out);
  auto text = out.str();
  REQUIRE(text.rfind("loremipsumdolor", 0) == 0);
  REQUIRE(text.size() >= std::string("lorem.ipsum.\n").size());
  REQUIRE(text.substr(text.size() - 13) == "lorem.ipsum.\n");
}

TEST_CASE("RunClient succeeds against a running daemon", "[client]") {
  DummyDaemon daemon;
  std::ostringstream out;
  std::ostringstream err;
  int code = RunClient(Command({"hello", "there"}), OptionsFor(daemon.socket()),
                       out, err);
  REQUIRE(code == 0);
  REQUIRE(err.str().empty());
  REQUIRE(out.str().find("lorem") != std::string::npos);
  REQUIRE(out.str().find("hello.there.\n") != std::string::npos);
}

TEST_CASE("Daemon errors map to exit codes", "[client]") {
  DummyDaemon daemon;
  auto options = OptionsFor(daemon.socket());
  options.protocol_version = 99;
  std::ostringstream out;
  std::ostringstream err;
  int code = RunClient(Command({"hi"}), options, out, err);
  REQUIRE(code == 1);
  REQUIRE(err.str() ==
          "threadrunner: Protocol: unsupported protocol version 99 "
          "(daemon speaks 1)\n");
}

TEST_CASE("ModelLoad from the daemon exits 3", "[client]") {
  TempDir dir;
  ModelSlot slot([]() -> std::unique_ptr<BackendHandle> {
    throw Error(ErrorKind::kModelLoad, "model file missing");
  });
  DaemonServer server(DaemonServerOptions{dir / "m.sock", 1, 1000}, slot);
  server.Start();
  std::ostringstream out;
  std::ostringstream err;
  REQUIRE(RunClient(Command({"hi"}), OptionsFor(server.socket_path()), out,
                    err) == 3);
  REQUIRE(err.str() == "threadrunner: ModelLoad: model file missing\n");
  server.Stop();
}

TEST_CASE("Unknown backend is rejected before connecting", "[client]") {
  std::ostringstream out;
  std::ostringstream err;
  int code = RunClient(Command({"--backend", "quantum", "hi"}),
                       OptionsFor("/nonexistent/dir/x.sock"), out, err);
  REQUIRE(code == 1);
  REQUIRE(err.str().find("unknown backend 'quantum'") != std::string::npos);
  REQUIRE(err.str().find("Available backends: dummy") != std::string::npos);
}

TEST_CASE("Missing daemon executable is an Io failure", "[client]") {
  TempDir dir;
  std::ostringstream out;
  std::ostringstream err;
  int code = RunClient(Command({"hi"}), OptionsFor(dir / "none.sock"), out, err);
  REQUIRE(code == 2);
  REQUIRE(err.str().rfind("threadrunner: Io: ", 0) == 0);
}

TEST_CASE("A daemon that never listens times out", "[client]") {
  TempDir dir;
  auto options = OptionsFor(dir / "never.sock");
  options.daemon_path = "/bin/true";
  options.spawn_timeout = 300ms;
  auto started = std::chrono::steady_clock::now();
  try {
    ConnectOrSpawn(options);
    FAIL("expected Timeout");
  } catch (const Error &e) {
    REQUIRE(e.kind() == ErrorKind::kTimeout);
  }
  REQUIRE(std::chrono::steady_clock::now() - started < 3s);
  REQUIRE(ExitCodeFor(ErrorKind::kTimeout) == 4);
}

TEST_CASE("Help and version print without contacting the daemon",
          "[client]") {
  std::ostringstream out;
  std::ostringstream err;
  REQUIRE(RunClient(Command({"--help"}), OptionsFor("/nonexistent"), out, err) == 0);
  REQUIRE(out.str().find("Usage: threadrunner") != std::string::npos);
  out.str("");
  REQUIRE(RunClient(Command({"--version"}), OptionsFor("/nonexistent"), out, err) == 0);
  REQUIRE(out.str() == "threadrunner 0.1.0\n");
}

#ifdef THREADRUNNER_DAEMON_BINARY
TEST_CASE("Client spawns the daemon on first use", "[client][spawn]") {
  TempDir dir;
  auto socket = dir / "spawn.sock";
  auto options = OptionsFor(socket);
  options.daemon_path = THREADRUNNER_DAEMON_BINARY;
  options.daemon_env = {{"THREADRUNNER_HOME", dir.path().string()},
                        {"THREADRUNNER_LOG_DIR", dir.path().string()}};

  std::ostringstream out;
  std::ostringstream err;
  int code = RunClient(Command({"--backend", "dummy", "lorem", "ipsum"}),
                       options, out, err);
  INFO(err.str());
  REQUIRE(code == 0);
  REQUIRE(out.str().find("lorem") != std::string::npos);
  REQUIRE(std::filesystem::exists(socket));

  // The second run reuses the daemon that is now listening.
  std::ostringstream again;
  REQUIRE(RunClient(Command({"again"}), options, again, err) == 0);
  REQUIRE(again.str() == "again.\n");

  KillDaemonsFor(socket);
  REQUIRE_FALSE(std::filesystem::exists(socket));
}
#endif
