#pragma once

#include "net/unix_socket.h"
#include "scheduler/model_slot.h"
#include "server/connection_handler.h"

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <queue>
#include <set>
#include <thread>
#include <vector>

namespace threadrunner {

struct DaemonServerOptions {
  std::filesystem::path socket_path;
  int workers{16};
  // SO_SNDTIMEO applied to every accepted connection; 0 disables it.
  int write_timeout_ms{30000};
  // SO_RCVTIMEO for the request frame. A connection that sends nothing
  // within this window is answered with a Timeout error and released, so
  // idle peers cannot hold every worker. 0 disables it.
  int read_timeout_ms{10000};
};

// Unix-socket front end of the daemon. One thread accepts connections and
// hands them to a fixed pool of connection workers.
class DaemonServer {
public:
  DaemonServer(DaemonServerOptions options, ModelSlot &slot);
  ~DaemonServer();
  DaemonServer(const DaemonServer &) = delete;
  DaemonServer &operator=(const DaemonServer &) = delete;

  // Binds and listens synchronously, then starts the threads. Throws Io when
  // the socket cannot be bound (another daemon already owns the path).
  void Start();

  // Closes the listener, shuts down in-flight connections, joins every
  // thread and removes the socket file.
  void Stop();

  bool Running() const { return running_.load(); }
  const std::filesystem::path &socket_path() const {
    return options_.socket_path;
  }
  std::size_t ConnectionsServed() const { return served_.load(); }

private:
  void AcceptLoop();
  void WorkerLoop();

  DaemonServerOptions options_;
  ConnectionHandler handler_;
  std::atomic<bool> running_{false};
  std::atomic<int> listen_fd_{-1};
  std::atomic<std::size_t> served_{0};
  std::thread accept_thread_;
  std::vector<std::thread> workers_;
  std::queue<UniqueFd> client_queue_;
  std::set<int> active_fds_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
};

} // namespace threadrunner
