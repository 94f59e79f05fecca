#include "server/daemon_server.h"

#include "common/error.h"
#include "server/logging/logger.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace threadrunner {

DaemonServer::DaemonServer(DaemonServerOptions options, ModelSlot &slot)
    : options_(std::move(options)), handler_(slot) {}

DaemonServer::~DaemonServer() { Stop(); }

void DaemonServer::Start() {
  if (running_) {
    return;
  }
  UniqueFd listener = ListenUnix(options_.socket_path);
  listen_fd_.store(listener.Release());
  running_ = true;
  int workers = options_.workers > 0 ? options_.workers : 1;
  for (int i = 0; i < workers; ++i) {
    workers_.emplace_back(&DaemonServer::WorkerLoop, this);
  }
  accept_thread_ = std::thread(&DaemonServer::AcceptLoop, this);
  log::Info("daemon", "listening", "socket=" + options_.socket_path.string() +
                                       " workers=" + std::to_string(workers));
}

void DaemonServer::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  // Close the listening socket to unblock accept().
  int fd = listen_fd_.exchange(-1);
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    for (int active : active_fds_) {
      ::shutdown(active, SHUT_RDWR);
    }
  }
  queue_cv_.notify_all();
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  for (auto &w : workers_) {
    if (w.joinable()) {
      w.join();
    }
  }
  workers_.clear();
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    while (!client_queue_.empty()) {
      client_queue_.pop(); // UniqueFd closes
    }
  }
  std::error_code ec;
  std::filesystem::remove(options_.socket_path, ec);
  if (ec) {
    log::Warn("daemon", "failed to remove socket file",
              "socket=" + options_.socket_path.string() +
                  " error=" + ec.message());
  }
  log::Info("daemon", "stopped",
            "connections=" + std::to_string(served_.load()));
}

void DaemonServer::WorkerLoop() {
  while (true) {
    UniqueFd client;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock,
                     [this] { return !client_queue_.empty() || !running_; });
      if (!running_) {
        return;
      }
      client = std::move(client_queue_.front());
      client_queue_.pop();
      active_fds_.insert(client.get());
    }
    handler_.Handle(client.get());
    ++served_;
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      active_fds_.erase(client.get());
    }
  }
}

void DaemonServer::AcceptLoop() {
  while (running_) {
    int fd = listen_fd_.load();
    if (fd < 0) {
      break;
    }
    int client_fd = ::accept(fd, nullptr, nullptr);
    if (client_fd < 0) {
      int err = errno;
      if (!running_) {
        break; // listener closed by Stop()
      }
      if (err == EINTR || err == ECONNABORTED || err == EPROTO) {
        continue;
      }
      if (err == EMFILE || err == ENFILE || err == ENOBUFS || err == ENOMEM) {
        log::Warn("daemon", "accept failed; retrying",
                  std::string("error=") + std::strerror(err));
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        continue;
      }
      log::Error("daemon", "accept failed; stopping accept loop",
                 std::string("error=") + std::strerror(err));
      break;
    }
    UniqueFd client(client_fd);
    if (!running_) {
      break;
    }
    SetSocketTimeouts(client.get(), options_.write_timeout_ms,
                      options_.read_timeout_ms);
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      client_queue_.push(std::move(client));
    }
    queue_cv_.notify_one();
  }
}

} // namespace threadrunner
