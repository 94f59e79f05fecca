#include "scheduler/idle_reaper.h"

#include "server/logging/logger.h"

#include <algorithm>

namespace threadrunner {

IdleReaper::IdleReaper(ModelSlot &slot, std::chrono::milliseconds idle_timeout,
                       std::chrono::milliseconds check_interval)
    : slot_(slot), idle_timeout_(idle_timeout),
      check_interval_(std::max(check_interval, std::chrono::milliseconds(1))) {}

IdleReaper::~IdleReaper() { Stop(); }

void IdleReaper::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (thread_.joinable()) {
    return;
  }
  stopping_ = false;
  thread_ = std::thread(&IdleReaper::Run, this);
  log::Debug("idle_reaper", "started",
             "idle_timeout_ms=" + std::to_string(idle_timeout_.count()) +
                 " interval_ms=" + std::to_string(check_interval_.count()));
}

void IdleReaper::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

std::size_t IdleReaper::Evictions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return evictions_;
}

void IdleReaper::Run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    wake_.wait_for(lock, check_interval_, [this] { return stopping_; });
    if (stopping_) {
      break;
    }
    lock.unlock();
    bool evicted = slot_.EvictIfIdle(idle_timeout_);
    lock.lock();
    if (evicted) {
      ++evictions_;
    }
  }
}

} // namespace threadrunner
