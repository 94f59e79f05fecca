#pragma once

#include "scheduler/model_slot.h"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace threadrunner {

// Background thread that periodically asks a ModelSlot to evict its backend
// once it has been idle for `idle_timeout`.
class IdleReaper {
public:
  IdleReaper(ModelSlot &slot, std::chrono::milliseconds idle_timeout,
             std::chrono::milliseconds check_interval);
  ~IdleReaper();
  IdleReaper(const IdleReaper &) = delete;
  IdleReaper &operator=(const IdleReaper &) = delete;

  void Start();
  // Wakes the thread and joins it. Safe to call more than once.
  void Stop();

  std::size_t Evictions() const;
  // Never shorter than 1 ms, so a zero interval cannot spin.
  std::chrono::milliseconds CheckInterval() const { return check_interval_; }

private:
  void Run();

  ModelSlot &slot_;
  std::chrono::milliseconds idle_timeout_;
  std::chrono::milliseconds check_interval_;
  std::thread thread_;
  mutable std::mutex mutex_;
  std::condition_variable wake_;
  bool stopping_{false};
  std::size_t evictions_{0};
};

} // namespace threadrunner
