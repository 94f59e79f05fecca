#pragma once

#include "runtime/backends/backend_handle.h"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace threadrunner {

// The daemon's single model. Holds at most one loaded backend, loading it on
// demand and letting the idle reaper evict it.
//
// Requests are serialized at the request level: a Lease is held from Prompt
// until the token stream ends, so one client never receives tokens that were
// generated for another client's prompt. The internal mutex is released
// between tokens, so socket writes never happen under it.
class ModelSlot {
public:
  using Clock = std::chrono::steady_clock;
  // Produces a freshly loaded backend. Throws ModelLoad on failure.
  using Loader = std::function<std::unique_ptr<BackendHandle>()>;

  class Lease {
  public:
    Lease(Lease &&other) noexcept;
    Lease &operator=(Lease &&other) = delete;
    Lease(const Lease &) = delete;
    Lease &operator=(const Lease &) = delete;
    ~Lease();

  private:
    friend class ModelSlot;
    explicit Lease(ModelSlot *slot) : slot_(slot) {}
    ModelSlot *slot_;
  };

  explicit ModelSlot(Loader loader);
  ~ModelSlot();
  ModelSlot(const ModelSlot &) = delete;
  ModelSlot &operator=(const ModelSlot &) = delete;

  // Blocks until no other request holds the slot.
  Lease Acquire();

  // Loads the backend if none is loaded, then submits `text`. A load failure
  // propagates and leaves the slot empty.
  void Prompt(const Lease &lease, const std::string &text);

  // Next token of the current prompt, nullopt at end of stream.
  std::optional<std::string> NextToken(const Lease &lease);

  // Unloads the backend when one is loaded, no lease is held and the last
  // activity is older than `idle_timeout`. Returns true when it unloaded.
  bool EvictIfIdle(std::chrono::milliseconds idle_timeout);

  bool Loaded() const;
  bool Leased() const;
  Clock::time_point LastActivity() const;

private:
  void Release();
  void CheckLease(const Lease &lease) const;

  Loader loader_;
  mutable std::mutex mutex_;
  std::condition_variable lease_free_;
  std::unique_ptr<BackendHandle> handle_;
  Clock::time_point last_activity_;
  bool leased_{false};
  // A prompt was submitted and its stream has not reached the end yet.
  bool stream_open_{false};
};

} // namespace threadrunner
