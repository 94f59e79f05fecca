#include "scheduler/model_slot.h"

#include "common/error.h"
#include "server/logging/logger.h"

#include <utility>

namespace threadrunner {

ModelSlot::Lease::Lease(Lease &&other) noexcept
    : slot_(std::exchange(other.slot_, nullptr)) {}

ModelSlot::Lease::~Lease() {
  if (slot_) {
    slot_->Release();
  }
}

ModelSlot::ModelSlot(Loader loader)
    : loader_(std::move(loader)), last_activity_(Clock::now()) {}

ModelSlot::~ModelSlot() {
  std::unique_ptr<BackendHandle> handle;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handle = std::move(handle_);
  }
  // BackendHandle's destructor unloads and logs failures.
}

ModelSlot::Lease ModelSlot::Acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  lease_free_.wait(lock, [this] { return !leased_; });
  leased_ = true;
  return Lease(this);
}

void ModelSlot::Release() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream_open_ && handle_) {
      // The request ended early; drop its remaining tokens so they are not
      // streamed to the next client.
      try {
        handle_->Cancel();
      } catch (const std::exception &e) {
        log::Warn("model_slot",
                  std::string("cancel of abandoned stream failed: ") +
                      e.what());
      }
    }
    stream_open_ = false;
    leased_ = false;
    last_activity_ = Clock::now();
  }
  lease_free_.notify_one();
}

void ModelSlot::CheckLease(const Lease &lease) const {
  if (lease.slot_ != this) {
    throw Error(ErrorKind::kUnknown, "lease does not belong to this slot");
  }
}

void ModelSlot::Prompt(const Lease &lease, const std::string &text) {
  CheckLease(lease);
  std::lock_guard<std::mutex> lock(mutex_);
  if (!handle_) {
    handle_ = loader_();
    if (!handle_) {
      throw Error(ErrorKind::kModelLoad, "backend loader returned nothing");
    }
  }
  stream_open_ = true;
  handle_->Prompt(text);
  last_activity_ = Clock::now();
}

std::optional<std::string> ModelSlot::NextToken(const Lease &lease) {
  CheckLease(lease);
  std::lock_guard<std::mutex> lock(mutex_);
  if (!handle_) {
    throw Error(ErrorKind::kUnknown, "model unloaded during generation");
  }
  auto token = handle_->NextToken();
  if (!token) {
    stream_open_ = false;
  }
  last_activity_ = Clock::now();
  return token;
}

bool ModelSlot::EvictIfIdle(std::chrono::milliseconds idle_timeout) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!handle_ || leased_) {
    return false;
  }
  if (Clock::now() - last_activity_ < idle_timeout) {
    return false;
  }
  auto handle = std::move(handle_);
  try {
    handle->Unload();
  } catch (const std::exception &e) {
    log::Error("model_slot", std::string("idle unload failed: ") + e.what());
  }
  log::Info("model_slot", "Unloaded idle model",
            "idle_timeout_ms=" + std::to_string(idle_timeout.count()));
  return true;
}

bool ModelSlot::Loaded() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handle_ != nullptr;
}

bool ModelSlot::Leased() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return leased_;
}

ModelSlot::Clock::time_point ModelSlot::LastActivity() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_activity_;
}

} // namespace threadrunner
