#include "runtime/token_channel.h"

#include <algorithm>

namespace threadrunner {

TokenChannel::TokenChannel(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity)) {}

bool TokenChannel::Send(std::optional<std::string> message) {
  std::unique_lock<std::mutex> lock(mutex_);
  not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
  if (closed_) {
    return false;
  }
  queue_.push_back(std::move(message));
  lock.unlock();
  not_empty_.notify_one();
  return true;
}

bool TokenChannel::Receive(std::optional<std::string> *message) {
  std::unique_lock<std::mutex> lock(mutex_);
  not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
  if (queue_.empty()) {
    return false;
  }
  *message = std::move(queue_.front());
  queue_.pop_front();
  lock.unlock();
  not_full_.notify_one();
  return true;
}

void TokenChannel::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

bool TokenChannel::Closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::size_t TokenChannel::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

} // namespace threadrunner
