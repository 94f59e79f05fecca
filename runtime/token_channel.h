#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace threadrunner {

// Bounded single-producer/single-consumer queue between a generation worker
// and the thread that drains tokens. A message is either a token or nullopt,
// the terminal "no more tokens" marker.
class TokenChannel {
public:
  explicit TokenChannel(std::size_t capacity = 16);

  std::size_t Capacity() const { return capacity_; }

  // Blocks while the channel is full. Returns false once closed; the message
  // is dropped in that case.
  bool Send(std::optional<std::string> message);

  // Blocks while the channel is empty and open. Returns false only when the
  // channel is closed and drained.
  bool Receive(std::optional<std::string> *message);

  // Wakes both sides. Messages already queued can still be received.
  void Close();
  bool Closed() const;

  std::size_t Size() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<std::optional<std::string>> queue_;
  std::size_t capacity_;
  bool closed_{false};
};

} // namespace threadrunner
