#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace bgt::core {

/// Unbounded multi-producer / single-consumer channel.
///
/// Messages are delivered in send order. After close(), send() fails and
/// receive() drains what is left, then returns nullopt.
template <typename T> class Channel {
public:
  Channel() = default;
  Channel(const Channel &) = delete;
  Channel &operator=(const Channel &) = delete;

  /// Returns false if the channel is closed; the message is dropped.
  bool send(T message) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) {
        return false;
      }
      items_.push_back(std::move(message));
    }
    cv_.notify_one();
    return true;
  }

  /// Blocks until a message arrives or the channel is closed and empty.
  std::optional<T> receive() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return closed_ || !items_.empty(); });
    if (items_.empty()) {
      return std::nullopt;
    }
    T message = std::move(items_.front());
    items_.pop_front();
    return message;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> items_;
  bool closed_ = false;
};

} // namespace bgt::core
