#include "core/cancel_token.h"

#include <memory>

namespace bgt::core {

const char *to_string(CancelReason reason) {
  switch (reason) {
  case CancelReason::None:
    return "None";
  case CancelReason::User:
    return "User";
  case CancelReason::Timeout:
    return "Timeout";
  case CancelReason::Shutdown:
    return "Shutdown";
  }
  return "Unknown";
}

void CancelToken::request_cancel(CancelReason reason) noexcept {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (canceled_.load(std::memory_order_relaxed)) {
      return;
    }
    reason_.store(reason, std::memory_order_relaxed);
    canceled_.store(true, std::memory_order_release);
  }
  cv_.notify_all();
}

bool CancelToken::is_canceled() const noexcept {
  return canceled_.load(std::memory_order_acquire);
}

CancelReason CancelToken::reason() const noexcept {
  return reason_.load(std::memory_order_acquire);
}

bool CancelToken::wait_for(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this]() {
    return canceled_.load(std::memory_order_acquire);
  });
}

std::shared_ptr<CancelToken> CancelToken::create() {
  return std::make_shared<CancelToken>();
}

} // namespace bgt::core
