#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace bgt::core {

/// Why a token fired. Recorded once, by the first request_cancel().
enum class CancelReason { None, User, Timeout, Shutdown };

const char *to_string(CancelReason reason);

/// Thread-safe cooperative cancellation token, one per task.
///
/// Fired by the command processor (Cancel), by the admission loop (timeout)
/// and by shutdown. Executors poll is_canceled() between sub-steps or sleep
/// through wait_for(), which returns early when the token fires.
class CancelToken {
public:
  CancelToken() = default;

  /// Request cancellation and wake every wait_for(). Thread-safe and
  /// idempotent; only the first call records its reason.
  void request_cancel(CancelReason reason = CancelReason::User) noexcept;

  [[nodiscard]] bool is_canceled() const noexcept;

  [[nodiscard]] CancelReason reason() const noexcept;

  /// Sleep up to `timeout`, waking as soon as the token fires.
  /// Returns true if the token is canceled on return.
  bool wait_for(std::chrono::milliseconds timeout) const;

  static std::shared_ptr<CancelToken> create();

private:
  std::atomic<bool> canceled_{false};
  std::atomic<CancelReason> reason_{CancelReason::None};
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
};

} // namespace bgt::core
