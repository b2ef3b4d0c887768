#ifndef RESEARCHGUARD_CORE_CANCELLATION_HPP_
#define RESEARCHGUARD_CORE_CANCELLATION_HPP_

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <thread>

namespace researchguard::core {

// Deadline plus cooperative cancel flag threaded through every long-latency
// call of one conversation (generation, tool invocation, retry backoff).
//
// Collaborators are expected to poll `ShouldStop()` and to bound their own
// waits by `Remaining()`. The token never interrupts a call by force; the
// coordinator checks it between suspension points so committed turns are
// never torn.
class CancellationToken {
public:
  using Clock = std::chrono::steady_clock;

  CancellationToken() = default;

  explicit CancellationToken(std::chrono::milliseconds budget)
      : deadline_(After(budget)) {}

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void Cancel() {
    cancelled_.store(true, std::memory_order_release);
  }

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

  bool HasDeadline() const {
    return deadline_.has_value();
  }

  bool Expired() const {
    return deadline_.has_value() && Clock::now() >= deadline_.value();
  }

  bool ShouldStop() const {
    return IsCancelled() || Expired();
  }

  // Time left before the deadline; `fallback` when no deadline is set.
  std::chrono::milliseconds Remaining(std::chrono::milliseconds fallback) const {
    if (!deadline_.has_value()) {
      return fallback;
    }
    // Rounded up so a wait bounded by this never ends before the deadline.
    const auto left =
        std::chrono::ceil<std::chrono::milliseconds>(deadline_.value() - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
  }

  // Sleeps for `duration` in short slices so a cancel or deadline cuts the
  // wait short. Returns false when interrupted.
  bool SleepFor(std::chrono::milliseconds duration) const {
    constexpr std::chrono::milliseconds kSlice(10);
    const auto until = After(duration);
    while (Clock::now() < until) {
      if (ShouldStop()) {
        return false;
      }
      const auto left =
          std::chrono::duration_cast<std::chrono::milliseconds>(until - Clock::now());
      std::this_thread::sleep_for(std::min(left, kSlice));
    }
    return !ShouldStop();
  }

private:
  // Now plus `duration`, saturating at the clock's range. Negative durations
  // count as zero.
  static Clock::time_point After(std::chrono::milliseconds duration) {
    const auto now = Clock::now();
    if (duration <= std::chrono::milliseconds(0)) {
      return now;
    }
    if (duration >
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - now)) {
      return Clock::time_point::max();
    }
    return now + duration;
  }

  std::optional<Clock::time_point> deadline_;
  std::atomic<bool> cancelled_{false};
};

} // namespace researchguard::core

#endif // RESEARCHGUARD_CORE_CANCELLATION_HPP_
