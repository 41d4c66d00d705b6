/**
 * @file status.hpp
 * @brief Awaitable register holding the outcome of the latest transition.
 *
 * The Supervisor is the only writer. Any number of observers read the
 * current Outcome with Get() or block for the next one with AwaitChange().
 * Each Set() bumps a sequence number and wakes every waiter that registered
 * before it; a waiter returns once per call and must call again to wait
 * for a further change.
 *
 * Usage:
 * @code
 *   forge::StatusRegister status;
 *   forge::Supervisor supervisor(status);
 *
 *   // observer thread
 *   auto seen = status.Get();
 *   for (;;) {
 *     auto next = status.AwaitChangeAfter(seen.sequence, 1000U);
 *     if (!next) continue;  // timeout
 *     seen = next.value();
 *     Render(seen);
 *   }
 * @endcode
 */

#ifndef FORGE_STATUS_HPP_
#define FORGE_STATUS_HPP_

#include "forge/component.hpp"
#include "forge/platform.hpp"
#include "forge/vocabulary.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>

namespace forge {

// ============================================================================
// Transition failure taxonomy
// ============================================================================

enum class ResetError : uint8_t {
  kConstructionFailed = 0,  ///< Constructor failed, nothing was changed
  kStopFailed,              ///< A component of the running system failed to stop
  kStartFailed,             ///< A component of the next system failed to start
  kNoConstructor            ///< Reset() without a stored constructor
};

inline const char* ResetErrorName(ResetError e) noexcept {
  switch (e) {
    case ResetError::kConstructionFailed: return "construction failed";
    case ResetError::kStopFailed:         return "stop failed";
    case ResetError::kStartFailed:        return "start failed";
    case ResetError::kNoConstructor:      return "no constructor";
  }
  return "unknown";
}

/**
 * @brief Why a transition failed.
 *
 * failing_key is empty for kConstructionFailed and kNoConstructor. The
 * rollback_* fields describe a cleanup stop that failed after a start
 * failure; the start failure remains the reported cause.
 */
struct TransitionFailure {
  ResetError error = ResetError::kConstructionFailed;
  ComponentName failing_key;
  Fault cause;
  bool rollback_failed = false;
  ComponentName rollback_key;
  Fault rollback_cause;
};

// ============================================================================
// Outcome
// ============================================================================

enum class Health : uint8_t { kHealthy = 0, kUnhealthy };

enum class TransitionKind : uint8_t {
  kInitial = 0,  ///< Sentinel held before the first transition
  kReset,
  kStop
};

struct Outcome {
  uint64_t sequence = 0;
  Health health = Health::kHealthy;
  TransitionKind kind = TransitionKind::kInitial;
  TransitionFailure failure;  ///< Meaningful only when health is kUnhealthy
  SystemSnapshot system;      ///< Stored system after the transition

  bool ok() const noexcept { return health == Health::kHealthy; }

  static Outcome Healthy(TransitionKind kind, SystemSnapshot system) {
    Outcome o;
    o.health = Health::kHealthy;
    o.kind = kind;
    o.system = std::move(system);
    return o;
  }

  static Outcome Unhealthy(TransitionKind kind, const TransitionFailure& failure,
                           SystemSnapshot system) {
    Outcome o;
    o.health = Health::kUnhealthy;
    o.kind = kind;
    o.failure = failure;
    o.system = std::move(system);
    return o;
  }
};

// ============================================================================
// StatusRegister
// ============================================================================

enum class StatusError : uint8_t { kTimeout = 0 };

class StatusRegister final {
 public:
  StatusRegister() = default;
  ~StatusRegister() = default;

  StatusRegister(const StatusRegister&) = delete;
  StatusRegister& operator=(const StatusRegister&) = delete;

  /// Non-blocking read of the latest outcome.
  Outcome Get() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return outcome_;
  }

  uint64_t Sequence() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return outcome_.sequence;
  }

  /**
   * @brief Publish a new outcome and release every registered waiter.
   * @return The sequence number assigned to @p outcome.
   */
  uint64_t Set(Outcome outcome) {
    uint64_t seq;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      seq = outcome_.sequence + 1U;
      outcome_ = std::move(outcome);
      outcome_.sequence = seq;
    }
    cv_.notify_all();
    return seq;
  }

  /// Block until the next Set() after this call, then return its outcome.
  Outcome AwaitChange() {
    std::unique_lock<std::mutex> lk(mtx_);
    const uint64_t seen = outcome_.sequence;
    ++waiters_;
    ScopeGuard<std::function<void()>> release([this] { --waiters_; });
    cv_.wait(lk, [this, seen] { return outcome_.sequence != seen; });
    return outcome_;
  }

  /**
   * @brief Bounded AwaitChange().
   * @return StatusError::kTimeout if nothing was published within the timeout.
   */
  expected<Outcome, StatusError> AwaitChangeFor(uint32_t timeout_ms) {
    std::unique_lock<std::mutex> lk(mtx_);
    return WaitLocked(lk, outcome_.sequence, timeout_ms);
  }

  /**
   * @brief Wait until an outcome newer than @p sequence is published.
   *
   * Returns immediately if one already is. Pairs with Get() so that no
   * change between the read and the wait is lost.
   */
  expected<Outcome, StatusError> AwaitChangeAfter(uint64_t sequence,
                                                  uint32_t timeout_ms) {
    std::unique_lock<std::mutex> lk(mtx_);
    return WaitLocked(lk, sequence, timeout_ms);
  }

  /// Number of threads currently blocked in one of the Await* calls.
  uint32_t WaiterCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return waiters_;
  }

 private:
  expected<Outcome, StatusError> WaitLocked(std::unique_lock<std::mutex>& lk,
                                            uint64_t seen, uint32_t timeout_ms) {
    ++waiters_;
    ScopeGuard<std::function<void()>> release([this] { --waiters_; });
    const bool changed =
        cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms),
                     [this, seen] { return outcome_.sequence > seen; });
    if (!changed) {
      return expected<Outcome, StatusError>::error(StatusError::kTimeout);
    }
    return expected<Outcome, StatusError>::success(outcome_);
  }

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  Outcome outcome_;
  uint32_t waiters_ = 0;
};

}  // namespace forge

#endif  // FORGE_STATUS_HPP_
