/**
 * @file supervisor.hpp
 * @brief Owns the running System and replaces it transactionally.
 *
 * Reset flow (one transaction, serialized against other Reset/Stop calls):
 *
 *   construct next system
 *     failed? -> publish, return (stored system untouched)
 *   stop current system (reverse order)
 *     failed? -> store current minus the failing component, publish, return
 *   store next system, start it (forward order)
 *     failed? -> keep only the components that started, stop them
 *       stop failed? -> store them minus the failing component
 *       publish, return the start failure
 *   store started system, publish healthy, return it
 *
 * The stored system is always stoppable: a component whose start or stop
 * failed is removed rather than kept in an unknown state. Exactly one
 * Outcome is published per transition, after the stored system reached its
 * final value for that transition.
 *
 * Usage:
 * @code
 *   forge::StatusRegister status;
 *   forge::Supervisor supervisor(status);
 *   auto r = supervisor.Reset([](const forge::System* prev) {
 *     forge::System sys;
 *     sys.Emplace<HttpServer>("http", 8080);
 *     return forge::expected<forge::System, forge::Fault>::success(std::move(sys));
 *   });
 *   if (!r) return 1;
 * @endcode
 */

#ifndef FORGE_SUPERVISOR_HPP_
#define FORGE_SUPERVISOR_HPP_

#include "forge/component.hpp"
#include "forge/log.hpp"
#include "forge/platform.hpp"
#include "forge/status.hpp"
#include "forge/vocabulary.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <utility>

namespace forge {

/// Builds the next, not yet started, system. @p previous is nullptr when
/// no system is stored.
using Constructor = std::function<expected<System, Fault>(const System* previous)>;

using TransitionResult = expected<SystemSnapshot, TransitionFailure>;

class Supervisor final {
 public:
  explicit Supervisor(StatusRegister& status) noexcept : status_(status) {}
  ~Supervisor() = default;

  Supervisor(const Supervisor&) = delete;
  Supervisor& operator=(const Supervisor&) = delete;
  Supervisor(Supervisor&&) = delete;
  Supervisor& operator=(Supervisor&&) = delete;

  // ==========================================================================
  // Transitions
  // ==========================================================================

  /**
   * @brief Replace the stored system with a freshly constructed one.
   * @param ctor Builds the next system from the stored one.
   * @return Snapshot of the started system, or why the transition failed.
   */
  TransitionResult Reset(const Constructor& ctor) {
    std::lock_guard<std::mutex> lk(txn_mtx_);
    return ResetLocked(ctor);
  }

  /// Reset() using the constructor stored with SetConstructor().
  TransitionResult Reset() {
    std::lock_guard<std::mutex> lk(txn_mtx_);
    return ResetLocked(ctor_);
  }

  /**
   * @brief Stop the stored system.
   *
   * Stopping when no system is stored is a successful no-op. On a component
   * failure the stored system keeps every component except the failing one.
   */
  TransitionResult Stop() {
    std::lock_guard<std::mutex> lk(txn_mtx_);
    if (has_system_) {
      auto r = system_.StopComponents();
      if (!r) {
        return FailStop(TransitionKind::kStop, r.get_error());
      }
    }
    FORGE_LOG_INFO("Supervisor", "stop ok (%u components)", system_.Size());
    return Succeed(TransitionKind::kStop);
  }

  // ==========================================================================
  // Configuration
  // ==========================================================================

  void SetConstructor(Constructor ctor) {
    std::lock_guard<std::mutex> lk(txn_mtx_);
    ctor_ = std::move(ctor);
  }

  bool HasConstructor() const {
    std::lock_guard<std::mutex> lk(txn_mtx_);
    return static_cast<bool>(ctor_);
  }

  void SetDevelopment(bool enabled) noexcept {
    development_.store(enabled, std::memory_order_relaxed);
  }

  bool IsDevelopment() const noexcept {
    return development_.load(std::memory_order_relaxed);
  }

  // ==========================================================================
  // Query
  // ==========================================================================

  StatusRegister& Status() noexcept { return status_; }

  bool HasSystem() const {
    std::lock_guard<std::mutex> lk(txn_mtx_);
    return has_system_;
  }

  SystemSnapshot Snapshot() const {
    std::lock_guard<std::mutex> lk(txn_mtx_);
    return system_.Snapshot();
  }

  /**
   * @brief Run @p fn with read access to the stored system.
   *
   * @p fn receives nullptr when no system is stored. It runs under the
   * transaction lock and must not call back into the Supervisor.
   */
  template <typename Fn>
  void Inspect(Fn&& fn) const {
    std::lock_guard<std::mutex> lk(txn_mtx_);
    fn(has_system_ ? &system_ : static_cast<const System*>(nullptr));
  }

 private:
  TransitionResult ResetLocked(const Constructor& ctor) {
    if (!ctor) {
      TransitionFailure failure;
      failure.error = ResetError::kNoConstructor;
      failure.cause = Fault::Make(0, "no constructor given, call SetConstructor() first");
      return Fail(TransitionKind::kReset, failure);
    }

    auto next = ctor(has_system_ ? &system_ : nullptr);
    if (!next) {
      TransitionFailure failure;
      failure.error = ResetError::kConstructionFailed;
      failure.cause = next.get_error();
      return Fail(TransitionKind::kReset, failure);
    }

    if (has_system_) {
      auto stopped = system_.StopComponents();
      if (!stopped) {
        return FailStop(TransitionKind::kReset, stopped.get_error());
      }
    }

    // Releases the previous components; they are all stopped at this point.
    system_ = std::move(next).value();
    has_system_ = true;

    auto started = system_.StartComponents();
    if (!started) {
      const ComponentFailure& sf = started.get_error();
      TransitionFailure failure;
      failure.error = ResetError::kStartFailed;
      failure.failing_key = sf.name;
      failure.cause = sf.fault;

      // Only the components that started are worth keeping.
      system_.Truncate(sf.index);
      auto rollback = system_.StopComponents();
      if (!rollback) {
        const ComponentFailure& rf = rollback.get_error();
        failure.rollback_failed = true;
        failure.rollback_key = rf.name;
        failure.rollback_cause = rf.fault;
        (void)system_.Remove(rf.name.c_str());
        FORGE_LOG_WARN("Supervisor", "rollback stop of '%s' failed: %s",
                       rf.name.c_str(), rf.fault.message.c_str());
      }
      return Fail(TransitionKind::kReset, failure);
    }

    FORGE_LOG_INFO("Supervisor", "reset ok (%u components)", system_.Size());
    return Succeed(TransitionKind::kReset);
  }

  TransitionResult FailStop(TransitionKind kind, const ComponentFailure& cf) {
    TransitionFailure failure;
    failure.error = ResetError::kStopFailed;
    failure.failing_key = cf.name;
    failure.cause = cf.fault;
    (void)system_.Remove(cf.name.c_str());
    return Fail(kind, failure);
  }

  TransitionResult Succeed(TransitionKind kind) {
    SystemSnapshot snap = system_.Snapshot();
    status_.Set(Outcome::Healthy(kind, snap));
    return TransitionResult::success(std::move(snap));
  }

  TransitionResult Fail(TransitionKind kind, const TransitionFailure& failure) {
    if (failure.failing_key.empty()) {
      FORGE_LOG_ERROR("Supervisor", "%s: %s", ResetErrorName(failure.error),
                      failure.cause.message.c_str());
    } else {
      FORGE_LOG_ERROR("Supervisor", "%s in '%s': %s",
                      ResetErrorName(failure.error), failure.failing_key.c_str(),
                      failure.cause.message.c_str());
    }
    status_.Set(Outcome::Unhealthy(kind, failure, system_.Snapshot()));
    return TransitionResult::error(failure);
  }

  StatusRegister& status_;
  mutable std::mutex txn_mtx_;
  System system_;
  bool has_system_ = false;
  Constructor ctor_;
  std::atomic<bool> development_{false};
};

}  // namespace forge

#endif  // FORGE_SUPERVISOR_HPP_
