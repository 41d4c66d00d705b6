/**
 * @file shutdown.hpp
 * @brief Turns SIGINT/SIGTERM into an orderly Supervisor::Stop().
 *
 * The signal handler only sets a flag and writes one byte to a pipe.
 * Wait() blocks on that pipe in a normal thread and then runs the
 * registered hooks newest first, so a hook that stops the supervised
 * system runs before the hooks that tear down what it depends on.
 *
 * Usage:
 * @code
 *   forge::ShutdownSignal signal;
 *   signal.Register(&StopSupervisor, &supervisor);
 *   signal.Install();
 *   signal.Wait();
 * @endcode
 */

#ifndef FORGE_SHUTDOWN_HPP_
#define FORGE_SHUTDOWN_HPP_

#include "forge/platform.hpp"
#include "forge/vocabulary.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>

namespace forge {

enum class ShutdownError : uint8_t {
  kHooksFull = 0,
  kNullHook,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated
};

/// Shutdown hook. @p signo is 0 when Quit() was called without a signal.
using ShutdownFn = void (*)(void* ctx, int signo);

#ifndef FORGE_SHUTDOWN_MAX_HOOKS
#define FORGE_SHUTDOWN_MAX_HOOKS 16U
#endif

class ShutdownSignal;

namespace detail {

inline ShutdownSignal*& ShutdownInstance() noexcept {
  static ShutdownSignal* ptr = nullptr;
  return ptr;
}

}  // namespace detail

/**
 * @brief Process-wide shutdown latch. At most one may be valid at a time.
 *
 * A second instance constructed while the first is alive reports
 * IsValid() == false and rejects every call.
 */
class ShutdownSignal final {
 public:
  ShutdownSignal() noexcept {
    if (detail::ShutdownInstance() != nullptr) return;
    if (::pipe(pipe_fd_) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    (void)::fcntl(pipe_fd_[0], F_SETFD, FD_CLOEXEC);
    (void)::fcntl(pipe_fd_[1], F_SETFD, FD_CLOEXEC);
    detail::ShutdownInstance() = this;
    valid_ = true;
  }

  ~ShutdownSignal() {
    RestoreHandlers();
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
    if (detail::ShutdownInstance() == this) {
      detail::ShutdownInstance() = nullptr;
    }
  }

  ShutdownSignal(const ShutdownSignal&) = delete;
  ShutdownSignal& operator=(const ShutdownSignal&) = delete;
  ShutdownSignal(ShutdownSignal&&) = delete;
  ShutdownSignal& operator=(ShutdownSignal&&) = delete;

  bool IsValid() const noexcept { return valid_; }

  /// Add a hook; hooks run in reverse registration order.
  expected<void, ShutdownError> Register(ShutdownFn fn, void* ctx = nullptr) noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(ShutdownError::kAlreadyInstantiated);
    }
    if (fn == nullptr) {
      return expected<void, ShutdownError>::error(ShutdownError::kNullHook);
    }
    if (hook_count_ >= FORGE_SHUTDOWN_MAX_HOOKS) {
      return expected<void, ShutdownError>::error(ShutdownError::kHooksFull);
    }
    hooks_[hook_count_].fn = fn;
    hooks_[hook_count_].ctx = ctx;
    ++hook_count_;
    return expected<void, ShutdownError>::success();
  }

  uint32_t HookCount() const noexcept { return hook_count_; }

  /// Route SIGINT and SIGTERM to Quit(). The previous handlers are restored
  /// on destruction.
  expected<void, ShutdownError> Install() noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(ShutdownError::kAlreadyInstantiated);
    }
    if (installed_) return expected<void, ShutdownError>::success();

    struct sigaction sa;
    sa.sa_handler = &ShutdownSignal::OnSignal;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    if (::sigaction(SIGINT, &sa, &prev_int_) != 0) {
      return expected<void, ShutdownError>::error(ShutdownError::kSignalInstallFailed);
    }
    if (::sigaction(SIGTERM, &sa, &prev_term_) != 0) {
      (void)::sigaction(SIGINT, &prev_int_, nullptr);
      return expected<void, ShutdownError>::error(ShutdownError::kSignalInstallFailed);
    }
    installed_ = true;
    return expected<void, ShutdownError>::success();
  }

  /// Request shutdown from any thread. Only the first request counts.
  void Quit(int signo = 0) noexcept {
    bool expected_val = false;
    if (requested_.compare_exchange_strong(expected_val, true)) {
      signo_.store(signo, std::memory_order_relaxed);
      Wake();
    }
  }

  bool IsShutdownRequested() const noexcept {
    return requested_.load(std::memory_order_acquire);
  }

  /// Signal number of the request, 0 for a manual Quit().
  int Signal() const noexcept { return signo_.load(std::memory_order_relaxed); }

  /**
   * @brief Block until shutdown is requested, then run the hooks once.
   * @return The signal number passed to the hooks.
   */
  int Wait() noexcept {
    if (valid_) {
      while (!requested_.load(std::memory_order_acquire)) {
        uint8_t byte = 0;
        ssize_t n = ::read(pipe_fd_[0], &byte, 1);
        if (n < 0 && errno != EINTR) break;
      }
    }
    const int signo = Signal();
    if (!hooks_ran_) {
      hooks_ran_ = true;
      for (uint32_t i = hook_count_; i > 0U; --i) {
        hooks_[i - 1U].fn(hooks_[i - 1U].ctx, signo);
      }
    }
    return signo;
  }

 private:
  struct Hook {
    ShutdownFn fn = nullptr;
    void* ctx = nullptr;
  };

  static void OnSignal(int signo) {
    ShutdownSignal* self = detail::ShutdownInstance();
    if (self == nullptr) return;
    bool expected_val = false;
    if (self->requested_.compare_exchange_strong(expected_val, true)) {
      self->signo_.store(signo, std::memory_order_relaxed);
    }
    self->Wake();
  }

  void Wake() noexcept {
    if (pipe_fd_[1] < 0) return;
    const int saved_errno = errno;
    const uint8_t byte = 1;
    (void)::write(pipe_fd_[1], &byte, 1);
    errno = saved_errno;
  }

  void RestoreHandlers() noexcept {
    if (!installed_) return;
    (void)::sigaction(SIGINT, &prev_int_, nullptr);
    (void)::sigaction(SIGTERM, &prev_term_, nullptr);
    installed_ = false;
  }

  Hook hooks_[FORGE_SHUTDOWN_MAX_HOOKS];
  uint32_t hook_count_ = 0;
  int pipe_fd_[2] = {-1, -1};
  std::atomic<bool> requested_{false};
  std::atomic<int> signo_{0};
  struct sigaction prev_int_ {};
  struct sigaction prev_term_ {};
  bool installed_ = false;
  bool hooks_ran_ = false;
  bool valid_ = false;
};

}  // namespace forge

#endif  // FORGE_SHUTDOWN_HPP_
