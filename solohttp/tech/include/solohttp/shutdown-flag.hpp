#pragma once

#include <atomic>

namespace solohttp {

// Cooperative cancellation token shared between an interrupt source (typically the OS signal adapter) and the
// long running loops of the server (accept loop and read retry loop).
// Requesting shutdown is async-signal-safe: it is a single store on a lock-free atomic.
// The loops only observe it at their suspension points, cancellation is never preemptive.
class ShutdownFlag {
 public:
  ShutdownFlag() noexcept = default;

  ShutdownFlag(const ShutdownFlag&) = delete;
  ShutdownFlag(ShutdownFlag&&) = delete;
  ShutdownFlag& operator=(const ShutdownFlag&) = delete;
  ShutdownFlag& operator=(ShutdownFlag&&) = delete;

  ~ShutdownFlag() = default;

  void requestShutdown() noexcept { _requested.store(true, std::memory_order_release); }

  [[nodiscard]] bool isShutdownRequested() const noexcept { return _requested.load(std::memory_order_acquire); }

  // Clears a previous request so that the same flag can drive another run.
  void reset() noexcept { _requested.store(false, std::memory_order_release); }

 private:
  static_assert(std::atomic<bool>::is_always_lock_free, "ShutdownFlag must be settable from a signal handler");

  std::atomic<bool> _requested{false};
};

}  // namespace solohttp
