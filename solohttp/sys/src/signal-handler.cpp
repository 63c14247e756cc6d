#include "solohttp/signal-handler.hpp"

#include <atomic>

#include "solohttp/log.hpp"
#include "solohttp/platform.hpp"
#include "solohttp/shutdown-flag.hpp"

#ifdef SOLOHTTP_POSIX
#include <csignal>

#include "solohttp/errno-throw.hpp"
#endif

namespace {

std::atomic<solohttp::ShutdownFlag*> g_shutdownFlag{nullptr};

static_assert(std::atomic<solohttp::ShutdownFlag*>::is_always_lock_free);

}  // namespace

#ifdef SOLOHTTP_POSIX

extern "C" void SolohttpSignalHandler([[maybe_unused]] int sigNum) {
  // Only async-signal-safe operations here: no logging, no allocation.
  solohttp::ShutdownFlag* flag = g_shutdownFlag.load(std::memory_order_acquire);
  if (flag != nullptr) {
    flag->requestShutdown();
  }
}

namespace solohttp {

namespace {

void InstallHandler(int sigNum, void (*handler)(int)) {
  struct sigaction action{};
  action.sa_handler = handler;
  sigemptyset(&action.sa_mask);
  // No SA_RESTART: blocking calls return EINTR so that loops can observe the flag promptly.
  action.sa_flags = 0;
  if (::sigaction(sigNum, &action, nullptr) == -1) {
    throw_errno("sigaction failed for signal {}", sigNum);
  }
}

}  // namespace

void SignalHandler::Enable(ShutdownFlag& flag) {
  g_shutdownFlag.store(&flag, std::memory_order_release);
  InstallHandler(SIGINT, ::SolohttpSignalHandler);
  InstallHandler(SIGTERM, ::SolohttpSignalHandler);
  log::debug("SIGINT / SIGTERM now request a graceful shutdown");
}

void SignalHandler::Disable() noexcept {
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  g_shutdownFlag.store(nullptr, std::memory_order_release);
}

}  // namespace solohttp

#else

namespace solohttp {

void SignalHandler::Enable(ShutdownFlag& flag) {
  g_shutdownFlag.store(&flag, std::memory_order_release);
  log::warn("No OS interrupt hook on this platform, the server cannot be stopped cooperatively");
}

void SignalHandler::Disable() noexcept { g_shutdownFlag.store(nullptr, std::memory_order_release); }

}  // namespace solohttp

#endif
