#pragma once

#include "solohttp/platform.hpp"
#include "solohttp/shutdown-flag.hpp"

namespace solohttp {

// Platform adapter translating OS termination requests (SIGINT, SIGTERM) into ShutdownFlag::requestShutdown().
// It holds no state of its own besides a pointer to the registered flag, which must outlive the registration.
// On platforms without a POSIX signal API the adapter is a no-op: the server then cannot be stopped cooperatively.
class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Register flag as the target of SIGINT and SIGTERM, replacing any previously registered flag.
  // Throws std::system_error if the handlers cannot be installed.
  static void Enable(ShutdownFlag& flag);

  // Restore the default dispositions and forget the registered flag.
  static void Disable() noexcept;

  static constexpr bool IsSupported() noexcept {
#ifdef SOLOHTTP_POSIX
    return true;
#else
    return false;
#endif
  }
};

}  // namespace solohttp
