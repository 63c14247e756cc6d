#pragma once

// Platform detection and portable aliases for solohttp's system layer.
//
// Detection macros:
//   SOLOHTTP_LINUX – defined on Linux
//   SOLOHTTP_MACOS – defined on macOS / Darwin
//   SOLOHTTP_POSIX – defined on any POSIX-compliant OS (Linux, macOS, *BSD ...)
//
// The socket layer requires BSD sockets. Only the OS interrupt adapter (SignalHandler) has a fallback
// for platforms without a POSIX signal API.

#ifdef __linux__
#define SOLOHTTP_LINUX
#define SOLOHTTP_POSIX
#elifdef __APPLE__
#define SOLOHTTP_MACOS
#define SOLOHTTP_POSIX
#elif defined(__unix__)
#define SOLOHTTP_POSIX
#endif

#include <cerrno>

namespace solohttp {

using NativeHandle = int;
inline constexpr NativeHandle kInvalidHandle = -1;

// True for the errno values meaning "nothing available yet, try again later".
constexpr bool IsWouldBlock(int err) noexcept { return err == EAGAIN || err == EWOULDBLOCK; }

}  // namespace solohttp
