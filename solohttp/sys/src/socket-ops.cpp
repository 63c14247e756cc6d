#include "solohttp/socket-ops.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "solohttp/platform.hpp"

namespace solohttp {

namespace {

bool UpdateStatusFlags(NativeHandle fd, bool nonBlocking) noexcept {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags == -1) {
    return false;
  }
  const int newFlags = nonBlocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  if (newFlags == flags) {
    return true;
  }
  return ::fcntl(fd, F_SETFL, newFlags) != -1;
}

}  // namespace

bool SetNonBlocking(NativeHandle fd) noexcept { return UpdateStatusFlags(fd, true); }

bool SetBlocking(NativeHandle fd) noexcept { return UpdateStatusFlags(fd, false); }

bool SetRecvTimeout(NativeHandle fd, std::chrono::milliseconds timeout) noexcept {
  const auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout);
  const auto usecs = std::chrono::duration_cast<std::chrono::microseconds>(timeout - secs);
  timeval tv{};
  tv.tv_sec = static_cast<decltype(tv.tv_sec)>(secs.count());
  tv.tv_usec = static_cast<decltype(tv.tv_usec)>(usecs.count());
  return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

bool SetReuseAddr(NativeHandle fd) noexcept {
  static constexpr int kEnable = 1;
  return ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) == 0;
}

bool IsIpv4Literal(const std::string& address) noexcept {
  in_addr addr{};
  return ::inet_pton(AF_INET, address.c_str(), &addr) == 1;
}

int64_t SafeSend(NativeHandle fd, const void* data, std::size_t len) noexcept {
#ifdef SOLOHTTP_LINUX
  return static_cast<int64_t>(::send(fd, data, len, MSG_NOSIGNAL));
#else
  return static_cast<int64_t>(::send(fd, data, len, 0));
#endif
}

bool SendAll(NativeHandle fd, std::string_view data) noexcept {
  while (!data.empty()) {
    const auto sent = SafeSend(fd, data);
    if (sent < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(sent));
  }
  return true;
}

}  // namespace solohttp
