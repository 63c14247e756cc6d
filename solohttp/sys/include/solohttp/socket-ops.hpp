#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "solohttp/platform.hpp"

namespace solohttp {

// Thin wrappers centralising socket system calls so that higher-level modules (http, main)
// never include platform networking headers directly.
// Unless stated otherwise they return true on success and leave errno set on failure.

// Counterpart of SetBlocking for descriptors not created with SOCK_NONBLOCK (the listener is).
bool SetNonBlocking(NativeHandle fd) noexcept;

bool SetBlocking(NativeHandle fd) noexcept;

// Set SO_RCVTIMEO. A blocking recv() then fails with EAGAIN / EWOULDBLOCK once the timeout elapses.
bool SetRecvTimeout(NativeHandle fd, std::chrono::milliseconds timeout) noexcept;

bool SetReuseAddr(NativeHandle fd) noexcept;

// Tells whether address is a dotted-decimal IPv4 literal accepted by bind ("127.0.0.1", "0.0.0.0").
[[nodiscard]] bool IsIpv4Literal(const std::string& address) noexcept;

// Send data on a connected socket without raising SIGPIPE if the peer went away.
// Returns the number of bytes sent, or -1 on error (errno is set).
int64_t SafeSend(NativeHandle fd, const void* data, std::size_t len) noexcept;

inline int64_t SafeSend(NativeHandle fd, std::string_view data) noexcept {
  return SafeSend(fd, data.data(), data.size());
}

// Send all of data on a blocking socket, looping over partial writes and retrying on EINTR.
// Returns false on the first unrecoverable error (errno is set).
bool SendAll(NativeHandle fd, std::string_view data) noexcept;

}  // namespace solohttp
