#pragma once

#include <cstdint>
#include <string>

#include "solohttp/base-fd.hpp"
#include "solohttp/platform.hpp"

namespace solohttp {

// Simple RAII class wrapping an IPv4 TCP socket file descriptor.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Construct a socket with the given type and protocol.
  // Throws std::invalid_argument on an unknown type, std::system_error on failure.
  explicit Socket(Type type, int protocol = 0);

  [[nodiscard]] NativeHandle fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Bind to the given IPv4 literal address and start listening. If port is 0, an ephemeral port is chosen and
  // written back into the argument.
  // Throws std::invalid_argument if address is not an IPv4 literal, std::system_error on failure.
  void bindAndListen(const std::string& address, uint16_t& port, bool reuseAddr, int backlog);

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace solohttp
