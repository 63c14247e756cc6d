#pragma once

#include <optional>
#include <string>

#include "solohttp/base-fd.hpp"
#include "solohttp/platform.hpp"
#include "solohttp/socket.hpp"

namespace solohttp {

// Simple RAII class wrapping a connection accepted on a listening socket.
class Connection {
 public:
  Connection() noexcept = default;

  // Take ownership of an existing connected fd.
  explicit Connection(BaseFd&& bd, std::string peerAddress = {}) noexcept;

  // Try to accept a pending connection on the (non-blocking) listening socket.
  // Returns std::nullopt when no connection is available yet (EAGAIN / EWOULDBLOCK, or EINTR).
  // Throws std::system_error on any other accept failure.
  [[nodiscard]] static std::optional<Connection> TryAccept(const Socket& socket);

  [[nodiscard]] NativeHandle fd() const noexcept { return _baseFd.fd(); }

  // Textual address of the peer ("ip:port"), empty if unknown.
  [[nodiscard]] const std::string& peerAddress() const noexcept { return _peerAddress; }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
  std::string _peerAddress;
};

}  // namespace solohttp
