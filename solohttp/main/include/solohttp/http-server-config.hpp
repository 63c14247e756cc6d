#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace solohttp {

struct HttpServerConfig {
  // ============================
  // Listener / socket parameters
  // ============================
  // IPv4 literal address to bind. "0.0.0.0" listens on every interface.
  std::string bindAddress{"127.0.0.1"};

  // TCP port to bind. 0 (default) lets the OS pick an ephemeral free port. After construction
  // you can retrieve the effective port via HttpServer::port().
  uint16_t port{0};

  // SO_REUSEADDR on the listening socket, allowing a quick restart on the same port.
  bool reuseAddr{true};

  // listen() backlog.
  int backlog{128};

  // ===========================
  // Accept loop / read behavior
  // ===========================
  // Sleep duration of the accept loop when no connection is pending. The shutdown flag is checked after each sleep,
  // so this is also the maximum latency of a shutdown request while idle.
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{100}};

  // Receive timeout of accepted connections. Each time it elapses without data the shutdown flag is checked and the
  // read is retried if no shutdown was requested.
  std::chrono::milliseconds readTimeout{std::chrono::milliseconds{500}};

  // Size of the buffer of the single read performed per connection. A request larger than this is truncated.
  std::size_t readBufferSize{1024};

  // Validates config. Throws std::invalid_argument if it is not valid.
  void validate() const;

  HttpServerConfig& withBindAddress(std::string bindAddress);

  HttpServerConfig& withPort(uint16_t port);

  HttpServerConfig& withReuseAddr(bool on = true);

  HttpServerConfig& withBacklog(int backlog);

  HttpServerConfig& withPollInterval(std::chrono::milliseconds pollInterval);

  HttpServerConfig& withReadTimeout(std::chrono::milliseconds readTimeout);

  HttpServerConfig& withReadBufferSize(std::size_t readBufferSize);

  bool operator==(const HttpServerConfig&) const noexcept = default;
};

}  // namespace solohttp
