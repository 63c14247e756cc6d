#include "solohttp/http-server-config.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "solohttp/socket-ops.hpp"

namespace solohttp {

HttpServerConfig& HttpServerConfig::withBindAddress(std::string bindAddress) {
  this->bindAddress = std::move(bindAddress);
  return *this;
}

HttpServerConfig& HttpServerConfig::withPort(uint16_t port) {
  this->port = port;
  return *this;
}

HttpServerConfig& HttpServerConfig::withReuseAddr(bool on) {
  reuseAddr = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withBacklog(int backlog) {
  this->backlog = backlog;
  return *this;
}

HttpServerConfig& HttpServerConfig::withPollInterval(std::chrono::milliseconds pollInterval) {
  this->pollInterval = pollInterval;
  return *this;
}

HttpServerConfig& HttpServerConfig::withReadTimeout(std::chrono::milliseconds readTimeout) {
  this->readTimeout = readTimeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withReadBufferSize(std::size_t readBufferSize) {
  this->readBufferSize = readBufferSize;
  return *this;
}

void HttpServerConfig::validate() const {
  if (!IsIpv4Literal(bindAddress)) {
    throw std::invalid_argument(fmt::format("bindAddress '{}' is not an IPv4 address", bindAddress));
  }
  if (backlog <= 0) {
    throw std::invalid_argument("backlog must be > 0");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("pollInterval must be > 0");
  }
  if (readTimeout.count() <= 0) {
    throw std::invalid_argument("readTimeout must be > 0");
  }
  if (readBufferSize == 0) {
    throw std::invalid_argument("readBufferSize must be > 0");
  }
}

}  // namespace solohttp
