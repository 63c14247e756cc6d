#include "solohttp/socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <stdexcept>
#include <string>

#include "solohttp/base-fd.hpp"
#include "solohttp/errno-throw.hpp"
#include "solohttp/log.hpp"
#include "solohttp/socket-ops.hpp"

namespace solohttp {

namespace {

int ComputeSocketType(Socket::Type type) {
  switch (type) {
    case Socket::Type::Stream:
      return SOCK_STREAM | SOCK_CLOEXEC;
    case Socket::Type::StreamNonBlock:
      return SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK;
    default:
      throw std::invalid_argument("Invalid socket type");
  }
}

}  // namespace

Socket::Socket(Type type, int protocol) : _baseFd(::socket(AF_INET, ComputeSocketType(type), protocol)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

void Socket::bindAndListen(const std::string& address, uint16_t& port, bool reuseAddr, int backlog) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (::inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
    throw std::invalid_argument("Invalid IPv4 bind address '" + address + "'");
  }

  const int fd = _baseFd.fd();
  if (reuseAddr && !SetReuseAddr(fd)) {
    throw_errno("setsockopt(SO_REUSEADDR) failed for fd # {}", fd);
  }
  if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == -1) {
    throw_errno("bind failed for {}:{}", address, port);
  }
  if (::listen(fd, backlog) == -1) {
    throw_errno("listen failed for {}:{}", address, port);
  }
  if (port == 0) {
    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == -1) {
      throw_errno("getsockname failed for fd # {}", fd);
    }
    port = ntohs(bound.sin_port);
  }
}

}  // namespace solohttp
