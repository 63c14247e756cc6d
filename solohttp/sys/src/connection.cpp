#include "solohttp/connection.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <optional>
#include <string>
#include <utility>

#include "solohttp/base-fd.hpp"
#include "solohttp/errno-throw.hpp"
#include "solohttp/log.hpp"
#include "solohttp/platform.hpp"
#include "solohttp/socket.hpp"

namespace solohttp {

namespace {

std::string PeerToString(const sockaddr_in& addr) {
  char buf[INET_ADDRSTRLEN]{};
  if (::inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf)) == nullptr) {
    return {};
  }
  return std::string(buf) + ':' + std::to_string(ntohs(addr.sin_port));
}

}  // namespace

Connection::Connection(BaseFd&& bd, std::string peerAddress) noexcept
    : _baseFd(std::move(bd)), _peerAddress(std::move(peerAddress)) {}

std::optional<Connection> Connection::TryAccept(const Socket& socket) {
  sockaddr_in inAddr{};
  socklen_t inLen = sizeof(inAddr);
  const int fd = ::accept4(socket.fd(), reinterpret_cast<sockaddr*>(&inAddr), &inLen, SOCK_CLOEXEC);
  if (fd < 0) {
    const auto savedErr = errno;
    if (IsWouldBlock(savedErr) || savedErr == EINTR) {
      log::trace("Connection accept would block: {} - this is expected if no pending connections",
                 std::strerror(savedErr));
      return std::nullopt;
    }
    throw_errno("Connection accept failed for socket fd # {}", socket.fd());
  }
  log::debug("Connection fd # {} opened", fd);
  return Connection(BaseFd(fd), PeerToString(inAddr));
}

}  // namespace solohttp
