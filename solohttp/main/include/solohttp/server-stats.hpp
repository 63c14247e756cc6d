#pragma once

#include <cstdint>

namespace solohttp {

// Counters of a HttpServer since its construction.
struct ServerStats {
  // Introspection enumeration of the fields, in declaration order.
  template <class F>
  void for_each_field(F&& fun) const {
    fun("acceptedConnections", acceptedConnections);
    fun("respondedConnections", respondedConnections);
    fun("parseErrors", parseErrors);
    fun("handlerErrors", handlerErrors);
    fun("peerClosedConnections", peerClosedConnections);
    fun("abandonedConnections", abandonedConnections);
    fun("failedConnections", failedConnections);
  }

  // Connections returned by accept.
  uint64_t acceptedConnections{};
  // Connections that received a response from the request handler.
  uint64_t respondedConnections{};
  // Connections that received a 400 Bad Request because their request could not be parsed.
  uint64_t parseErrors{};
  // Connections that received a 500 Internal Server Error because the request handler threw.
  uint64_t handlerErrors{};
  // Connections closed by the peer before sending anything.
  uint64_t peerClosedConnections{};
  // Connections dropped without response because a shutdown was requested while waiting for data.
  uint64_t abandonedConnections{};
  // Connections whose handling failed with an error (socket setup, read or write failure).
  uint64_t failedConnections{};

  bool operator==(const ServerStats&) const noexcept = default;
};

}  // namespace solohttp
