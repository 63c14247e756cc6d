#pragma once

#include <cstdint>
#include <string_view>

#include "solohttp/connection.hpp"
#include "solohttp/http-server-config.hpp"
#include "solohttp/request-handler.hpp"
#include "solohttp/shutdown-flag.hpp"

namespace solohttp::internal {

enum class ConnectionOutcome : uint8_t {
  // A request was parsed and the handler response was sent.
  Responded,
  // The received bytes were not a valid request, a 400 Bad Request was sent.
  RejectedMalformed,
  // The request handler threw, a 500 Internal Server Error was sent.
  HandlerFailed,
  // The peer closed the connection without sending anything, nothing was sent.
  PeerClosed,
  // Shutdown was requested while waiting for data, nothing was sent.
  Abandoned
};

std::string_view ConnectionOutcomeToStr(ConnectionOutcome outcome) noexcept;

// Serve a single freshly accepted connection, synchronously.
// The connection is switched to blocking mode with a receive timeout of config.readTimeout, then a single read of at
// most config.readBufferSize bytes is performed. Each time the timeout elapses the shutdown flag is checked: the
// connection is abandoned if it is set, the read is retried otherwise.
// The received bytes are parsed and exactly one response is written back. The connection is left open, closing it is
// the caller's job.
// Throws std::system_error if the socket cannot be configured, on a read error other than a timeout, or if the response
// cannot be sent.
ConnectionOutcome HandleConnection(Connection& cnx, const HttpServerConfig& config, const ShutdownFlag& shutdownFlag,
                                   const RequestHandler& handler);

}  // namespace solohttp::internal
