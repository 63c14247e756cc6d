#include "solohttp/internal/connection-handler.hpp"

#include <sys/socket.h>
#include <sys/types.h>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <exception>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "solohttp/connection.hpp"
#include "solohttp/errno-throw.hpp"
#include "solohttp/http-constants.hpp"
#include "solohttp/http-error-build.hpp"
#include "solohttp/http-method.hpp"
#include "solohttp/http-request.hpp"
#include "solohttp/http-response.hpp"
#include "solohttp/http-server-config.hpp"
#include "solohttp/http-status-code.hpp"
#include "solohttp/log.hpp"
#include "solohttp/parse-error.hpp"
#include "solohttp/platform.hpp"
#include "solohttp/request-handler.hpp"
#include "solohttp/shutdown-flag.hpp"
#include "solohttp/socket-ops.hpp"

namespace solohttp::internal {

namespace {

HttpResponse InternalServerError(std::string_view body) {
  return HttpResponse(http::StatusCodeInternalServerError, http::ReasonInternalServerError)
      .header(http::ContentType, http::ContentTypeTextPlain)
      .body(body);
}

std::pair<HttpResponse, ConnectionOutcome> CallHandler(const HttpRequest& request, const RequestHandler& handler) {
  try {
    return {handler ? handler(request) : DefaultRequestHandler(request), ConnectionOutcome::Responded};
  } catch (const std::exception& ex) {
    log::error("Exception in request handler: {}", ex.what());
    return {InternalServerError(ex.what()), ConnectionOutcome::HandlerFailed};
  } catch (...) {
    log::error("Unknown exception in request handler");
    return {InternalServerError("Unknown error"), ConnectionOutcome::HandlerFailed};
  }
}

}  // namespace

std::string_view ConnectionOutcomeToStr(ConnectionOutcome outcome) noexcept {
  switch (outcome) {
    case ConnectionOutcome::Responded:
      return "responded";
    case ConnectionOutcome::RejectedMalformed:
      return "rejected malformed request";
    case ConnectionOutcome::HandlerFailed:
      return "handler failed";
    case ConnectionOutcome::PeerClosed:
      return "closed by peer";
    case ConnectionOutcome::Abandoned:
      return "abandoned";
    default:
      return "unknown";
  }
}

ConnectionOutcome HandleConnection(Connection& cnx, const HttpServerConfig& config, const ShutdownFlag& shutdownFlag,
                                   const RequestHandler& handler) {
  const NativeHandle fd = cnx.fd();
  if (!SetBlocking(fd)) {
    throw_errno("Unable to set fd # {} blocking", fd);
  }
  if (!SetRecvTimeout(fd, config.readTimeout)) {
    throw_errno("Unable to set receive timeout on fd # {}", fd);
  }

  std::string buffer(config.readBufferSize, '\0');
  ssize_t nbRead;
  while (true) {
    nbRead = ::recv(fd, buffer.data(), buffer.size(), 0);
    if (nbRead >= 0) {
      break;
    }
    const int err = errno;
    if (!IsWouldBlock(err) && err != EINTR) {
      throw_errno("recv failed on fd # {}", fd);
    }
    if (shutdownFlag.isShutdownRequested()) {
      log::warn("Shutdown requested while waiting for data on fd # {}, abandoning connection", fd);
      return ConnectionOutcome::Abandoned;
    }
    log::trace("No data yet on fd # {} ({}), retrying", fd, std::strerror(err));
  }

  if (nbRead == 0) {
    log::debug("Peer {} closed fd # {} without sending a request", cnx.peerAddress(), fd);
    return ConnectionOutcome::PeerClosed;
  }

  const std::string_view data(buffer.data(), static_cast<std::size_t>(nbRead));
  log::trace("Received {} bytes on fd # {}", data.size(), fd);

  auto parsed = HttpRequest::Parse(data);

  std::string serialized;
  ConnectionOutcome outcome;
  if (const auto* pError = std::get_if<http::ParseError>(&parsed)) {
    log::warn("Bad request from {} on fd # {}: {}", cnx.peerAddress(), fd, http::ParseErrorToStr(*pError));
    serialized = BuildParseErrorResponse(*pError).serialize();
    outcome = ConnectionOutcome::RejectedMalformed;
  } else {
    const auto& request = std::get<HttpRequest>(parsed);
    auto [response, handlerOutcome] = CallHandler(request, handler);
    log::debug("{} {} {} -> {}", http::MethodToStr(request.method()), request.path(), request.version(),
               response.status());
    serialized = response.serialize();
    outcome = handlerOutcome;
  }

  if (!SendAll(fd, serialized)) {
    throw_errno("Unable to send {} bytes response on fd # {}", serialized.size(), fd);
  }
  return outcome;
}

}  // namespace solohttp::internal
