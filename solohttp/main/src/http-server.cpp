#include "solohttp/http-server.hpp"

#include <exception>
#include <optional>
#include <system_error>
#include <thread>
#include <utility>

#include "solohttp/connection.hpp"
#include "solohttp/http-server-config.hpp"
#include "solohttp/internal/connection-handler.hpp"
#include "solohttp/log.hpp"
#include "solohttp/request-handler.hpp"
#include "solohttp/shutdown-flag.hpp"
#include "solohttp/socket.hpp"

namespace solohttp {

namespace {

HttpServerConfig ValidatedConfig(HttpServerConfig config) {
  config.validate();
  return config;
}

}  // namespace

HttpServer::HttpServer(HttpServerConfig config, RequestHandler handler)
    : _config(ValidatedConfig(std::move(config))),
      _listenSocket(Socket::Type::StreamNonBlock),  // accept never waits
      _handler(std::move(handler)) {
  _listenSocket.bindAndListen(_config.bindAddress, _config.port, _config.reuseAddr, _config.backlog);
  log::debug("Listening socket fd # {} bound to {}:{}", _listenSocket.fd(), _config.bindAddress, _config.port);
}

void HttpServer::run(const ShutdownFlag& shutdownFlag) {
  log::info("Server listening on {}:{}", _config.bindAddress, _config.port);

  // Busy polling: a non-blocking accept followed by a fixed sleep when nothing is pending. The shutdown flag is
  // checked before each accept attempt, hence after each sleep.
  while (!shutdownFlag.isShutdownRequested()) {
    std::optional<Connection> cnx;
    try {
      cnx = Connection::TryAccept(_listenSocket);
    } catch (const std::system_error& ex) {
      log::critical("Fatal accept error on port {}: {}", _config.port, ex.what());
      throw;
    }
    if (!cnx) {
      std::this_thread::sleep_for(_config.pollInterval);
      continue;
    }
    ++_stats.acceptedConnections;
    serveConnection(*cnx, shutdownFlag);
  }

  log::info("Server on port {} stopped", _config.port);
}

void HttpServer::serveConnection(Connection& cnx, const ShutdownFlag& shutdownFlag) {
  try {
    const auto outcome = internal::HandleConnection(cnx, _config, shutdownFlag, _handler);
    switch (outcome) {
      case internal::ConnectionOutcome::Responded:
        ++_stats.respondedConnections;
        break;
      case internal::ConnectionOutcome::RejectedMalformed:
        ++_stats.parseErrors;
        break;
      case internal::ConnectionOutcome::HandlerFailed:
        ++_stats.handlerErrors;
        break;
      case internal::ConnectionOutcome::PeerClosed:
        ++_stats.peerClosedConnections;
        break;
      case internal::ConnectionOutcome::Abandoned:
        ++_stats.abandonedConnections;
        break;
      default:
        break;
    }
    log::debug("Connection fd # {} from {}: {}", cnx.fd(), cnx.peerAddress(), internal::ConnectionOutcomeToStr(outcome));
  } catch (const std::exception& ex) {
    // A failing connection never stops the server
    ++_stats.failedConnections;
    log::error("Error while serving connection fd # {} from {}: {}", cnx.fd(), cnx.peerAddress(), ex.what());
  }
  cnx.close();
}

}  // namespace solohttp
