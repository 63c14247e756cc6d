#pragma once

#include <cstdint>

#include "solohttp/connection.hpp"
#include "solohttp/http-server-config.hpp"
#include "solohttp/request-handler.hpp"
#include "solohttp/server-stats.hpp"
#include "solohttp/shutdown-flag.hpp"
#include "solohttp/socket.hpp"

namespace solohttp {

// HttpServer
// ----------
// Single threaded HTTP/1.1 server serving one connection at a time.
//
// The listening socket is created, bound and put in listening state at construction time, so port() is known
// before run() is called. run() is a blocking accept loop: each accepted connection is served synchronously
// (one read, one response, then close) before the next accept. When no connection is pending, the loop sleeps
// for config.pollInterval and checks the shutdown flag.
//
// Failure handling:
//  - bind / listen failures are thrown from the constructor (std::system_error).
//  - an accept failure other than "no pending connection" is fatal: it is logged and thrown from run().
//  - any failure while serving a connection is logged and counted, then the loop goes on with the next one.
//
// Threading: HttpServer is not thread safe. The only cross-thread interaction is the ShutdownFlag given to run(),
// which can be set from any thread or from a signal handler (see SignalHandler).
class HttpServer {
 public:
  // Validates the config (std::invalid_argument) and binds the listening socket (std::system_error).
  // If handler is empty, DefaultRequestHandler is used.
  explicit HttpServer(HttpServerConfig config, RequestHandler handler = {});

  HttpServer(const HttpServer&) = delete;
  HttpServer(HttpServer&&) noexcept = default;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer& operator=(HttpServer&&) noexcept = default;

  ~HttpServer() = default;

  // Run the accept loop until shutdownFlag is set. If it is already set, returns after at most one poll interval
  // without accepting anything.
  // Throws std::system_error on a fatal accept error.
  void run(const ShutdownFlag& shutdownFlag);

  // Effective listening port (the ephemeral one chosen by the OS if config.port was 0).
  [[nodiscard]] uint16_t port() const noexcept { return _config.port; }

  [[nodiscard]] const HttpServerConfig& config() const noexcept { return _config; }

  // Snapshot of the counters. Not synchronized with run(): read it from the thread calling run(), or after run()
  // returned.
  [[nodiscard]] ServerStats stats() const noexcept { return _stats; }

 private:
  void serveConnection(Connection& cnx, const ShutdownFlag& shutdownFlag);

  HttpServerConfig _config;
  Socket _listenSocket;
  RequestHandler _handler;
  ServerStats _stats;
};

}  // namespace solohttp
