#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>

#include <solohttp/solohttp.hpp>

using namespace solohttp;

namespace {

constexpr int kUsageExitCode = 2;

int Usage(const char *progName) {
  std::cerr << "Usage: " << progName << " <host> <port> [trace|debug|info|warn|err|critical|off]\n";
  return kUsageExitCode;
}

}  // namespace

int main(int argc, char **argv) {
  if (argc < 3 || argc > 4) {
    return Usage(argv[0]);
  }

  const std::string_view portStr(argv[2]);
  uint16_t port = 0;
  const auto [ptr, errc] = std::from_chars(portStr.data(), portStr.data() + portStr.size(), port);
  if (errc != std::errc{} || ptr != portStr.data() + portStr.size()) {
    std::cerr << "Invalid port number: " << portStr << "\n";
    return Usage(argv[0]);
  }

  if (argc == 4) {
    const auto level = log::level::from_str(argv[3]);
    if (level == log::level::off && std::strcmp(argv[3], "off") != 0) {
      std::cerr << "Invalid log level: " << argv[3] << "\n";
      return Usage(argv[0]);
    }
    log::set_level(level);
  }

  ShutdownFlag shutdownFlag;

  try {
    // Ctrl+C / SIGTERM request a graceful shutdown
    SignalHandler::Enable(shutdownFlag);

    HttpServer server(HttpServerConfig{}.withBindAddress(argv[1]).withPort(port), [](const HttpRequest &req) {
      if (req.path() == "/") {
        return HttpResponse::Ok()
            .header(http::ContentType, http::ContentTypeTextPlain)
            .body("Hello from solohttp! Method: " + std::string(http::MethodToStr(req.method())) + "\n");
      }
      return HttpResponse::NotFound();
    });
    server.run(shutdownFlag);  // blocking run, until Ctrl+C

    log::info("Server stopped");
    server.stats().for_each_field([](std::string_view name, uint64_t value) { log::info("  {}: {}", name, value); });
  } catch (const std::exception &e) {
    std::cerr << "Server encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
