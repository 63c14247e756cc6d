#include "solohttp/internal/connection-handler.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

#include "solohttp/base-fd.hpp"
#include "solohttp/connection.hpp"
#include "solohttp/http-method.hpp"
#include "solohttp/http-request.hpp"
#include "solohttp/http-response.hpp"
#include "solohttp/http-server-config.hpp"
#include "solohttp/shutdown-flag.hpp"
#include "solohttp/socket-ops.hpp"
#include "solohttp/sys-test-support.hpp"
#include "solohttp/test_util.hpp"

using namespace std::chrono_literals;

namespace {

using RecvFn = ssize_t (*)(int, void*, std::size_t, int);

solohttp::test::SyscallScript gRecvScript;

}  // namespace

extern "C" ssize_t recv(int fd, void* buf, std::size_t len, int flags) {
  static RecvFn realRecv = solohttp::test::RealFunction<RecvFn>("recv");
  if (const auto action = gRecvScript.next(fd)) {
    return action->apply();
  }
  return realRecv(fd, buf, len, flags);
}

namespace solohttp::internal {

class ConnectionHandlerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    int fds[2];
    ASSERT_EQ(0, ::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds));
    cnx = Connection(BaseFd(fds[0]), "unix-peer");
    client = BaseFd(fds[1]);
    ASSERT_TRUE(SetRecvTimeout(client.fd(), 2s));
    config.withReadTimeout(20ms);
  }

  void TearDown() override { gRecvScript.clear(); }

  void clientSend(std::string_view data) const { ASSERT_TRUE(test::sendAll(client.fd(), data)); }

  // Everything written back by the handler, once the server side is closed.
  std::string clientReceived() {
    cnx.close();
    return test::recvUntilClosed(client.fd());
  }

  ConnectionOutcome handle(const RequestHandler& handler = {}) {
    return HandleConnection(cnx, config, shutdownFlag, handler);
  }

  Connection cnx;
  BaseFd client;
  HttpServerConfig config;
  ShutdownFlag shutdownFlag;
};

TEST_F(ConnectionHandlerTest, DefaultHandlerGreetsRoot) {
  clientSend("GET / HTTP/1.1\r\nHost: localhost\r\n\r\n");
  EXPECT_EQ(handle(), ConnectionOutcome::Responded);
  const auto resp = test::parseResponse(clientReceived());
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->statusCode, 200);
  EXPECT_EQ(resp->headers.at("Content-Length"), std::to_string(resp->body.size()));
}

TEST_F(ConnectionHandlerTest, DefaultHandlerNotFound) {
  clientSend("GET /missing HTTP/1.1\r\n\r\n");
  EXPECT_EQ(handle(), ConnectionOutcome::Responded);
  EXPECT_EQ(clientReceived(), "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n");
}

TEST_F(ConnectionHandlerTest, CustomHandlerSeesParsedRequest) {
  clientSend("POST /echo HTTP/1.1\r\nX-Token: abc\r\n\r\npayload");
  const auto outcome = handle([](const HttpRequest& req) {
    EXPECT_EQ(req.method(), http::Method::POST);
    EXPECT_EQ(req.path(), "/echo");
    EXPECT_EQ(req.headerValue("x-token"), "abc");
    return HttpResponse::Ok().body(req.body());
  });
  EXPECT_EQ(outcome, ConnectionOutcome::Responded);
  EXPECT_EQ(clientReceived(), "HTTP/1.1 200 OK\r\nContent-Length: 7\r\n\r\npayload");
}

TEST_F(ConnectionHandlerTest, MalformedRequestGets400) {
  clientSend("FOO / HTTP/1.1\r\n\r\n");
  bool called = false;
  const auto outcome = handle([&called](const HttpRequest&) {
    called = true;
    return HttpResponse::Ok();
  });
  EXPECT_EQ(outcome, ConnectionOutcome::RejectedMalformed);
  EXPECT_FALSE(called);
  EXPECT_EQ(clientReceived(),
            "HTTP/1.1 400 Bad Request\r\nContent-Length: 14\r\nContent-Type: text/plain\r\n\r\nInvalid method");
}

TEST_F(ConnectionHandlerTest, RequestWithoutSeparatorGets400) {
  clientSend("GET / HTTP/1.1\r\nHost: x");
  EXPECT_EQ(handle(), ConnectionOutcome::RejectedMalformed);
  const auto resp = test::parseResponse(clientReceived());
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->statusCode, 400);
  EXPECT_EQ(resp->body, "Invalid request");
}

TEST_F(ConnectionHandlerTest, OnlyReadBufferSizeBytesAreParsed) {
  config.withReadBufferSize(16);
  // the separator lies beyond the 16 first bytes
  clientSend("GET / HTTP/1.1\r\nHost: example.com\r\n\r\n");
  EXPECT_EQ(handle(), ConnectionOutcome::RejectedMalformed);
  const auto resp = test::parseResponse(clientReceived());
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->body, "Invalid request");
}

TEST_F(ConnectionHandlerTest, ThrowingHandlerGets500) {
  clientSend("GET /boom HTTP/1.1\r\n\r\n");
  const auto outcome = handle([](const HttpRequest&) -> HttpResponse { throw std::runtime_error("kaboom"); });
  EXPECT_EQ(outcome, ConnectionOutcome::HandlerFailed);
  const auto resp = test::parseResponse(clientReceived());
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->statusCode, 500);
  EXPECT_EQ(resp->body, "kaboom");
}

TEST_F(ConnectionHandlerTest, NonStandardThrowGets500) {
  clientSend("GET / HTTP/1.1\r\n\r\n");
  const auto outcome = handle([](const HttpRequest&) -> HttpResponse { throw 42; });
  EXPECT_EQ(outcome, ConnectionOutcome::HandlerFailed);
  const auto resp = test::parseResponse(clientReceived());
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->statusCode, 500);
  EXPECT_EQ(resp->body, "Unknown error");
}

TEST_F(ConnectionHandlerTest, PeerClosingWithoutDataGetsNothing) {
  ::shutdown(client.fd(), SHUT_WR);
  EXPECT_EQ(handle(), ConnectionOutcome::PeerClosed);
  EXPECT_TRUE(clientReceived().empty());
}

TEST_F(ConnectionHandlerTest, TimeoutWithShutdownRequestedAbandons) {
  shutdownFlag.requestShutdown();
  const auto start = std::chrono::steady_clock::now();
  EXPECT_EQ(handle(), ConnectionOutcome::Abandoned);
  EXPECT_GE(std::chrono::steady_clock::now() - start, 15ms);
  EXPECT_TRUE(clientReceived().empty());
}

TEST_F(ConnectionHandlerTest, ShutdownRequestedWhileWaitingAbandons) {
  std::jthread requester([this] {
    std::this_thread::sleep_for(60ms);
    shutdownFlag.requestShutdown();
  });
  EXPECT_EQ(handle(), ConnectionOutcome::Abandoned);
}

TEST_F(ConnectionHandlerTest, TimeoutWithoutShutdownRetriesRead) {
  std::jthread sender([this] {
    // several read timeouts elapse before the request arrives
    std::this_thread::sleep_for(80ms);
    test::sendAll(client.fd(), "GET / HTTP/1.1\r\n\r\n");
  });
  EXPECT_EQ(handle(), ConnectionOutcome::Responded);
  sender.join();
  const auto resp = test::parseResponse(clientReceived());
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->statusCode, 200);
}

TEST_F(ConnectionHandlerTest, InterruptedReadIsRetried) {
  gRecvScript.add(cnx.fd(), {test::Fail(EINTR), test::Fail(EAGAIN)});
  clientSend("GET / HTTP/1.1\r\n\r\n");
  EXPECT_EQ(handle(), ConnectionOutcome::Responded);
}

TEST_F(ConnectionHandlerTest, ReadErrorThrows) {
  gRecvScript.add(cnx.fd(), {test::Fail(ECONNRESET)});
  clientSend("GET / HTTP/1.1\r\n\r\n");
  try {
    handle();
  } catch (const std::system_error& ex) {
    EXPECT_EQ(ex.code().value(), ECONNRESET);
    return;
  }
  FAIL() << "Expected std::system_error";
}

TEST_F(ConnectionHandlerTest, ResponseWriteFailureThrows) {
  clientSend("GET / HTTP/1.1\r\n\r\n");
  client.close();
  EXPECT_THROW(handle(), std::system_error);
}

TEST(ConnectionOutcome, ToStr) {
  EXPECT_EQ(ConnectionOutcomeToStr(ConnectionOutcome::Responded), "responded");
  EXPECT_EQ(ConnectionOutcomeToStr(ConnectionOutcome::Abandoned), "abandoned");
  EXPECT_EQ(ConnectionOutcomeToStr(ConnectionOutcome::PeerClosed), "closed by peer");
}

}  // namespace solohttp::internal
