#include "solohttp/http-response.hpp"

#include <gtest/gtest.h>

#include <array>
#include <charconv>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "solohttp/http-constants.hpp"
#include "solohttp/http-status-code.hpp"

namespace solohttp {

namespace {

// Extract every Content-Length value found in the serialized header block.
std::vector<std::size_t> ContentLengthValues(std::string_view serialized) {
  std::vector<std::size_t> values;
  const std::string_view head = serialized.substr(0, serialized.find(http::DoubleCRLF));
  std::size_t pos = 0;
  while ((pos = head.find("Content-Length: ", pos)) != std::string_view::npos) {
    pos += std::string_view("Content-Length: ").size();
    std::size_t value = 0;
    std::from_chars(head.data() + pos, head.data() + head.size(), value);
    values.push_back(value);
  }
  return values;
}

}  // namespace

TEST(HttpResponse, OkWithTextBody) {
  EXPECT_EQ(HttpResponse::Ok().body("hi").serialize(), "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nhi");
}

TEST(HttpResponse, ConvenienceConstructors) {
  const auto ok = HttpResponse::Ok();
  EXPECT_EQ(ok.status(), http::StatusCodeOK);
  EXPECT_EQ(ok.reason(), "OK");
  EXPECT_TRUE(ok.headers().empty());
  EXPECT_TRUE(ok.body().empty());

  const auto notFound = HttpResponse::NotFound();
  EXPECT_EQ(notFound.status(), http::StatusCodeNotFound);
  EXPECT_EQ(notFound.reason(), "Not Found");
  EXPECT_EQ(notFound.serialize(), "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n");
}

TEST(HttpResponse, CustomStatusLine) {
  HttpResponse resp(http::StatusCodeCreated, http::ReasonCreated);
  EXPECT_EQ(resp.serialize(), "HTTP/1.1 201 Created\r\nContent-Length: 0\r\n\r\n");
}

TEST(HttpResponse, HeadersAreEmittedWithCallerCase) {
  const auto serialized = HttpResponse::Ok().header("X-Custom-Header", "Value").body("abc").serialize();
  EXPECT_EQ(serialized, "HTTP/1.1 200 OK\r\nContent-Length: 3\r\nX-Custom-Header: Value\r\n\r\nabc");
}

TEST(HttpResponse, SettingSameHeaderReplacesValue) {
  HttpResponse resp(http::StatusCodeOK, "OK");
  resp.header("Content-Type", "text/html");
  resp.header("content-type", "text/plain");
  ASSERT_EQ(resp.headers().size(), 1U);
  EXPECT_EQ(resp.headers().front().first, "content-type");
  EXPECT_EQ(resp.headerValue("CONTENT-TYPE"), "text/plain");
  EXPECT_FALSE(resp.headerValue("X-Missing").has_value());
}

TEST(HttpResponse, SeveralHeaders) {
  const auto serialized = HttpResponse::Ok().header("A", "1").header("B", "2").header("C", "3").serialize();
  EXPECT_NE(serialized.find("\r\nA: 1\r\n"), std::string::npos);
  EXPECT_NE(serialized.find("\r\nB: 2\r\n"), std::string::npos);
  EXPECT_NE(serialized.find("\r\nC: 3\r\n"), std::string::npos);
  EXPECT_TRUE(serialized.ends_with("\r\n\r\n"));
}

TEST(HttpResponse, CallerContentLengthIsNeverTrusted) {
  const auto serialized = HttpResponse::Ok().header("Content-Length", "999").body("four").serialize();
  EXPECT_EQ(serialized, "HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\nfour");

  const auto lowerCase = HttpResponse::Ok().header("content-length", "0").body("twelve bytes").serialize();
  const auto values = ContentLengthValues(lowerCase);
  ASSERT_EQ(values.size(), 1U);
  EXPECT_EQ(values.front(), 12U);
  EXPECT_EQ(lowerCase.find("content-length"), std::string::npos);
}

TEST(HttpResponse, ContentLengthMatchesBodyForManySizes) {
  for (std::size_t sz : {0UL, 1UL, 9UL, 10UL, 99UL, 100UL, 1023UL, 1024UL, 65536UL}) {
    const std::string body(sz, 'x');
    const auto serialized = HttpResponse::Ok().body(body).serialize();
    const auto values = ContentLengthValues(serialized);
    ASSERT_EQ(values.size(), 1U);
    EXPECT_EQ(values.front(), sz);
    EXPECT_EQ(serialized.size() - serialized.find(http::DoubleCRLF) - http::DoubleCRLF.size(), sz);
  }
}

TEST(HttpResponse, ByteBodyIsCopiedUnmodified) {
  static constexpr std::array<std::byte, 5> kBytes{std::byte{0x00}, std::byte{0xFF}, std::byte{'\r'},
                                                   std::byte{'\n'}, std::byte{0x7F}};
  const auto resp = HttpResponse::Ok().body(std::span<const std::byte>(kBytes));
  ASSERT_EQ(resp.body().size(), kBytes.size());
  EXPECT_EQ(resp.body()[0], '\0');
  EXPECT_EQ(static_cast<unsigned char>(resp.body()[1]), 0xFFU);

  const auto serialized = resp.serialize();
  EXPECT_TRUE(serialized.starts_with("HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\n"));
  EXPECT_EQ(serialized.substr(serialized.size() - 5), resp.body());
}

TEST(HttpResponse, BodyReplacesPreviousBody) {
  HttpResponse resp = HttpResponse::Ok();
  resp.body("a much longer first body");
  resp.body("short");
  EXPECT_EQ(resp.body(), "short");
  EXPECT_EQ(resp.serialize(), "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nshort");
}

}  // namespace solohttp
