#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "solohttp/http-constants.hpp"
#include "solohttp/http-status-code.hpp"

namespace solohttp {

// HttpResponse accumulates a status line, headers and a body, then serializes them in one contiguous HTTP/1.1
// message. The Content-Length header is always computed from the body at serialization time: a caller-supplied
// Content-Length header is stored but never emitted.
//
// Header names keep the case given by the caller. Setting a header whose name equals (case-insensitively) an
// existing one replaces it.
class HttpResponse {
 public:
  using HeaderField = std::pair<std::string, std::string>;

  HttpResponse(http::StatusCode statusCode, std::string_view reason);

  // 200 OK
  [[nodiscard]] static HttpResponse Ok() { return {http::StatusCodeOK, http::ReasonOK}; }

  // 404 Not Found
  [[nodiscard]] static HttpResponse NotFound() { return {http::StatusCodeNotFound, http::ReasonNotFound}; }

  [[nodiscard]] http::StatusCode status() const noexcept { return _statusCode; }

  [[nodiscard]] std::string_view reason() const noexcept { return _reason; }

  [[nodiscard]] const std::vector<HeaderField>& headers() const noexcept { return _headers; }

  // Get the value of given header (case-insensitive name lookup), if present.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const noexcept;

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  HttpResponse& header(std::string_view key, std::string_view value) & {
    setHeader(key, value);
    return *this;
  }

  HttpResponse&& header(std::string_view key, std::string_view value) && {
    setHeader(key, value);
    return std::move(*this);
  }

  // Set the body from text. Any previous body is replaced.
  HttpResponse& body(std::string_view body) & {
    _body.assign(body);
    return *this;
  }

  HttpResponse&& body(std::string_view body) && {
    _body.assign(body);
    return std::move(*this);
  }

  // Set the body from raw bytes. Any previous body is replaced.
  HttpResponse& body(std::span<const std::byte> body) & {
    setBodyBytes(body);
    return *this;
  }

  HttpResponse&& body(std::span<const std::byte> body) && {
    setBodyBytes(body);
    return std::move(*this);
  }

  // Serialize as "HTTP/1.1 <code> <reason>\r\nContent-Length: <n>\r\n<headers>\r\n<body>".
  [[nodiscard]] std::string serialize() const;

  bool operator==(const HttpResponse&) const = default;

 private:
  void setHeader(std::string_view key, std::string_view value);

  void setBodyBytes(std::span<const std::byte> body);

  http::StatusCode _statusCode;
  std::string _reason;
  std::vector<HeaderField> _headers;
  std::string _body;
};

}  // namespace solohttp
