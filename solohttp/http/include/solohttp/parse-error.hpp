#pragma once

#include <cstdint>
#include <string_view>

namespace solohttp::http {

// Why a request could not be parsed. The causes are mutually exclusive: the first failing step wins.
enum class ParseError : uint8_t {
  // Not valid UTF-8, no CRLFCRLF separator, or a request line without path or version.
  InvalidRequest,
  // First request line token is not one of GET, POST, PUT, DELETE.
  InvalidMethod,
  // Empty request line.
  MissingRequestLine
};

constexpr std::string_view ParseErrorToStr(ParseError error) noexcept {
  switch (error) {
    case ParseError::InvalidRequest:
      return "Invalid request";
    case ParseError::InvalidMethod:
      return "Invalid method";
    case ParseError::MissingRequestLine:
      return "Missing request line";
    default:
      return "Unknown parse error";
  }
}

}  // namespace solohttp::http
