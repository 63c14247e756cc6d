#pragma once

#include <string_view>

#include "solohttp/http-status-code.hpp"

namespace solohttp::http {

// Header field names are case-insensitive (RFC 9110 §5.1). They are stored here in their conventional canonical
// form for emission; request header keys are folded to lowercase by the parser.

// Version
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

// Standard Header Field Names
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Host = "Host";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

// Content types
inline constexpr std::string_view ContentTypeTextPlain = "text/plain";

// Reason phrases
inline constexpr std::string_view ReasonOK = "OK";
inline constexpr std::string_view ReasonCreated = "Created";
inline constexpr std::string_view ReasonNoContent = "No Content";
inline constexpr std::string_view ReasonBadRequest = "Bad Request";
inline constexpr std::string_view ReasonNotFound = "Not Found";
inline constexpr std::string_view ReasonMethodNotAllowed = "Method Not Allowed";
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";

// Returns the standard reason phrase for the status codes known by solohttp, an empty string otherwise.
constexpr std::string_view ReasonPhraseFor(StatusCode statusCode) noexcept {
  switch (statusCode) {
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeCreated:
      return ReasonCreated;
    case StatusCodeNoContent:
      return ReasonNoContent;
    case StatusCodeBadRequest:
      return ReasonBadRequest;
    case StatusCodeNotFound:
      return ReasonNotFound;
    case StatusCodeMethodNotAllowed:
      return ReasonMethodNotAllowed;
    case StatusCodeInternalServerError:
      return ReasonInternalServerError;
    default:
      return {};
  }
}

}  // namespace solohttp::http
