#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

#include "solohttp/http-method.hpp"
#include "solohttp/parse-error.hpp"

namespace solohttp {

// An immutable, fully owned HTTP request built from the bytes of a single read.
class HttpRequest {
 public:
  // Lowercase header name -> value. Duplicate names keep the last value.
  using HeadersMap = std::unordered_map<std::string, std::string>;

  using ParseResult = std::variant<HttpRequest, http::ParseError>;

  // Parse a request from the exact bytes received. Steps, first failure wins:
  //  - data must be valid UTF-8                                     -> InvalidRequest
  //  - data must contain CRLFCRLF, what follows is the raw body      -> InvalidRequest
  //  - the request line must have a first token                      -> MissingRequestLine
  //  - it must have path and version tokens                          -> InvalidRequest
  //  - the first token must be exactly GET, POST, PUT or DELETE      -> InvalidMethod
  // Request line tokens are separated by ASCII whitespace only, so U+00A0 and other Unicode spaces belong
  // to the token they appear in.
  // Path and version are taken verbatim. Each following "key: value" line is stored with its key lowercased
  // by ToLowerUtf8Copy.
  // No further semantic validation is performed (no chunked decoding, no Content-Length check).
  [[nodiscard]] static ParseResult Parse(std::string_view data);

  [[nodiscard]] http::Method method() const noexcept { return _method; }

  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  [[nodiscard]] std::string_view version() const noexcept { return _version; }

  [[nodiscard]] const HeadersMap& headers() const noexcept { return _headers; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Get the value of given header, looked up case-insensitively.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const;

  bool operator==(const HttpRequest&) const = default;

 private:
  HttpRequest(http::Method method, std::string_view path, std::string_view version, HeadersMap headers,
              std::string_view body);

  http::Method _method;
  std::string _path;
  std::string _version;
  HeadersMap _headers;
  std::string _body;
};

}  // namespace solohttp
