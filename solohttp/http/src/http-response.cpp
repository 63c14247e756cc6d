#include "solohttp/http-response.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "solohttp/http-constants.hpp"
#include "solohttp/http-status-code.hpp"
#include "solohttp/tolower-str.hpp"

namespace solohttp {

HttpResponse::HttpResponse(http::StatusCode statusCode, std::string_view reason)
    : _statusCode(statusCode), _reason(reason) {}

std::optional<std::string_view> HttpResponse::headerValue(std::string_view key) const noexcept {
  const auto it = std::ranges::find_if(
      _headers, [key](const HeaderField& field) { return CaseInsensitiveEqual(field.first, key); });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

void HttpResponse::setHeader(std::string_view key, std::string_view value) {
  const auto it = std::ranges::find_if(
      _headers, [key](const HeaderField& field) { return CaseInsensitiveEqual(field.first, key); });
  if (it == _headers.end()) {
    _headers.emplace_back(key, value);
  } else {
    it->first.assign(key);
    it->second.assign(value);
  }
}

void HttpResponse::setBodyBytes(std::span<const std::byte> body) {
  _body.assign(reinterpret_cast<const char*>(body.data()), body.size());
}

std::string HttpResponse::serialize() const {
  std::string out;

  // Status line: HTTP/1.1 404 Not Found\r\n
  fmt::format_to(std::back_inserter(out), "{} {} {}{}", http::HTTP11Sv, _statusCode, _reason, http::CRLF);

  // Content-Length is always derived from the actual body
  fmt::format_to(std::back_inserter(out), "{}{}{}{}", http::ContentLength, http::HeaderSep, _body.size(), http::CRLF);

  for (const auto& [key, value] : _headers) {
    if (CaseInsensitiveEqual(key, http::ContentLength)) {
      continue;
    }
    out.append(key);
    out.append(http::HeaderSep);
    out.append(value);
    out.append(http::CRLF);
  }

  out.append(http::CRLF);
  out.append(_body);
  return out;
}

}  // namespace solohttp
