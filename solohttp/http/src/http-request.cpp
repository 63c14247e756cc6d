#include "solohttp/http-request.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "http-method-parse.hpp"
#include "solohttp/http-constants.hpp"
#include "solohttp/http-method.hpp"
#include "solohttp/parse-error.hpp"
#include "solohttp/utf8-tolower.hpp"
#include "solohttp/utf8-validate.hpp"

namespace solohttp {

namespace {

constexpr bool IsAsciiSpace(char ch) noexcept {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

// Returns the next whitespace separated token of str (empty if none), advancing str past it.
std::string_view NextToken(std::string_view& str) {
  std::size_t pos = 0;
  while (pos < str.size() && IsAsciiSpace(str[pos])) {
    ++pos;
  }
  const std::size_t beg = pos;
  while (pos < str.size() && !IsAsciiSpace(str[pos])) {
    ++pos;
  }
  const std::string_view token = str.substr(beg, pos - beg);
  str.remove_prefix(pos);
  return token;
}

// Returns the next line of str without its line terminator ("\n" or "\r\n"), advancing str past it.
std::string_view NextLine(std::string_view& str) {
  const auto lf = str.find('\n');
  std::string_view line = str.substr(0, lf);
  str.remove_prefix(lf == std::string_view::npos ? str.size() : lf + 1U);
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1U);
  }
  return line;
}

}  // namespace

HttpRequest::HttpRequest(http::Method method, std::string_view path, std::string_view version, HeadersMap headers,
                         std::string_view body)
    : _method(method), _path(path), _version(version), _headers(std::move(headers)), _body(body) {}

HttpRequest::ParseResult HttpRequest::Parse(std::string_view data) {
  if (!IsValidUtf8(data)) {
    return http::ParseError::InvalidRequest;
  }

  const auto headEnd = data.find(http::DoubleCRLF);
  if (headEnd == std::string_view::npos) {
    return http::ParseError::InvalidRequest;
  }
  std::string_view head = data.substr(0, headEnd);
  const std::string_view body = data.substr(headEnd + http::DoubleCRLF.size());

  std::string_view requestLine = NextLine(head);

  const std::string_view methodStr = NextToken(requestLine);
  if (methodStr.empty()) {
    return http::ParseError::MissingRequestLine;
  }
  const std::string_view path = NextToken(requestLine);
  if (path.empty()) {
    return http::ParseError::InvalidRequest;
  }
  const std::string_view version = NextToken(requestLine);
  if (version.empty()) {
    return http::ParseError::InvalidRequest;
  }

  const auto optMethod = http::MethodStrToOptEnum(methodStr);
  if (!optMethod) {
    return http::ParseError::InvalidMethod;
  }

  HeadersMap headers;
  while (!head.empty()) {
    const std::string_view line = NextLine(head);
    const auto sep = line.find(http::HeaderSep);
    if (sep == std::string_view::npos) {
      // not a "key: value" line, skip it
      continue;
    }
    headers.insert_or_assign(ToLowerUtf8Copy(line.substr(0, sep)), std::string(line.substr(sep + http::HeaderSep.size())));
  }

  return HttpRequest(*optMethod, path, version, std::move(headers), body);
}

std::optional<std::string_view> HttpRequest::headerValue(std::string_view key) const {
  const auto it = _headers.find(ToLowerUtf8Copy(key));
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

}  // namespace solohttp
