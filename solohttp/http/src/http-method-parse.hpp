#pragma once

#include <optional>
#include <string_view>

#include "solohttp/http-method.hpp"

namespace solohttp::http {

// Attempt to parse a HTTP method.
// Matching is exact and case-sensitive (RFC 9110 §9.1): "get" is not a method.
std::optional<Method> MethodStrToOptEnum(std::string_view str);

}  // namespace solohttp::http
