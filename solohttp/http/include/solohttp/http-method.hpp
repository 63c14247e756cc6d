#pragma once

#include <cstdint>
#include <string_view>

namespace solohttp::http {

// The request methods understood by the parser. Any other token is rejected, there is no "unknown" method.
enum class Method : uint8_t { GET, POST, PUT, DELETE };

inline constexpr uint8_t kNbMethods = 4;

inline constexpr std::string_view kMethodStrings[] = {"GET", "POST", "PUT", "DELETE"};

constexpr std::string_view MethodToStr(Method method) { return kMethodStrings[static_cast<uint8_t>(method)]; }

}  // namespace solohttp::http
