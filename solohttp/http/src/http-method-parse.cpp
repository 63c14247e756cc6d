#include "http-method-parse.hpp"

#include <optional>
#include <string_view>

#include "solohttp/http-method.hpp"

namespace solohttp::http {

std::optional<Method> MethodStrToOptEnum(std::string_view str) {
  switch (str.size()) {
    case 3:  // GET, PUT
      switch (str[0]) {
        case 'G':
          return str == "GET" ? std::optional<Method>(Method::GET) : std::nullopt;
        case 'P':
          return str == "PUT" ? std::optional<Method>(Method::PUT) : std::nullopt;
        default:
          return std::nullopt;
      }

    case 4:  // POST
      return str == "POST" ? std::optional<Method>(Method::POST) : std::nullopt;

    case 6:  // DELETE
      return str == "DELETE" ? std::optional<Method>(Method::DELETE) : std::nullopt;

    default:
      return std::nullopt;
  }
}

}  // namespace solohttp::http
