#include "solohttp/request-handler.hpp"

#include "solohttp/http-constants.hpp"
#include "solohttp/http-request.hpp"
#include "solohttp/http-response.hpp"

namespace solohttp {

HttpResponse DefaultRequestHandler(const HttpRequest& request) {
  if (request.path() == "/") {
    return HttpResponse::Ok().header(http::ContentType, http::ContentTypeTextPlain).body("Hello from solohttp\n");
  }
  return HttpResponse::NotFound();
}

}  // namespace solohttp
