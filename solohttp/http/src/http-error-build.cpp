#include "solohttp/http-error-build.hpp"

#include "solohttp/http-constants.hpp"
#include "solohttp/http-response.hpp"
#include "solohttp/http-status-code.hpp"
#include "solohttp/parse-error.hpp"

namespace solohttp {

HttpResponse BuildParseErrorResponse(http::ParseError error) {
  return HttpResponse(http::StatusCodeBadRequest, http::ReasonBadRequest)
      .header(http::ContentType, http::ContentTypeTextPlain)
      .body(http::ParseErrorToStr(error));
}

}  // namespace solohttp
