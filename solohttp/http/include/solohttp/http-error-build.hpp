#pragma once

#include "solohttp/http-response.hpp"
#include "solohttp/parse-error.hpp"

namespace solohttp {

// Build the 400 Bad Request answer sent back for a request that could not be parsed.
// The body is the short text description of the parse error, served as text/plain.
HttpResponse BuildParseErrorResponse(http::ParseError error);

}  // namespace solohttp
