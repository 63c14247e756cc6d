#pragma once

#include <functional>

#include "solohttp/http-request.hpp"
#include "solohttp/http-response.hpp"

namespace solohttp {

// Produces the response of a successfully parsed request.
// It is called synchronously on the accept loop thread, one connection at a time.
// An exception escaping it only fails the current connection, the server keeps running.
using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

// Handler used when none is provided: 200 OK with a short greeting for "/", 404 Not Found for any other path.
HttpResponse DefaultRequestHandler(const HttpRequest& request);

}  // namespace solohttp
