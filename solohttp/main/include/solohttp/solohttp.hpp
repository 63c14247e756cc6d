#pragma once

// IWYU pragma: begin_exports
#include "solohttp/http-constants.hpp"
#include "solohttp/http-method.hpp"
#include "solohttp/http-request.hpp"
#include "solohttp/http-response.hpp"
#include "solohttp/http-server-config.hpp"
#include "solohttp/http-server.hpp"
#include "solohttp/http-status-code.hpp"
#include "solohttp/log.hpp"
#include "solohttp/parse-error.hpp"
#include "solohttp/request-handler.hpp"
#include "solohttp/server-stats.hpp"
#include "solohttp/shutdown-flag.hpp"
#include "solohttp/signal-handler.hpp"
// IWYU pragma: end_exports
