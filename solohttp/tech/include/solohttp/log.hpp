#pragma once

// Logging abstraction: every diagnostic of the library goes through spdlog.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace solohttp {

namespace log = spdlog;

}  // namespace solohttp
