#pragma once

#include <string_view>

namespace solohttp {

// Validate UTF-8 encoding per RFC 3629.
// Rejects invalid leading bytes, bad continuation bytes, truncated sequences, overlong encodings,
// UTF-16 surrogates and code points above U+10FFFF.
[[nodiscard]] bool IsValidUtf8(std::string_view data) noexcept;

}  // namespace solohttp
