#pragma once

#include <string>
#include <string_view>

namespace solohttp {

// Simple (one to one) lowercase mapping of a single code point, for the bicameral blocks:
// Basic Latin, Latin-1 Supplement, Latin Extended-A, Greek, Cyrillic (with Supplement), Armenian,
// Latin Extended Additional, fullwidth Latin and Deseret. Other code points are returned unchanged.
[[nodiscard]] char32_t ToLowerCodePoint(char32_t cp) noexcept;

// Returns a copy of str with each well-formed UTF-8 sequence lowered with ToLowerCodePoint.
// Bytes that are not part of a well-formed sequence are copied as is.
[[nodiscard]] std::string ToLowerUtf8Copy(std::string_view str);

}  // namespace solohttp
