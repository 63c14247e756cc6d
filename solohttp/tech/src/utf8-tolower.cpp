#include "solohttp/utf8-tolower.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include "solohttp/tolower-str.hpp"
#include "solohttp/utf8-validate.hpp"

namespace solohttp {

namespace {

constexpr bool InRange(char32_t cp, char32_t first, char32_t last) noexcept { return cp >= first && cp <= last; }

constexpr bool IsEven(char32_t cp) noexcept { return (cp & 1U) == 0; }

// Number of bytes announced by a UTF-8 lead byte, 0 if it cannot start a sequence.
constexpr std::size_t SequenceLength(unsigned char lead) noexcept {
  if (lead < 0x80) {
    return 1;
  }
  if (lead >= 0xC2 && lead <= 0xDF) {
    return 2;
  }
  if (lead >= 0xE0 && lead <= 0xEF) {
    return 3;
  }
  if (lead >= 0xF0 && lead <= 0xF4) {
    return 4;
  }
  return 0;
}

char32_t Decode(std::string_view seq) noexcept {
  static constexpr unsigned char kLeadMasks[] = {0, 0x7F, 0x1F, 0x0F, 0x07};
  char32_t cp = static_cast<unsigned char>(seq[0]) & kLeadMasks[seq.size()];
  for (std::size_t pos = 1; pos < seq.size(); ++pos) {
    cp = (cp << 6) | (static_cast<unsigned char>(seq[pos]) & 0x3FU);
  }
  return cp;
}

void AppendUtf8(std::string& out, char32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

}  // namespace

char32_t ToLowerCodePoint(char32_t cp) noexcept {
  if (cp < 0x80) {
    return static_cast<char32_t>(static_cast<unsigned char>(ToLowerAscii(static_cast<char>(cp))));
  }

  // Latin-1 Supplement, U+00D7 is the multiplication sign
  if (InRange(cp, 0xC0, 0xDE) && cp != 0xD7) {
    return cp + 0x20;
  }

  // Latin Extended-A: alternating upper / lower pairs
  if (InRange(cp, 0x100, 0x12F) || InRange(cp, 0x132, 0x137) || InRange(cp, 0x14A, 0x177)) {
    return IsEven(cp) ? cp + 1 : cp;
  }
  if (InRange(cp, 0x139, 0x148) || InRange(cp, 0x179, 0x17E)) {
    return IsEven(cp) ? cp : cp + 1;
  }
  if (cp == 0x130) {
    return U'i';
  }
  if (cp == 0x178) {
    return 0xFF;
  }

  // Greek
  if (cp == 0x386) {
    return 0x3AC;
  }
  if (InRange(cp, 0x388, 0x38A)) {
    return cp + 0x25;
  }
  if (cp == 0x38C) {
    return 0x3CC;
  }
  if (InRange(cp, 0x38E, 0x38F)) {
    return cp + 0x3F;
  }
  if (InRange(cp, 0x391, 0x3A1) || InRange(cp, 0x3A3, 0x3AB)) {
    return cp + 0x20;
  }

  // Cyrillic and Cyrillic Supplement
  if (InRange(cp, 0x400, 0x40F)) {
    return cp + 0x50;
  }
  if (InRange(cp, 0x410, 0x42F)) {
    return cp + 0x20;
  }
  if (InRange(cp, 0x460, 0x481) || InRange(cp, 0x48A, 0x4BF) || InRange(cp, 0x4D0, 0x52F)) {
    return IsEven(cp) ? cp + 1 : cp;
  }
  if (cp == 0x4C0) {
    return 0x4CF;
  }
  if (InRange(cp, 0x4C1, 0x4CE)) {
    return IsEven(cp) ? cp : cp + 1;
  }

  // Armenian
  if (InRange(cp, 0x531, 0x556)) {
    return cp + 0x30;
  }

  // Latin Extended Additional
  if (InRange(cp, 0x1E00, 0x1E95) || InRange(cp, 0x1EA0, 0x1EFF)) {
    return IsEven(cp) ? cp + 1 : cp;
  }
  if (cp == 0x1E9E) {
    return 0xDF;
  }

  // Fullwidth Latin
  if (InRange(cp, 0xFF21, 0xFF3A)) {
    return cp + 0x20;
  }

  // Deseret
  if (InRange(cp, 0x10400, 0x10427)) {
    return cp + 0x28;
  }

  return cp;
}

std::string ToLowerUtf8Copy(std::string_view str) {
  std::string ret;
  ret.reserve(str.size());
  std::size_t pos = 0;
  while (pos < str.size()) {
    const std::size_t len = SequenceLength(static_cast<unsigned char>(str[pos]));
    if (len == 0 || str.size() - pos < len || !IsValidUtf8(str.substr(pos, len))) {
      ret.push_back(str[pos]);
      ++pos;
      continue;
    }
    AppendUtf8(ret, ToLowerCodePoint(Decode(str.substr(pos, len))));
    pos += len;
  }
  return ret;
}

}  // namespace solohttp
