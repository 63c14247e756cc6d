#include "solohttp/utf8-validate.hpp"

#include <cstddef>
#include <string_view>

namespace solohttp {

namespace {

// Well-formed byte sequences, from the RFC 3629 §4 syntax:
//   UTF8-2 = %xC2-DF UTF8-tail
//   UTF8-3 = %xE0 %xA0-BF UTF8-tail / %xE1-EC 2( UTF8-tail ) / %xED %x80-9F UTF8-tail / %xEE-EF 2( UTF8-tail )
//   UTF8-4 = %xF0 %x90-BF 2( UTF8-tail ) / %xF1-F3 3( UTF8-tail ) / %xF4 %x80-8F 2( UTF8-tail )
// Restricting the second byte range excludes overlong encodings, surrogates and code points above U+10FFFF.
struct LeadInfo {
  unsigned char nbTails;
  unsigned char secondMin;
  unsigned char secondMax;
};

constexpr LeadInfo kInvalidLead{0, 0xFF, 0x00};

constexpr LeadInfo LeadInfoFor(unsigned char lead) noexcept {
  if (lead >= 0xC2 && lead <= 0xDF) {
    return {1, 0x80, 0xBF};
  }
  if (lead == 0xE0) {
    return {2, 0xA0, 0xBF};
  }
  if (lead == 0xED) {
    return {2, 0x80, 0x9F};
  }
  if (lead >= 0xE1 && lead <= 0xEF) {
    return {2, 0x80, 0xBF};
  }
  if (lead == 0xF0) {
    return {3, 0x90, 0xBF};
  }
  if (lead == 0xF4) {
    return {3, 0x80, 0x8F};
  }
  if (lead >= 0xF1 && lead <= 0xF3) {
    return {3, 0x80, 0xBF};
  }
  return kInvalidLead;
}

constexpr bool IsTail(unsigned char byte) noexcept { return byte >= 0x80 && byte <= 0xBF; }

}  // namespace

bool IsValidUtf8(std::string_view data) noexcept {
  std::size_t pos = 0;
  while (pos < data.size()) {
    const auto lead = static_cast<unsigned char>(data[pos]);
    if (lead < 0x80) {
      ++pos;
      continue;
    }
    const LeadInfo info = LeadInfoFor(lead);
    if (info.nbTails == 0 || data.size() - pos <= info.nbTails) {
      return false;
    }
    const auto second = static_cast<unsigned char>(data[pos + 1]);
    if (second < info.secondMin || second > info.secondMax) {
      return false;
    }
    for (std::size_t tailPos = pos + 2; tailPos <= pos + info.nbTails; ++tailPos) {
      if (!IsTail(static_cast<unsigned char>(data[tailPos]))) {
        return false;
      }
    }
    pos += 1U + info.nbTails;
  }
  return true;
}

}  // namespace solohttp
