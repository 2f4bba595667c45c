// Copyright 2010-2021, Google Inc.
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are
// met:
//
//     * Redistributions of source code must retain the above copyright
// notice, this list of conditions and the following disclaimer.
//     * Redistributions in binary form must reproduce the above
// copyright notice, this list of conditions and the following disclaimer
// in the documentation and/or other materials provided with the
// distribution.
//     * Neither the name of Google Inc. nor the names of its
// contributors may be used to endorse or promote products derived from
// this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
// "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
// LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
// A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT
// OWNER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
// LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE,
// DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY
// THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "base/strings/unicode.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"

namespace kanabridge {
namespace strings {
namespace {

constexpr bool IsTrailingByte(const char c) {
  return (static_cast<uint8_t>(c) & 0xc0) == 0x80;
}

// Decodes one character at the front of `sv`. Sets `len` to the number of
// bytes consumed (at least 1) and returns false for ill-formed sequences.
bool DecodeFront(absl::string_view sv, char32_t *cp, size_t *len) {
  const uint8_t lead = static_cast<uint8_t>(sv[0]);
  const uint8_t expected = OneCharLen(sv[0]);
  *len = 1;
  if (expected == 1) {
    *cp = lead < 0x80 ? lead : kReplacementCharacter;
    return lead < 0x80;
  }
  if (sv.size() < expected) {
    *cp = kReplacementCharacter;
    return false;
  }
  char32_t value = lead & (0x7f >> expected);
  for (size_t i = 1; i < expected; ++i) {
    if (!IsTrailingByte(sv[i])) {
      *len = i;
      *cp = kReplacementCharacter;
      return false;
    }
    value = (value << 6) | (static_cast<uint8_t>(sv[i]) & 0x3f);
  }
  *len = expected;
  // Reject overlong forms, surrogates and values above U+10FFFF.
  constexpr char32_t kMinValue[] = {0, 0, 0x80, 0x800, 0x10000};
  if (value < kMinValue[expected] || (value >= 0xd800 && value <= 0xdfff) ||
      value > 0x10ffff) {
    *cp = kReplacementCharacter;
    return false;
  }
  *cp = value;
  return true;
}

}  // namespace

bool IsValidUtf8(const absl::string_view sv) {
  for (size_t pos = 0; pos < sv.size();) {
    char32_t cp;
    size_t len;
    if (!DecodeFront(sv.substr(pos), &cp, &len)) {
      return false;
    }
    pos += len;
  }
  return true;
}

size_t CharsLen(const absl::string_view sv) {
  size_t count = 0;
  for (size_t pos = 0; pos < sv.size(); pos += OneCharLen(sv[pos])) {
    ++count;
  }
  return count;
}

std::u32string Utf8ToUtf32(const absl::string_view sv) {
  std::u32string result;
  for (size_t pos = 0; pos < sv.size();) {
    char32_t cp;
    size_t len;
    DecodeFront(sv.substr(pos), &cp, &len);
    result.push_back(cp);
    pos += len;
  }
  return result;
}

void StrAppendChar32(std::string *dest, char32_t cp) {
  if (cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff)) {
    cp = kReplacementCharacter;
  }
  if (cp < 0x80) {
    dest->push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    dest->push_back(static_cast<char>(0xc0 | (cp >> 6)));
    dest->push_back(static_cast<char>(0x80 | (cp & 0x3f)));
  } else if (cp < 0x10000) {
    dest->push_back(static_cast<char>(0xe0 | (cp >> 12)));
    dest->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3f)));
    dest->push_back(static_cast<char>(0x80 | (cp & 0x3f)));
  } else {
    dest->push_back(static_cast<char>(0xf0 | (cp >> 18)));
    dest->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3f)));
    dest->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3f)));
    dest->push_back(static_cast<char>(0x80 | (cp & 0x3f)));
  }
}

std::string Utf32ToUtf8(const std::u32string_view sv) {
  std::string result;
  for (const char32_t c : sv) {
    StrAppendChar32(&result, c);
  }
  return result;
}

absl::string_view Utf8Substring(absl::string_view sv, size_t pos) {
  size_t offset = 0;
  while (pos-- > 0 && offset < sv.size()) {
    offset += OneCharLen(sv[offset]);
  }
  if (offset >= sv.size()) {
    return absl::string_view();
  }
  return sv.substr(offset);
}

absl::string_view Utf8Substring(absl::string_view sv, const size_t pos,
                                size_t count) {
  sv = Utf8Substring(sv, pos);
  size_t end = 0;
  while (end < sv.size() && count-- > 0) {
    end += OneCharLen(sv[end]);
  }
  return sv.substr(0, end);
}

absl::string_view Utf8TruncateBytes(const absl::string_view sv,
                                    const size_t max_bytes) {
  if (sv.size() <= max_bytes) {
    return sv;
  }
  size_t end = max_bytes;
  // Step back over continuation bytes to the leading byte of the character
  // that straddles the limit.
  while (end > 0 && IsTrailingByte(sv[end])) {
    --end;
  }
  return sv.substr(0, end);
}

}  // namespace strings
}  // namespace kanabridge
