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

#ifndef KANABRIDGE_BASE_STRINGS_UNICODE_H_
#define KANABRIDGE_BASE_STRINGS_UNICODE_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"

namespace kanabridge {
namespace strings {

// The Unicode replacement character (U+FFFD) for ill-formed sequences.
inline constexpr char32_t kReplacementCharacter = 0xfffd;

// Returns the byte length of a single UTF-8 character based on the leading
// byte. Continuation bytes and invalid leading bytes count as one byte so that
// iteration always makes progress.
constexpr uint8_t OneCharLen(const char c) {
  const uint8_t b = static_cast<uint8_t>(c);
  if (b < 0x80) {
    return 1;
  } else if ((b & 0xe0) == 0xc0) {
    return 2;
  } else if ((b & 0xf0) == 0xe0) {
    return 3;
  } else if ((b & 0xf8) == 0xf0) {
    return 4;
  }
  return 1;
}

// Checks if the string is a valid UTF-8 string.
bool IsValidUtf8(absl::string_view sv);

// Returns the codepoint count of the given UTF-8 string.
// Complexity: linear
size_t CharsLen(absl::string_view sv);

// Converts the UTF-8 string to UTF-32. Unrecognized encodings are replaced
// with U+FFFD.
std::u32string Utf8ToUtf32(absl::string_view sv);

// Converts the UTF-32 string to UTF-8. Code points outside of
// [U+0000, U+10FFFF] are replaced with U+FFFD.
std::string Utf32ToUtf8(std::u32string_view sv);

// Appends a single code point to `dest` in UTF-8.
void StrAppendChar32(std::string *dest, char32_t cp);

// Returns a substring of the UTF-8 string sv [pos, pos + count), or [pos,
// sv.end()) if count is not provided, by the number of Unicode characters. The
// result is clipped if pos + count > [number of Unicode characters in sv].
// Complexity: linear to pos + count, or pos if count it not provided.
absl::string_view Utf8Substring(absl::string_view sv, size_t pos);
absl::string_view Utf8Substring(absl::string_view sv, size_t pos, size_t count);

// Returns the longest prefix of `sv` that fits in `max_bytes` bytes without
// splitting a UTF-8 character.
absl::string_view Utf8TruncateBytes(absl::string_view sv, size_t max_bytes);

}  // namespace strings
}  // namespace kanabridge

#endif  // KANABRIDGE_BASE_STRINGS_UNICODE_H_
