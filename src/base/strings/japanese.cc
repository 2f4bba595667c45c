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

#include "base/strings/japanese.h"

#include <string>

#include "absl/strings/string_view.h"
#include "base/strings/unicode.h"

namespace kanabridge::japanese {
namespace {

constexpr char32_t kHiraganaBegin = 0x3041;     // ぁ
constexpr char32_t kHiraganaEnd = 0x3096;       // ゖ
constexpr char32_t kIterationMark = 0x309d;     // ゝ
constexpr char32_t kVoicedIterationMark = 0x309e;  // ゞ
constexpr char32_t kProlongedSoundMark = 0x30fc;   // ー
constexpr char32_t kKatakanaOffset = 0x60;

bool IsHiragana(char32_t c) {
  return (kHiraganaBegin <= c && c <= kHiraganaEnd) || c == kIterationMark ||
         c == kVoicedIterationMark;
}

}  // namespace

std::string HiraganaToKatakana(const absl::string_view input) {
  std::u32string chars = strings::Utf8ToUtf32(input);
  for (char32_t &c : chars) {
    if (IsHiragana(c)) {
      c += kKatakanaOffset;
    }
  }
  return strings::Utf32ToUtf8(chars);
}

bool IsHiraganaReading(const absl::string_view input) {
  if (input.empty() || !strings::IsValidUtf8(input)) {
    return false;
  }
  for (const char32_t c : strings::Utf8ToUtf32(input)) {
    if (!IsHiragana(c) && c != kProlongedSoundMark) {
      return false;
    }
  }
  return true;
}

}  // namespace kanabridge::japanese
