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

#ifndef KANABRIDGE_REWRITER_DATE_REWRITER_H_
#define KANABRIDGE_REWRITER_DATE_REWRITER_H_

#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace kanabridge {

// Expands temporal keywords ("きょう", "いま", ...) into the current date or
// time read from Clock.
class DateRewriter {
 public:
  DateRewriter() = delete;

  // Returns the renderings for `key` in display order, or an empty list if
  // `key` is not a temporal keyword.
  static std::vector<std::string> Rewrite(absl::string_view key);

  static bool IsTemporalKeyword(absl::string_view key);

  // "2024年3月5日", "3月5日(火)", "2024年3月5日(火)", "2024/03/05", "3月5日".
  static std::vector<std::string> ConvertDate(int year, int month, int day,
                                              int weekday);

  // "09:05", "9時5分".
  static std::vector<std::string> ConvertTime(int hour, int minute);
};

}  // namespace kanabridge

#endif  // KANABRIDGE_REWRITER_DATE_REWRITER_H_
