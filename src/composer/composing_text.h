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

#ifndef KANABRIDGE_COMPOSER_COMPOSING_TEXT_H_
#define KANABRIDGE_COMPOSER_COMPOSING_TEXT_H_

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "composer/table.h"

namespace kanabridge {
namespace composer {

// The not-yet-committed input: raw keystrokes, their phonetic projection and
// a cursor. Positions and counts are measured in phonetic units (Unicode
// characters of GetString()), never in raw keystrokes.
//
// All operations are total; out-of-range counts and offsets are clamped.
// The class is copyable so that acceptance can be simulated on a copy.
class ComposingText {
 public:
  // Uses the built-in romaji-hiragana table.
  ComposingText();
  explicit ComposingText(std::shared_ptr<const Table> table);

  ComposingText(const ComposingText &) = default;
  ComposingText &operator=(const ComposingText &) = default;

  // Inserts `raw` at the cursor, transliterates it, and moves the cursor just
  // after the inserted phonetic span. No-op for an empty input.
  void Append(absl::string_view raw);

  // Removes up to `count` units before the cursor.
  void DeleteBackward(size_t count = 1);

  // Moves the cursor by `offset` units and returns the new cursor. The result
  // is clamped into [0, GetLength()].
  size_t MoveCursor(int offset);

  // Removes the first `count` units of the text. The cursor keeps its
  // position relative to the remaining text, or goes to 0 if it was inside
  // the removed part.
  void AcceptPrefix(size_t count);

  // Resets to the empty state.
  void Clear();

  // Phonetic text, e.g. "きょうはy" for "kyouhay".
  std::string GetString() const;

  // Raw keystrokes as typed.
  std::string GetRawString() const;

  // Length of GetString() in units.
  size_t GetLength() const;

  size_t cursor() const { return cursor_; }
  bool Empty() const { return chunks_.empty(); }

 private:
  // A run of raw input and its transliteration. `pending` is the part of the
  // input which may still turn into another rule with the next keystroke,
  // and is shown as-is.
  struct CharChunk {
    std::string raw;
    std::string conversion;
    std::string pending;

    size_t GetLength() const;
  };

  // Splits chunks so that `position` falls on a chunk boundary and returns
  // the number of chunks before it.
  size_t SplitAt(size_t position);

  // Feeds a single character into the chunk list before `index`. Returns the
  // number of chunks before the insertion point after the character.
  size_t InsertChar(size_t index, absl::string_view c);

  std::shared_ptr<const Table> table_;
  std::vector<CharChunk> chunks_;
  size_t cursor_ = 0;
};

}  // namespace composer
}  // namespace kanabridge

#endif  // KANABRIDGE_COMPOSER_COMPOSING_TEXT_H_
