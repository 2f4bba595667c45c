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

#include "composer/composing_text.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "base/strings/unicode.h"
#include "base/vlog.h"
#include "composer/table.h"

namespace kanabridge {
namespace composer {
namespace {

void PopBackChar(std::string *str) {
  if (str->empty()) {
    return;
  }
  size_t pos = str->size() - 1;
  while (pos > 0 && (static_cast<uint8_t>((*str)[pos]) & 0xc0) == 0x80) {
    --pos;
  }
  str->erase(pos);
}

}  // namespace

size_t ComposingText::CharChunk::GetLength() const {
  return strings::CharsLen(conversion) + strings::CharsLen(pending);
}

ComposingText::ComposingText()
    : ComposingText(Table::GetSharedDefaultTable()) {}

ComposingText::ComposingText(std::shared_ptr<const Table> table)
    : table_(std::move(table)) {}

void ComposingText::Append(const absl::string_view raw) {
  if (raw.empty()) {
    return;
  }
  // Ill-formed sequences are replaced with U+FFFD, so that a chunk counts
  // the same number of characters as its text does in GetString().
  const std::string input =
      strings::IsValidUtf8(raw)
          ? std::string(raw)
          : strings::Utf32ToUtf8(strings::Utf8ToUtf32(raw));
  size_t index = SplitAt(cursor_);
  const size_t right_length = GetLength() - cursor_;
  for (size_t pos = 0; pos < input.size();) {
    const size_t len = std::min<size_t>(strings::OneCharLen(input[pos]),
                                        input.size() - pos);
    index = InsertChar(index, absl::string_view(input).substr(pos, len));
    pos += len;
  }
  std::erase_if(chunks_,
                [](const CharChunk &chunk) { return chunk.GetLength() == 0; });
  cursor_ = GetLength() - right_length;
  KANABRIDGE_VLOG(2) << "Append: raw=" << raw << " text=" << GetString()
                     << " cursor=" << cursor_;
}

size_t ComposingText::InsertChar(const size_t index,
                                 const absl::string_view c) {
  if (index > 0 && !chunks_[index - 1].pending.empty()) {
    CharChunk &left = chunks_[index - 1];
    const std::string key = absl::StrCat(left.pending, c);
    if (table_->HasSubRules(key)) {
      absl::StrAppend(&left.raw, c);
      left.pending = key;
      return index;
    }
    if (const Entry *entry = table_->LookUp(key); entry != nullptr) {
      absl::StrAppend(&left.raw, c);
      absl::StrAppend(&left.conversion, entry->result());
      left.pending = entry->pending();
      return index;
    }
    // The pending input cannot grow any more. Fix it if it is a rule by
    // itself, e.g. "n" before a symbol.
    if (const Entry *entry = table_->LookUp(left.pending); entry != nullptr) {
      absl::StrAppend(&left.conversion, entry->result());
      left.pending = entry->pending();
    }
  }

  CharChunk chunk;
  chunk.raw = std::string(c);
  if (table_->HasSubRules(c)) {
    chunk.pending = std::string(c);
  } else if (const Entry *entry = table_->LookUp(c); entry != nullptr) {
    chunk.conversion = entry->result();
    chunk.pending = entry->pending();
  } else {
    chunk.conversion = std::string(c);
  }
  chunks_.insert(chunks_.begin() + index, std::move(chunk));
  return index + 1;
}

size_t ComposingText::SplitAt(const size_t position) {
  size_t pos = 0;
  for (size_t i = 0; i < chunks_.size(); ++i) {
    if (pos >= position) {
      return i;
    }
    const CharChunk &chunk = chunks_[i];
    const size_t len = chunk.GetLength();
    if (position < pos + len) {
      // The split parts lose the link to their keystrokes, so their raw
      // text becomes what they display.
      const size_t offset = position - pos;
      const size_t conversion_len = strings::CharsLen(chunk.conversion);
      CharChunk left, right;
      if (offset <= conversion_len) {
        left.conversion =
            std::string(strings::Utf8Substring(chunk.conversion, 0, offset));
        right.conversion =
            std::string(strings::Utf8Substring(chunk.conversion, offset));
        right.pending = chunk.pending;
      } else {
        left.conversion = chunk.conversion;
        left.pending = std::string(strings::Utf8Substring(
            chunk.pending, 0, offset - conversion_len));
        right.pending = std::string(
            strings::Utf8Substring(chunk.pending, offset - conversion_len));
      }
      left.raw = absl::StrCat(left.conversion, left.pending);
      right.raw = absl::StrCat(right.conversion, right.pending);
      chunks_[i] = std::move(left);
      chunks_.insert(chunks_.begin() + i + 1, std::move(right));
      return i + 1;
    }
    pos += len;
  }
  return chunks_.size();
}

void ComposingText::DeleteBackward(size_t count) {
  for (; count > 0 && cursor_ > 0; --count) {
    const size_t index = SplitAt(cursor_);
    if (index == 0) {
      break;
    }
    CharChunk &chunk = chunks_[index - 1];
    if (!chunk.pending.empty()) {
      PopBackChar(&chunk.pending);
      PopBackChar(&chunk.raw);
    } else {
      PopBackChar(&chunk.conversion);
      chunk.raw = chunk.conversion;
    }
    if (chunk.GetLength() == 0) {
      chunks_.erase(chunks_.begin() + index - 1);
    }
    --cursor_;
  }
}

size_t ComposingText::MoveCursor(const int offset) {
  const int64_t target = static_cast<int64_t>(cursor_) + offset;
  cursor_ = static_cast<size_t>(
      std::clamp<int64_t>(target, 0, static_cast<int64_t>(GetLength())));
  return cursor_;
}

void ComposingText::AcceptPrefix(size_t count) {
  count = std::min(count, GetLength());
  if (count == 0) {
    return;
  }
  const size_t index = SplitAt(count);
  chunks_.erase(chunks_.begin(), chunks_.begin() + index);
  cursor_ = cursor_ > count ? cursor_ - count : 0;
}

void ComposingText::Clear() {
  chunks_.clear();
  cursor_ = 0;
}

std::string ComposingText::GetString() const {
  std::string result;
  for (const CharChunk &chunk : chunks_) {
    absl::StrAppend(&result, chunk.conversion, chunk.pending);
  }
  return result;
}

std::string ComposingText::GetRawString() const {
  std::string result;
  for (const CharChunk &chunk : chunks_) {
    absl::StrAppend(&result, chunk.raw);
  }
  return result;
}

size_t ComposingText::GetLength() const {
  size_t length = 0;
  for (const CharChunk &chunk : chunks_) {
    length += chunk.GetLength();
  }
  return length;
}

}  // namespace composer
}  // namespace kanabridge
