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

#include "config/user_dictionary.h"

#include <algorithm>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "base/strings/japanese.h"
#include "base/strings/unicode.h"
#include "base/vlog.h"
#include "protocol/config.pb.h"

namespace kanabridge {
namespace config {

UserDictionary::UserDictionary(const UserDictionaryConfig &config) {
  size_t skipped = 0;
  for (const UserDictionaryEntry &entry : config.entries()) {
    if (!AddEntry(entry.reading(), entry.word())) {
      ++skipped;
    }
  }
  KANABRIDGE_VLOG(1) << "User dictionary: " << size_ << " entries, "
                     << skipped << " skipped, " << invalid_reading_count_
                     << " with non-hiragana reading";
}

bool UserDictionary::AddEntry(const absl::string_view reading,
                              const absl::string_view word) {
  if (reading.empty() || word.empty()) {
    return false;
  }
  std::vector<std::string> &words = words_[std::string(reading)];
  if (std::find(words.begin(), words.end(), word) != words.end()) {
    return false;
  }
  if (words.empty() && !japanese::IsHiraganaReading(reading)) {
    KANABRIDGE_VLOG(2) << "Non-hiragana reading: " << reading;
    ++invalid_reading_count_;
  }
  words.emplace_back(word);
  ++size_;
  return true;
}

absl::Span<const std::string> UserDictionary::LookupExact(
    const absl::string_view reading) const {
  const auto it = words_.find(reading);
  if (it == words_.end()) {
    return {};
  }
  return it->second;
}

std::vector<UserDictionary::Entry> UserDictionary::LookupPrefix(
    const absl::string_view key) const {
  std::vector<Entry> result;
  if (words_.empty()) {
    return result;
  }
  // Every character boundary of `key` except both ends.
  for (size_t pos = 0; pos < key.size();) {
    pos += std::min<size_t>(strings::OneCharLen(key[pos]), key.size() - pos);
    if (pos == key.size()) {
      break;
    }
    const absl::string_view reading = key.substr(0, pos);
    const auto it = words_.find(reading);
    if (it == words_.end()) {
      continue;
    }
    for (const std::string &word : it->second) {
      result.push_back({std::string(reading), word});
    }
  }
  return result;
}

}  // namespace config
}  // namespace kanabridge
