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

#include "config/user_dictionary_importer.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "base/strings/japanese.h"
#include "base/strings/unicode.h"
#include "base/vlog.h"
#include "protocol/config.pb.h"

namespace kanabridge {
namespace config {
namespace {

constexpr absl::string_view kUtf16LeBom = "\xff\xfe";
constexpr absl::string_view kUtf8Bom = "\xef\xbb\xbf";

std::string Utf16LeToUtf8(absl::string_view data) {
  std::string result;
  result.reserve(data.size());
  for (size_t i = 0; i + 1 < data.size(); i += 2) {
    char32_t c = static_cast<uint8_t>(data[i]) |
                 (static_cast<uint8_t>(data[i + 1]) << 8);
    if (0xd800 <= c && c <= 0xdbff && i + 3 < data.size()) {
      const char32_t low = static_cast<uint8_t>(data[i + 2]) |
                           (static_cast<uint8_t>(data[i + 3]) << 8);
      if (0xdc00 <= low && low <= 0xdfff) {
        c = 0x10000 + ((c - 0xd800) << 10) + (low - 0xdc00);
        i += 2;
      }
    }
    strings::StrAppendChar32(&result, c);
  }
  return result;
}

// Ａ→A, ０→0.
std::string NarrowAlphanumerics(absl::string_view reading) {
  std::u32string chars = strings::Utf8ToUtf32(reading);
  for (char32_t &c : chars) {
    if ((0xff10 <= c && c <= 0xff19) || (0xff21 <= c && c <= 0xff3a) ||
        (0xff41 <= c && c <= 0xff5a)) {
      c -= 0xfee0;
    }
  }
  return strings::Utf32ToUtf8(chars);
}

bool IsEmoticonEntry(absl::string_view reading, absl::string_view pos) {
  if (!absl::StrContains(pos, "顔文字") && !absl::StrContains(pos, "単漢字") &&
      !absl::StrContains(pos, "短縮読み")) {
    return false;
  }
  return absl::StartsWith(reading, "@") || absl::StartsWith(reading, "＠");
}

}  // namespace

UserDictionaryConfig ImportFromAtokText(absl::string_view text,
                                        const AtokImportOptions &options,
                                        AtokImportStats *stats) {
  AtokImportStats local_stats;
  if (stats == nullptr) {
    stats = &local_stats;
  }
  *stats = AtokImportStats();

  std::string decoded;
  if (absl::ConsumePrefix(&text, kUtf16LeBom)) {
    decoded = Utf16LeToUtf8(text);
    text = decoded;
  } else {
    absl::ConsumePrefix(&text, kUtf8Bom);
  }

  UserDictionaryConfig result;
  absl::flat_hash_set<std::pair<std::string, std::string>> seen;
  for (absl::string_view line : absl::StrSplit(text, '\n')) {
    line = absl::StripAsciiWhitespace(line);
    if (line.empty() || absl::StartsWith(line, "!!") ||
        absl::StartsWith(line, "#")) {
      continue;
    }
    const std::vector<absl::string_view> fields = absl::StrSplit(line, '\t');
    if (fields.size() < 3) {
      KANABRIDGE_VLOG(2) << "Malformed line: " << line;
      continue;
    }
    const absl::string_view word = absl::StripAsciiWhitespace(fields[1]);
    const absl::string_view pos = absl::StripAsciiWhitespace(fields[2]);
    std::string reading(absl::StripAsciiWhitespace(fields[0]));

    if (options.skip_emoticons && IsEmoticonEntry(reading, pos)) {
      ++stats->emoticons;
      continue;
    }
    if (options.skip_auto_registered && absl::EndsWith(pos, "$")) {
      ++stats->auto_registered;
      continue;
    }
    reading = NarrowAlphanumerics(reading);
    if (word.empty() || !japanese::IsHiraganaReading(reading)) {
      ++stats->invalid_reading;
      continue;
    }
    if (!seen.emplace(reading, word).second) {
      ++stats->duplicates;
      continue;
    }
    UserDictionaryEntry *entry = result.add_entries();
    entry->set_reading(std::move(reading));
    entry->set_word(std::string(word));
    ++stats->imported;
  }
  KANABRIDGE_VLOG(1) << "ATOK import: " << stats->imported << " imported, "
                     << stats->emoticons << " emoticons, "
                     << stats->auto_registered << " auto registered, "
                     << stats->invalid_reading << " invalid, "
                     << stats->duplicates << " duplicates";
  return result;
}

size_t MergeUserDictionary(const UserDictionaryConfig &from,
                           UserDictionaryConfig *to) {
  absl::flat_hash_set<std::pair<std::string, std::string>> existing;
  for (const UserDictionaryEntry &entry : to->entries()) {
    existing.emplace(entry.reading(), entry.word());
  }
  size_t added = 0;
  for (const UserDictionaryEntry &entry : from.entries()) {
    if (existing.emplace(entry.reading(), entry.word()).second) {
      *to->add_entries() = entry;
      ++added;
    }
  }
  return added;
}

}  // namespace config
}  // namespace kanabridge
