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

#include <string>

#include "absl/strings/string_view.h"
#include "protocol/config.pb.h"
#include "testing/gunit.h"

namespace kanabridge {
namespace config {
namespace {

constexpr absl::string_view kAtokText =
    "!!ATOK_TANGO_TEXT_HEADER_1\r\n"
    "!!対象辞書;C:\\user.dic\r\n"
    "\r\n"
    "とうきょうと\t東京都\t固有地名*\r\n"
    "くら\t蔵\t名詞*\r\n"
    "くら\t蔵\t名詞*\r\n"
    "じーめーる\tGmail\t固有一般$\r\n"
    "ｇめーる\tGmail\t名詞*\r\n"
    "カタカナ\t片仮名\t名詞*\r\n"
    "＠にこ\t(^^)\t顔文字*\r\n"
    "# comment\r\n"
    "broken line\r\n";

TEST(UserDictionaryImporterTest, ImportFromAtokText) {
  AtokImportStats stats;
  const UserDictionaryConfig config =
      ImportFromAtokText(kAtokText, AtokImportOptions(), &stats);

  ASSERT_EQ(config.entries_size(), 3);
  EXPECT_EQ(config.entries(0).reading(), "とうきょうと");
  EXPECT_EQ(config.entries(0).word(), "東京都");
  EXPECT_EQ(config.entries(1).reading(), "くら");
  EXPECT_EQ(config.entries(2).reading(), "じーめーる");

  EXPECT_EQ(stats.imported, 3);
  EXPECT_EQ(stats.duplicates, 1);
  EXPECT_EQ(stats.emoticons, 1);
  // "gめーる" and "カタカナ".
  EXPECT_EQ(stats.invalid_reading, 2);
  EXPECT_EQ(stats.auto_registered, 0);
}

TEST(UserDictionaryImporterTest, SkipAutoRegistered) {
  AtokImportOptions options;
  options.skip_auto_registered = true;
  options.skip_emoticons = false;
  AtokImportStats stats;
  const UserDictionaryConfig config =
      ImportFromAtokText(kAtokText, options, &stats);

  EXPECT_EQ(config.entries_size(), 2);
  EXPECT_EQ(stats.auto_registered, 1);
  EXPECT_EQ(stats.emoticons, 0);
  // "＠にこ" is not hiragana either.
  EXPECT_EQ(stats.invalid_reading, 3);
}

TEST(UserDictionaryImporterTest, Utf16LittleEndian) {
  // BOM, "あ\t亜\t名詞\n".
  const std::string text(
      "\xff\xfe"
      "\x42\x30\x09\x00\x9c\x4e\x09\x00\x0d\x54\x5e\x8a\x0a\x00",
      16);
  const UserDictionaryConfig config =
      ImportFromAtokText(text, AtokImportOptions(), nullptr);
  ASSERT_EQ(config.entries_size(), 1);
  EXPECT_EQ(config.entries(0).reading(), "あ");
  EXPECT_EQ(config.entries(0).word(), "亜");
}

TEST(UserDictionaryImporterTest, MergeUserDictionary) {
  UserDictionaryConfig existing;
  UserDictionaryEntry *entry = existing.add_entries();
  entry->set_reading("くら");
  entry->set_word("蔵");

  const UserDictionaryConfig imported =
      ImportFromAtokText(kAtokText, AtokImportOptions(), nullptr);
  EXPECT_EQ(MergeUserDictionary(imported, &existing), 2);
  ASSERT_EQ(existing.entries_size(), 3);
  EXPECT_EQ(existing.entries(0).word(), "蔵");
  EXPECT_EQ(existing.entries(1).word(), "東京都");
  EXPECT_EQ(existing.entries(2).word(), "Gmail");

  EXPECT_EQ(MergeUserDictionary(imported, &existing), 0);
}

}  // namespace
}  // namespace config
}  // namespace kanabridge
