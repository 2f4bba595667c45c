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

#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "protocol/config.pb.h"
#include "testing/gmock.h"
#include "testing/gunit.h"

namespace kanabridge {
namespace config {
namespace {

using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::IsEmpty;

void AddEntry(absl::string_view reading, absl::string_view word,
              UserDictionaryConfig *config) {
  UserDictionaryEntry *entry = config->add_entries();
  entry->set_reading(std::string(reading));
  entry->set_word(std::string(word));
}

auto IsEntry(absl::string_view reading, absl::string_view word) {
  return ::testing::AllOf(
      Field(&UserDictionary::Entry::reading, std::string(reading)),
      Field(&UserDictionary::Entry::word, std::string(word)));
}

TEST(UserDictionaryTest, Empty) {
  const UserDictionary dictionary;
  EXPECT_TRUE(dictionary.empty());
  EXPECT_THAT(dictionary.LookupExact("あ"), IsEmpty());
  EXPECT_THAT(dictionary.LookupPrefix("あい"), IsEmpty());
}

TEST(UserDictionaryTest, LookupExactKeepsRegistrationOrder) {
  UserDictionaryConfig config;
  AddEntry("くら", "蔵", &config);
  AddEntry("くら", "倉", &config);
  AddEntry("くら", "鞍", &config);
  const UserDictionary dictionary(config);

  EXPECT_EQ(dictionary.size(), 3);
  EXPECT_THAT(dictionary.LookupExact("くら"), ElementsAre("蔵", "倉", "鞍"));
  EXPECT_THAT(dictionary.LookupExact("く"), IsEmpty());
  EXPECT_THAT(dictionary.LookupExact("くらい"), IsEmpty());
}

TEST(UserDictionaryTest, SkipsEmptyAndDuplicateEntries) {
  UserDictionaryConfig config;
  AddEntry("", "空", &config);
  AddEntry("から", "", &config);
  AddEntry("から", "空", &config);
  AddEntry("から", "殻", &config);
  AddEntry("から", "空", &config);
  const UserDictionary dictionary(config);

  EXPECT_EQ(dictionary.size(), 2);
  EXPECT_THAT(dictionary.LookupExact("から"), ElementsAre("空", "殻"));
}

TEST(UserDictionaryTest, LookupPrefixExcludesExactMatch) {
  UserDictionaryConfig config;
  AddEntry("とうきょう", "東京", &config);
  AddEntry("とう", "塔", &config);
  AddEntry("とうきょうと", "東京都", &config);
  AddEntry("と", "都", &config);
  AddEntry("と", "戸", &config);
  AddEntry("おおさか", "大阪", &config);
  const UserDictionary dictionary(config);

  EXPECT_THAT(dictionary.LookupPrefix("とうきょうと"),
              ElementsAre(IsEntry("と", "都"), IsEntry("と", "戸"),
                          IsEntry("とう", "塔"),
                          IsEntry("とうきょう", "東京")));
  EXPECT_THAT(dictionary.LookupPrefix("と"), IsEmpty());
  EXPECT_THAT(dictionary.LookupPrefix("おお"), IsEmpty());
}

TEST(UserDictionaryTest, LookupPrefixIsStable) {
  UserDictionaryConfig config;
  AddEntry("あ", "亜", &config);
  AddEntry("あい", "愛", &config);
  AddEntry("あいう", "藍宇", &config);
  const UserDictionary dictionary(config);

  const std::vector<UserDictionary::Entry> first =
      dictionary.LookupPrefix("あいうえ");
  ASSERT_EQ(first.size(), 3);
  for (int i = 0; i < 10; ++i) {
    const std::vector<UserDictionary::Entry> again =
        dictionary.LookupPrefix("あいうえ");
    ASSERT_EQ(again.size(), first.size());
    for (size_t j = 0; j < first.size(); ++j) {
      EXPECT_EQ(again[j].reading, first[j].reading);
      EXPECT_EQ(again[j].word, first[j].word);
    }
  }
}

TEST(UserDictionaryTest, NonHiraganaReadingIsKept) {
  UserDictionaryConfig config;
  AddEntry("ｇｍａｉｌ", "example@gmail.com", &config);
  AddEntry("abc", "ABC", &config);
  AddEntry("\xff\xfe", "broken", &config);
  const UserDictionary dictionary(config);

  EXPECT_EQ(dictionary.invalid_reading_count(), 3);
  EXPECT_THAT(dictionary.LookupExact("abc"), ElementsAre("ABC"));
  EXPECT_THAT(dictionary.LookupPrefix("abcd"),
              ElementsAre(IsEntry("abc", "ABC")));
  EXPECT_THAT(dictionary.LookupPrefix("\xff\xfe\xff"), ::testing::SizeIs(1));
}

}  // namespace
}  // namespace config
}  // namespace kanabridge
