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

#include "composer/table.h"

#include <string>

#include "absl/strings/string_view.h"
#include "base/file/temp_dir.h"
#include "base/file_util.h"
#include "testing/gunit.h"
#include "testing/kanabridge_test.h"

namespace kanabridge::composer {
namespace {

void InitTable(Table *table) {
  table->AddRule("a", "あ", "");
  table->AddRule("i", "い", "");
  table->AddRule("ka", "か", "");
  table->AddRule("ki", "き", "");
  table->AddRule("kk", "っ", "k");
  table->AddRule("na", "な", "");
  table->AddRule("n", "ん", "");
  table->AddRule("nn", "ん", "");
}

std::string GetResult(const Table &table, const absl::string_view key) {
  const Entry *entry = table.LookUp(key);
  if (entry == nullptr) {
    return "<nullptr>";
  }
  return entry->result();
}

TEST(TableTest, LookUp) {
  Table table;
  InitTable(&table);

  EXPECT_EQ(GetResult(table, "a"), "あ");
  EXPECT_EQ(GetResult(table, "ka"), "か");
  EXPECT_EQ(GetResult(table, "k"), "<nullptr>");
  EXPECT_EQ(GetResult(table, "nn"), "ん");

  const Entry *entry = table.LookUp("kk");
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->result(), "っ");
  EXPECT_EQ(entry->pending(), "k");
}

TEST(TableTest, HasSubRules) {
  Table table;
  InitTable(&table);

  EXPECT_TRUE(table.HasSubRules("k"));
  EXPECT_TRUE(table.HasSubRules("n"));
  EXPECT_FALSE(table.HasSubRules("ka"));
  EXPECT_FALSE(table.HasSubRules("a"));
  EXPECT_FALSE(table.HasSubRules("x"));
}

TEST(TableTest, CaseInsensitive) {
  Table table;
  InitTable(&table);
  EXPECT_EQ(GetResult(table, "KA"), "か");
  EXPECT_TRUE(table.HasSubRules("K"));
}

TEST(TableTest, AddRuleReplacesAndRejectsLoops) {
  Table table;
  table.AddRule("a", "あ", "");
  table.AddRule("a", "ア", "");
  EXPECT_EQ(GetResult(table, "a"), "ア");
  EXPECT_EQ(table.size(), 1);

  EXPECT_EQ(table.AddRule("b", "", "b"), nullptr);
  EXPECT_EQ(table.AddRule("", "x", ""), nullptr);
  EXPECT_EQ(table.LookUp("b"), nullptr);
}

TEST(TableTest, LoadFromString) {
  Table table;
  EXPECT_TRUE(table.LoadFromString(
      "# comment\n"
      "a\tあ\n"
      "tt\tっ\tt\r\n"
      "\n"
      "broken line\n"
      "ta\tた\t\n"));
  EXPECT_EQ(table.size(), 3);
  EXPECT_EQ(GetResult(table, "a"), "あ");
  EXPECT_EQ(table.LookUp("tt")->pending(), "t");
  EXPECT_EQ(GetResult(table, "ta"), "た");
}

TEST(TableTest, LoadFromFile) {
  TempDirectory temp_dir = testing::MakeTempDirectoryOrDie();
  const std::string path = FileUtil::JoinPath(temp_dir.path(), "rules.tsv");
  ASSERT_OK(FileUtil::SetContents(path, "ka\tカ\nki\tキ\n"));

  Table table;
  EXPECT_TRUE(table.LoadFromFile(path));
  EXPECT_EQ(GetResult(table, "ka"), "カ");
  EXPECT_FALSE(table.LoadFromFile(path + ".missing"));
}

TEST(TableTest, DefaultTable) {
  const Table &table = Table::GetDefaultTable();
  EXPECT_EQ(GetResult(table, "kyo"), "きょ");
  EXPECT_EQ(GetResult(table, "shi"), "し");
  EXPECT_EQ(GetResult(table, "-"), "ー");
  EXPECT_EQ(GetResult(table, "tt"), "っ");
  EXPECT_EQ(table.LookUp("tt")->pending(), "t");
  EXPECT_EQ(GetResult(table, "nk"), "ん");
  EXPECT_EQ(table.LookUp("nk")->pending(), "k");
  EXPECT_EQ(table.LookUp("ny"), nullptr);
  EXPECT_TRUE(table.HasSubRules("ny"));
  EXPECT_EQ(&Table::GetDefaultTable(), Table::GetSharedDefaultTable().get());
}

}  // namespace
}  // namespace kanabridge::composer
