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

#include <cstddef>
#include <memory>
#include <string>

#include "absl/random/random.h"
#include "absl/strings/string_view.h"
#include "base/strings/unicode.h"
#include "composer/table.h"
#include "testing/gunit.h"

namespace kanabridge::composer {
namespace {

ComposingText MakeText(const absl::string_view raw) {
  ComposingText text;
  text.Append(raw);
  return text;
}

TEST(ComposingTextTest, TransliteratesRomaji) {
  EXPECT_EQ(MakeText("kyou").GetString(), "きょう");
  EXPECT_EQ(MakeText("kitte").GetString(), "きって");
  EXPECT_EQ(MakeText("kanji").GetString(), "かんじ");
  EXPECT_EQ(MakeText("konnnichiha").GetString(), "こんにちは");
  EXPECT_EQ(MakeText("ra-menn").GetString(), "らーめん");
  EXPECT_EQ(MakeText("KYOU").GetString(), "きょう");
}

TEST(ComposingTextTest, PendingInputIsShownAsIs) {
  const ComposingText text = MakeText("kaky");
  EXPECT_EQ(text.GetString(), "かky");
  EXPECT_EQ(text.GetLength(), 3);
  EXPECT_EQ(text.cursor(), 3);
  EXPECT_EQ(text.GetRawString(), "kaky");
}

TEST(ComposingTextTest, PendingNIsFixedBeforeSymbol) {
  EXPECT_EQ(MakeText("kan,").GetString(), "かん、");
  EXPECT_EQ(MakeText("n").GetString(), "n");
}

TEST(ComposingTextTest, AppendEmptyIsNoOp) {
  ComposingText text = MakeText("aiu");
  text.MoveCursor(-1);
  text.Append("");
  EXPECT_EQ(text.GetString(), "あいう");
  EXPECT_EQ(text.cursor(), 2);
}

TEST(ComposingTextTest, AppendAtCursor) {
  ComposingText text = MakeText("aiueo");
  EXPECT_EQ(text.cursor(), 5);
  EXPECT_EQ(text.MoveCursor(-2), 3);

  text.Append("ka");
  EXPECT_EQ(text.GetString(), "あいうかえお");
  EXPECT_EQ(text.cursor(), 4);
}

TEST(ComposingTextTest, AppendInsideMultiUnitChunk) {
  ComposingText text = MakeText("kyo");
  ASSERT_EQ(text.GetString(), "きょ");
  text.MoveCursor(-1);
  text.Append("a");
  EXPECT_EQ(text.GetString(), "きあょ");
  EXPECT_EQ(text.cursor(), 2);
}

TEST(ComposingTextTest, AppendInsidePendingInput) {
  ComposingText text = MakeText("ky");
  text.MoveCursor(-1);
  text.Append("a");
  EXPECT_EQ(text.GetString(), "かy");
  EXPECT_EQ(text.cursor(), 1);
}

TEST(ComposingTextTest, DeleteBackward) {
  ComposingText text = MakeText("aiueo");
  text.MoveCursor(-2);
  text.DeleteBackward();
  EXPECT_EQ(text.GetString(), "あいえお");
  EXPECT_EQ(text.cursor(), 2);

  text.DeleteBackward(10);
  EXPECT_EQ(text.GetString(), "えお");
  EXPECT_EQ(text.cursor(), 0);

  text.DeleteBackward();
  EXPECT_EQ(text.GetString(), "えお");
  EXPECT_EQ(text.cursor(), 0);
}

TEST(ComposingTextTest, DeleteBackwardPendingAndMultiUnitChunk) {
  ComposingText text = MakeText("kyouky");
  text.DeleteBackward();
  EXPECT_EQ(text.GetString(), "きょうk");
  text.DeleteBackward(2);
  EXPECT_EQ(text.GetString(), "きょ");
  text.DeleteBackward();
  EXPECT_EQ(text.GetString(), "き");
  EXPECT_EQ(text.cursor(), 1);
}

TEST(ComposingTextTest, MoveCursorClamps) {
  ComposingText text = MakeText("aiu");
  EXPECT_EQ(text.MoveCursor(-10), 0);
  EXPECT_EQ(text.MoveCursor(1), 1);
  EXPECT_EQ(text.MoveCursor(100), 3);

  ComposingText empty;
  EXPECT_EQ(empty.MoveCursor(1), 0);
  EXPECT_EQ(empty.MoveCursor(-1), 0);
}

TEST(ComposingTextTest, AcceptPrefix) {
  ComposingText text = MakeText("kyouhaiitenki");
  ASSERT_EQ(text.GetString(), "きょうはいいてんき");

  text.AcceptPrefix(3);
  EXPECT_EQ(text.GetString(), "はいいてんき");
  EXPECT_EQ(text.cursor(), 6);

  text.AcceptPrefix(0);
  EXPECT_EQ(text.GetString(), "はいいてんき");

  text.MoveCursor(-5);
  text.AcceptPrefix(3);
  EXPECT_EQ(text.GetString(), "てんき");
  EXPECT_EQ(text.cursor(), 0);

  text.AcceptPrefix(100);
  EXPECT_TRUE(text.Empty());
  EXPECT_EQ(text.GetString(), "");
  EXPECT_EQ(text.cursor(), 0);
}

TEST(ComposingTextTest, AcceptPrefixInsideChunk) {
  ComposingText text = MakeText("kyo");
  text.AcceptPrefix(1);
  EXPECT_EQ(text.GetString(), "ょ");
  EXPECT_EQ(text.cursor(), 1);
}

TEST(ComposingTextTest, AcceptPrefixOnCopyKeepsOriginal) {
  const ComposingText original = MakeText("aiueo");
  ComposingText copy = original;
  copy.AcceptPrefix(2);
  EXPECT_EQ(copy.GetString(), "うえお");
  EXPECT_EQ(original.GetString(), "あいうえお");
  EXPECT_EQ(original.cursor(), 5);
}

TEST(ComposingTextTest, AcceptPrefixLengthIsMonotonic) {
  const ComposingText original = MakeText("kyouhaiitenkidesune");
  const size_t length = original.GetLength();
  for (size_t k = 0; k <= length + 2; ++k) {
    ComposingText copy = original;
    copy.AcceptPrefix(k);
    EXPECT_EQ(copy.GetLength(), k <= length ? length - k : 0) << k;
    EXPECT_LE(copy.cursor(), copy.GetLength()) << k;
  }
}

TEST(ComposingTextTest, Clear) {
  ComposingText text = MakeText("aiu");
  text.Clear();
  EXPECT_TRUE(text.Empty());
  EXPECT_EQ(text.GetString(), "");
  EXPECT_EQ(text.GetRawString(), "");
  EXPECT_EQ(text.cursor(), 0);
}

TEST(ComposingTextTest, CustomTable) {
  auto table = std::make_shared<Table>();
  table->AddRule("a", "ア", "");
  ComposingText text(table);
  text.Append("ab");
  EXPECT_EQ(text.GetString(), "アb");
}

TEST(ComposingTextTest, IllFormedInputIsReplaced) {
  ComposingText text;
  text.Append("\xE3");
  text.Append("1");
  EXPECT_EQ(text.GetString(), "\uFFFD1");
  EXPECT_EQ(text.GetLength(), strings::CharsLen(text.GetString()));
  EXPECT_LE(text.cursor(), strings::CharsLen(text.GetString()));

  // A truncated sequence and its stray trailing byte.
  text.Append("\xE3\x81");
  EXPECT_EQ(text.GetString(), "\uFFFD1\uFFFD\uFFFD");
  EXPECT_EQ(text.GetLength(), strings::CharsLen(text.GetString()));
  EXPECT_EQ(text.cursor(), text.GetLength());
  text.DeleteBackward(2);
  EXPECT_EQ(text.GetString(), "\uFFFD1");
}

TEST(ComposingTextTest, CursorStaysInBoundsForRandomOperations) {
  constexpr absl::string_view kInputs[] = {"a", "ky", "o", "n", "tt", "-",
                                           "shi", ",", "x", "!", "\xE3"};
  absl::BitGen gen;
  ComposingText text;
  for (int i = 0; i < 2000; ++i) {
    switch (absl::Uniform(gen, 0, 5)) {
      case 0:
        text.Append(kInputs[absl::Uniform<size_t>(gen, 0, std::size(kInputs))]);
        break;
      case 1:
        text.DeleteBackward(absl::Uniform<size_t>(gen, 0, 3));
        break;
      case 2:
        text.MoveCursor(absl::Uniform(gen, -4, 5));
        break;
      case 3:
        text.AcceptPrefix(absl::Uniform<size_t>(gen, 0, 3));
        break;
      default:
        if (absl::Bernoulli(gen, 0.05)) {
          text.Clear();
        }
        break;
    }
    ASSERT_LE(text.cursor(), text.GetLength()) << text.GetString();
    ASSERT_EQ(text.GetLength(), strings::CharsLen(text.GetString()));
  }
}

}  // namespace
}  // namespace kanabridge::composer
