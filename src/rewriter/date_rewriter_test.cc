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

#include "rewriter/date_rewriter.h"

#include <string>
#include <vector>

#include "absl/time/time.h"
#include "base/clock_mock.h"
#include "testing/gmock.h"
#include "testing/gunit.h"

namespace kanabridge {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(DateRewriterTest, Today) {
  // Tuesday.
  ScopedClockMock clock(ParseTimeOrDie("2024-03-05T09:05:00Z"));
  EXPECT_THAT(DateRewriter::Rewrite("きょう"),
              ElementsAre("2024年3月5日", "3月5日(火)", "2024年3月5日(火)",
                          "2024/03/05", "3月5日"));
}

TEST(DateRewriterTest, TomorrowAndYesterday) {
  ScopedClockMock clock(ParseTimeOrDie("2024-02-29T23:59:00Z"));
  EXPECT_THAT(DateRewriter::Rewrite("あした"),
              ElementsAre("2024年3月1日", "3月1日(金)", "2024年3月1日(金)",
                          "2024/03/01", "3月1日"));
  EXPECT_THAT(DateRewriter::Rewrite("きのう"),
              ElementsAre("2024年2月28日", "2月28日(水)",
                          "2024年2月28日(水)", "2024/02/28", "2月28日"));
}

TEST(DateRewriterTest, YearBoundary) {
  ScopedClockMock clock(ParseTimeOrDie("2024-12-31T12:00:00Z"));
  const std::vector<std::string> tomorrow = DateRewriter::Rewrite("あした");
  ASSERT_FALSE(tomorrow.empty());
  EXPECT_EQ(tomorrow[0], "2025年1月1日");
  EXPECT_EQ(tomorrow[1], "1月1日(水)");
}

TEST(DateRewriterTest, Now) {
  ScopedClockMock clock(ParseTimeOrDie("2024-03-05T09:05:00Z"));
  EXPECT_THAT(DateRewriter::Rewrite("いま"), ElementsAre("09:05", "9時5分"));

  clock->SetTime(ParseTimeOrDie("2024-03-05T23:40:00Z"));
  EXPECT_THAT(DateRewriter::Rewrite("いま"), ElementsAre("23:40", "23時40分"));
}

TEST(DateRewriterTest, DateAndTime) {
  ScopedClockMock clock(ParseTimeOrDie("2024-03-05T09:05:00Z"));
  EXPECT_THAT(DateRewriter::Rewrite("にちじ"),
              ElementsAre("2024年3月5日 09:05"));
}

TEST(DateRewriterTest, UsesClockTimeZone) {
  ScopedClockMock clock(ParseTimeOrDie("2024-03-05T20:00:00Z"));
  clock->SetTimeZone(absl::FixedTimeZone(9 * 60 * 60));
  const std::vector<std::string> today = DateRewriter::Rewrite("きょう");
  ASSERT_FALSE(today.empty());
  EXPECT_EQ(today[0], "2024年3月6日");
  EXPECT_THAT(DateRewriter::Rewrite("いま"), ElementsAre("05:00", "5時0分"));
}

TEST(DateRewriterTest, NotAKeyword) {
  ScopedClockMock clock(ParseTimeOrDie("2024-03-05T09:05:00Z"));
  EXPECT_THAT(DateRewriter::Rewrite("きょうは"), IsEmpty());
  EXPECT_THAT(DateRewriter::Rewrite("きょ"), IsEmpty());
  EXPECT_THAT(DateRewriter::Rewrite(""), IsEmpty());
  EXPECT_TRUE(DateRewriter::IsTemporalKeyword("にちじ"));
  EXPECT_FALSE(DateRewriter::IsTemporalKeyword("あさって"));
}

TEST(DateRewriterTest, ConvertDate) {
  // absl::Weekday::sunday.
  EXPECT_THAT(DateRewriter::ConvertDate(2023, 12, 31, 6),
              ElementsAre("2023年12月31日", "12月31日(日)",
                          "2023年12月31日(日)", "2023/12/31", "12月31日"));
}

}  // namespace
}  // namespace kanabridge
