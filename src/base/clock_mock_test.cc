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

#include "base/clock_mock.h"

#include "absl/time/civil_time.h"
#include "absl/time/time.h"
#include "base/clock.h"
#include "testing/gunit.h"

namespace kanabridge {
namespace {

TEST(ClockMockTest, ParseTimeOrDie) {
  EXPECT_EQ(ParseTimeOrDie("2024-03-05T09:15:00Z"),
            absl::FromCivil(absl::CivilSecond(2024, 3, 5, 9, 15, 0),
                            absl::UTCTimeZone()));
  EXPECT_EQ(ParseTimeOrDie("2024-03-05T18:15:00+09:00"),
            ParseTimeOrDie("2024-03-05T09:15:00Z"));
}

TEST(ClockMockTest, ReplacesSystemClock) {
  const absl::Time time = ParseTimeOrDie("2024-03-05T09:15:30Z");
  {
    ScopedClockMock clock(time);
    EXPECT_EQ(Clock::Now(), time);
    EXPECT_EQ(Clock::LocalMinute(), absl::CivilMinute(2024, 3, 5, 9, 15));

    clock->SetTimeZone(absl::FixedTimeZone(9 * 60 * 60));
    EXPECT_EQ(Clock::LocalMinute(), absl::CivilMinute(2024, 3, 5, 18, 15));

    clock->SetTime(ParseTimeOrDie("2024-03-05T15:00:00Z"));
    EXPECT_EQ(Clock::LocalMinute(), absl::CivilMinute(2024, 3, 6, 0, 0));
  }
  EXPECT_NE(Clock::Now(), time);
}

}  // namespace
}  // namespace kanabridge
