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

#ifndef KANABRIDGE_BASE_CLOCK_MOCK_H_
#define KANABRIDGE_BASE_CLOCK_MOCK_H_

#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "base/clock.h"

namespace kanabridge {

// Parses an RFC 3339 time such as "2024-03-05T09:05:00Z". Fails the process
// on a malformed literal.
absl::Time ParseTimeOrDie(absl::string_view time);

// Installs a fixed clock, in UTC by default, for the lifetime of the object.
//
//   ScopedClockMock clock(ParseTimeOrDie("2024-03-05T09:05:00Z"));
//   clock->SetTimeZone(absl::FixedTimeZone(9 * 60 * 60));
class ScopedClockMock {
 public:
  class FixedClock : public ClockInterface {
   public:
    absl::Time Now() override { return time_; }
    absl::TimeZone TimeZone() override { return time_zone_; }

    void SetTime(absl::Time time) { time_ = time; }
    void SetTimeZone(absl::TimeZone time_zone) { time_zone_ = time_zone; }

   private:
    absl::Time time_;
    absl::TimeZone time_zone_ = absl::UTCTimeZone();
  };

  explicit ScopedClockMock(absl::Time time);
  ScopedClockMock(const ScopedClockMock &) = delete;
  ScopedClockMock &operator=(const ScopedClockMock &) = delete;
  ~ScopedClockMock();

  FixedClock *operator->() { return &clock_; }

 private:
  FixedClock clock_;
};

}  // namespace kanabridge

#endif  // KANABRIDGE_BASE_CLOCK_MOCK_H_
