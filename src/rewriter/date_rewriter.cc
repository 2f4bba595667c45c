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

#include <algorithm>
#include <iterator>
#include <string>
#include <vector>

#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "absl/time/civil_time.h"
#include "absl/time/time.h"
#include "base/clock.h"
#include "base/vlog.h"

namespace kanabridge {
namespace {

enum DateType {
  DATE,
  CURRENT_TIME,
  DATE_AND_CURRENT_TIME,
};

struct DateData {
  absl::string_view key;
  // Day offset from today.
  int diff;
  DateType type;
};

constexpr DateData kDateData[] = {
    {"きょう", 0, DATE},
    {"あした", 1, DATE},
    {"きのう", -1, DATE},
    {"いま", 0, CURRENT_TIME},
    {"にちじ", 0, DATE_AND_CURRENT_TIME},
};

// absl::Weekday starts from Monday.
constexpr absl::string_view kWeekDayString[] = {"月", "火", "水", "木",
                                                "金", "土", "日"};

const DateData *FindDateData(const absl::string_view key) {
  const auto it = std::find_if(
      std::begin(kDateData), std::end(kDateData),
      [key](const DateData &data) { return data.key == key; });
  return it == std::end(kDateData) ? nullptr : it;
}

absl::CivilMinute GetCivilMinuteWithDiff(const int diff) {
  const absl::CivilMinute now = Clock::LocalMinute();
  if (diff == 0) {
    return now;
  }
  return absl::CivilMinute(absl::CivilDay(now) + diff);
}

}  // namespace

std::vector<std::string> DateRewriter::ConvertDate(const int year,
                                                   const int month,
                                                   const int day,
                                                   const int weekday) {
  const absl::string_view w = kWeekDayString[weekday % 7];
  return {
      absl::StrFormat("%d年%d月%d日", year, month, day),
      absl::StrFormat("%d月%d日(%s)", month, day, w),
      absl::StrFormat("%d年%d月%d日(%s)", year, month, day, w),
      absl::StrFormat("%d/%02d/%02d", year, month, day),
      absl::StrFormat("%d月%d日", month, day),
  };
}

std::vector<std::string> DateRewriter::ConvertTime(const int hour,
                                                   const int minute) {
  return {
      absl::StrFormat("%02d:%02d", hour, minute),
      absl::StrFormat("%d時%d分", hour, minute),
  };
}

bool DateRewriter::IsTemporalKeyword(const absl::string_view key) {
  return FindDateData(key) != nullptr;
}

std::vector<std::string> DateRewriter::Rewrite(const absl::string_view key) {
  const DateData *data = FindDateData(key);
  if (data == nullptr) {
    return {};
  }
  const absl::CivilMinute cm = GetCivilMinuteWithDiff(data->diff);
  KANABRIDGE_VLOG(2) << "Date rewrite: " << key << " at " << cm;
  switch (data->type) {
    case DATE:
      return ConvertDate(static_cast<int>(cm.year()), cm.month(), cm.day(),
                         static_cast<int>(absl::GetWeekday(cm)));
    case CURRENT_TIME:
      return ConvertTime(cm.hour(), cm.minute());
    case DATE_AND_CURRENT_TIME:
      // Y年M月D日 HH:MM
      return {absl::StrFormat("%d年%d月%d日 %02d:%02d", cm.year(), cm.month(),
                              cm.day(), cm.hour(), cm.minute())};
  }
  return {};
}

}  // namespace kanabridge
