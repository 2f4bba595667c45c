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

#include "base/log_file.h"

#include <cerrno>
#include <fstream>
#include <ios>
#include <memory>
#include <string>
#include <utility>

#include "absl/base/log_severity.h"
#include "absl/log/log_entry.h"
#include "absl/log/log_sink_registry.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"

namespace kanabridge {

absl::StatusOr<std::unique_ptr<LogFileSink>> LogFileSink::Open(
    const std::string &path, const absl::LogSeverityAtLeast min_severity) {
  errno = 0;
  std::ofstream file(path, std::ios::out | std::ios::app);
  if (!file.is_open()) {
    const std::string message = absl::StrCat("Cannot open log file ", path);
    return errno == 0 ? absl::UnknownError(message)
                      : absl::ErrnoToStatus(errno, message);
  }
  return absl::WrapUnique(new LogFileSink(std::move(file), min_severity));
}

LogFileSink::LogFileSink(std::ofstream file,
                         const absl::LogSeverityAtLeast min_severity)
    : min_severity_(min_severity), file_(std::move(file)) {}

void LogFileSink::Send(const absl::LogEntry &entry) {
  const int severity = static_cast<int>(entry.log_severity());
  if (severity < static_cast<int>(min_severity_)) {
    return;
  }
  absl::MutexLock lock(&mutex_);
  file_ << entry.text_message_with_prefix_and_newline();
  if (severity >= static_cast<int>(absl::LogSeverity::kWarning)) {
    file_.flush();
  }
}

void LogFileSink::Flush() {
  absl::MutexLock lock(&mutex_);
  file_.flush();
}

absl::Status RegisterLogFile(const std::string &path) {
#ifdef NDEBUG
  constexpr absl::LogSeverityAtLeast kMinSeverity =
      absl::LogSeverityAtLeast::kWarning;
#else   // NDEBUG
  constexpr absl::LogSeverityAtLeast kMinSeverity =
      absl::LogSeverityAtLeast::kInfo;
#endif  // NDEBUG
  absl::StatusOr<std::unique_ptr<LogFileSink>> sink =
      LogFileSink::Open(path, kMinSeverity);
  if (!sink.ok()) {
    return sink.status();
  }
  // Registered sinks must outlive every logging call.
  absl::AddLogSink(sink->release());
  return absl::OkStatus();
}

}  // namespace kanabridge
