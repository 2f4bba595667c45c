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

#ifndef KANABRIDGE_BASE_LOG_FILE_H_
#define KANABRIDGE_BASE_LOG_FILE_H_

#include <fstream>
#include <memory>
#include <string>

#include "absl/base/log_severity.h"
#include "absl/base/thread_annotations.h"
#include "absl/log/log_entry.h"
#include "absl/log/log_sink.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"

namespace kanabridge {

// Appends log messages of `min_severity` and above to a file. Warnings and
// errors are flushed immediately, since the host application may go down
// right after them.
class LogFileSink : public absl::LogSink {
 public:
  static absl::StatusOr<std::unique_ptr<LogFileSink>> Open(
      const std::string &path, absl::LogSeverityAtLeast min_severity);

  LogFileSink(const LogFileSink &) = delete;
  LogFileSink &operator=(const LogFileSink &) = delete;

  void Send(const absl::LogEntry &entry) override;
  void Flush() override;

 private:
  LogFileSink(std::ofstream file, absl::LogSeverityAtLeast min_severity);

  const absl::LogSeverityAtLeast min_severity_;
  absl::Mutex mutex_;
  std::ofstream file_ ABSL_GUARDED_BY(mutex_);
};

// Opens `path` and copies the log there until the process exits. Debug
// builds copy every message, release builds warnings and above.
absl::Status RegisterLogFile(const std::string &path);

}  // namespace kanabridge

#endif  // KANABRIDGE_BASE_LOG_FILE_H_
