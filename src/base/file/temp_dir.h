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

#ifndef KANABRIDGE_BASE_FILE_TEMP_DIR_H_
#define KANABRIDGE_BASE_FILE_TEMP_DIR_H_

#include <string>

#include "absl/status/statusor.h"

namespace kanabridge {

// A uniquely named directory which is deleted with its contents when the
// object goes out of scope. Used by tests as a scratch user profile.
class TempDirectory {
 public:
  // Creates "kanabridge-XXXXXX" under $TEST_TMPDIR, $TMPDIR or /tmp,
  // whichever is set and exists first.
  static absl::StatusOr<TempDirectory> Create();

  TempDirectory(TempDirectory &&other);
  TempDirectory &operator=(TempDirectory &&other);
  ~TempDirectory();

  const std::string &path() const { return path_; }

 private:
  explicit TempDirectory(std::string path);

  // Empty once moved from.
  std::string path_;
};

}  // namespace kanabridge

#endif  // KANABRIDGE_BASE_FILE_TEMP_DIR_H_
