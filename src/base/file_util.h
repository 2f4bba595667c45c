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

#ifndef KANABRIDGE_BASE_FILE_UTIL_H_
#define KANABRIDGE_BASE_FILE_UTIL_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"

namespace kanabridge {

// File system helpers. Every fallible operation returns absl::Status.
class FileUtil {
 public:
  FileUtil() = delete;
  ~FileUtil() = delete;

  // Creates a directory. Does not create directories in the way to the path.
  // Returns OkStatus and does nothing if the directory already exists.
  static absl::Status CreateDirectory(const std::string &path);

  static absl::Status Unlink(const std::string &filename);

  // Removes `path` and everything below it. Returns OK when `path` doesn't
  // exist.
  static absl::Status DeleteRecursively(const std::string &path);

  // Returns OK if a file or a directory with the name exists.
  static absl::Status FileExists(const std::string &filename);

  // Returns OK if the directory exists.
  static absl::Status DirectoryExists(const std::string &dirname);

  // Joins the give path components using the path delimiter.
  static std::string JoinPath(absl::Span<const absl::string_view> components);
  static std::string JoinPath(absl::string_view path1,
                              absl::string_view path2) {
    return JoinPath({path1, path2});
  }

  // "/usr/bin/bridge_main" -> "bridge_main".
  static std::string Basename(const std::string &filename);

  // Reads the contents of the file `filename` and returns it.
  static absl::StatusOr<std::string> GetContents(const std::string &filename);

  // Writes the data provided in `content` to the file `filename`, overwriting
  // any existing content.
  static absl::Status SetContents(const std::string &filename,
                                  absl::string_view content);
};

}  // namespace kanabridge

#endif  // KANABRIDGE_BASE_FILE_UTIL_H_
