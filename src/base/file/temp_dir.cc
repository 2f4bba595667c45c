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

#include "base/file/temp_dir.h"

#include <stdlib.h>

#include <cerrno>
#include <cstdlib>
#include <string>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "base/file_util.h"

namespace kanabridge {
namespace {

std::string GetBaseDirectory() {
  for (const char *name : {"TEST_TMPDIR", "TMPDIR"}) {
    const char *env = std::getenv(name);
    if (env != nullptr && env[0] != '\0' &&
        FileUtil::DirectoryExists(env).ok()) {
      return env;
    }
  }
  return "/tmp";
}

}  // namespace

absl::StatusOr<TempDirectory> TempDirectory::Create() {
  std::string path =
      FileUtil::JoinPath(GetBaseDirectory(), "kanabridge-XXXXXX");
  if (::mkdtemp(path.data()) == nullptr) {
    return absl::ErrnoToStatus(errno, absl::StrCat("mkdtemp failed: ", path));
  }
  return TempDirectory(std::move(path));
}

TempDirectory::TempDirectory(std::string path) : path_(std::move(path)) {}

TempDirectory::TempDirectory(TempDirectory &&other)
    : path_(std::exchange(other.path_, std::string())) {}

TempDirectory &TempDirectory::operator=(TempDirectory &&other) {
  std::swap(path_, other.path_);
  return *this;
}

TempDirectory::~TempDirectory() {
  if (path_.empty()) {
    return;
  }
  if (const absl::Status s = FileUtil::DeleteRecursively(path_); !s.ok()) {
    LOG(WARNING) << "Cannot remove " << path_ << ": " << s;
  }
}

}  // namespace kanabridge
