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

#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "base/file_util.h"
#include "testing/gunit.h"

namespace kanabridge {
namespace {

TEST(TempDirectoryTest, RemovedWithContentsOnDestruction) {
  std::string path;
  {
    absl::StatusOr<TempDirectory> dir = TempDirectory::Create();
    ASSERT_OK(dir);
    path = dir->path();
    EXPECT_OK(FileUtil::DirectoryExists(path));
    ASSERT_OK(FileUtil::SetContents(FileUtil::JoinPath(path, "settings.json"),
                                    "{}"));
  }
  EXPECT_TRUE(absl::IsNotFound(FileUtil::FileExists(path)));
}

TEST(TempDirectoryTest, MovedFromDoesNotRemove) {
  absl::StatusOr<TempDirectory> dir = TempDirectory::Create();
  ASSERT_OK(dir);
  const std::string path = dir->path();
  {
    TempDirectory owner = *std::move(dir);
    EXPECT_EQ(owner.path(), path);
  }
  EXPECT_TRUE(absl::IsNotFound(FileUtil::FileExists(path)));
}

TEST(TempDirectoryTest, UniquePaths) {
  absl::StatusOr<TempDirectory> a = TempDirectory::Create();
  absl::StatusOr<TempDirectory> b = TempDirectory::Create();
  ASSERT_OK(a);
  ASSERT_OK(b);
  EXPECT_NE(a->path(), b->path());
}

}  // namespace
}  // namespace kanabridge
