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

#include "base/file_util.h"

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "base/file/temp_dir.h"
#include "testing/gunit.h"
#include "testing/kanabridge_test.h"

namespace kanabridge {
namespace {

TEST(FileUtilTest, CreateDirectoryIsIdempotent) {
  TempDirectory temp_dir = testing::MakeTempDirectoryOrDie();
  const std::string dirpath = FileUtil::JoinPath(temp_dir.path(), "testdir");
  ASSERT_FALSE(FileUtil::FileExists(dirpath).ok());

  EXPECT_OK(FileUtil::CreateDirectory(dirpath));
  EXPECT_OK(FileUtil::DirectoryExists(dirpath));
  EXPECT_OK(FileUtil::CreateDirectory(dirpath));

  ASSERT_OK(FileUtil::DeleteRecursively(dirpath));
  EXPECT_TRUE(absl::IsNotFound(FileUtil::FileExists(dirpath)));
}

TEST(FileUtilTest, DirectoryExistsRejectsRegularFile) {
  TempDirectory temp_dir = testing::MakeTempDirectoryOrDie();
  const std::string filepath = FileUtil::JoinPath(temp_dir.path(), "testfile");
  ASSERT_OK(FileUtil::SetContents(filepath, "test data"));

  EXPECT_OK(FileUtil::FileExists(filepath));
  EXPECT_FALSE(FileUtil::DirectoryExists(filepath).ok());

  ASSERT_OK(FileUtil::Unlink(filepath));
  EXPECT_TRUE(absl::IsNotFound(FileUtil::Unlink(filepath)));
}

TEST(FileUtilTest, GetContentsReturnsWhatSetContentsWrote) {
  TempDirectory temp_dir = testing::MakeTempDirectoryOrDie();
  const std::string filepath = FileUtil::JoinPath(temp_dir.path(), "a.json");
  ASSERT_OK(FileUtil::SetContents(filepath, "{\"engine\":{}}\n"));

  absl::StatusOr<std::string> content = FileUtil::GetContents(filepath);
  ASSERT_OK(content);
  EXPECT_EQ(*content, "{\"engine\":{}}\n");

  EXPECT_TRUE(absl::IsNotFound(
      FileUtil::GetContents(filepath + ".missing").status()));
}

TEST(FileUtilTest, DeleteRecursivelyRemovesTree) {
  TempDirectory temp_dir = testing::MakeTempDirectoryOrDie();
  const std::string root = FileUtil::JoinPath(temp_dir.path(), "root");
  const std::string child = FileUtil::JoinPath(root, "child");
  ASSERT_OK(FileUtil::CreateDirectory(root));
  ASSERT_OK(FileUtil::CreateDirectory(child));
  ASSERT_OK(FileUtil::SetContents(FileUtil::JoinPath(child, "f"), "x"));

  EXPECT_OK(FileUtil::DeleteRecursively(root));
  EXPECT_FALSE(FileUtil::FileExists(root).ok());
  EXPECT_OK(FileUtil::DeleteRecursively(root));
}

TEST(FileUtilTest, JoinPathAndBasename) {
  EXPECT_EQ(FileUtil::JoinPath({"/a", "", "b/", "c"}), "/a/b/c");
  EXPECT_EQ(FileUtil::JoinPath("/a/", "b"), "/a/b");
  EXPECT_EQ(FileUtil::Basename("/usr/bin/bridge_main"), "bridge_main");
  EXPECT_EQ(FileUtil::Basename("bridge_main"), "bridge_main");
}

}  // namespace
}  // namespace kanabridge
