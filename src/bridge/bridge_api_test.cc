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

#include "bridge/bridge_api.h"

#include <cstddef>
#include <string>

#include "base/file_util.h"
#include "base/system_util.h"
#include "session/ffi_candidate.h"
#include "testing/gmock.h"
#include "testing/gunit.h"
#include "testing/kanabridge_test.h"

namespace kanabridge {
namespace {

using ::testing::HasSubstr;

class BridgeApiTest : public testing::TestWithTempUserProfile {
 protected:
  void SetUp() override {
    ASSERT_OK(FileUtil::SetContents(
        SystemUtil::GetSettingsFilePath(),
        R"({"dictionary": {"entries": [{"word": "幹事", "reading": "かんじ"}]}})"));
    Initialize(profile_dir().c_str(), false);
  }

  void TearDown() override { Shutdown(); }
};

TEST_F(BridgeApiTest, Composition) {
  int cursor = -1;
  EXPECT_STREQ(AppendText("kanji", &cursor), "かんじ");
  EXPECT_EQ(cursor, 3);
  EXPECT_STREQ(RemoveText(&cursor), "かん");
  EXPECT_EQ(cursor, 2);
  EXPECT_STREQ(MoveCursor(-5, &cursor), "かん");
  EXPECT_EQ(cursor, 0);
  ClearText();
  EXPECT_STREQ(AppendText("a", &cursor), "あ");
  EXPECT_EQ(cursor, 1);
}

TEST_F(BridgeApiTest, NullInputIsEmpty) {
  int cursor = -1;
  EXPECT_STREQ(AppendText(nullptr, &cursor), "");
  EXPECT_EQ(cursor, 0);
  SetContext(nullptr);
}

TEST_F(BridgeApiTest, GetComposedText) {
  AppendText("kanji", nullptr);
  size_t length = 0;
  const FfiCandidate *const *candidates = GetComposedText(&length);
  ASSERT_EQ(length, 3);
  EXPECT_STREQ(candidates[0]->text, "幹事");
  EXPECT_STREQ(candidates[1]->text, "かんじ");
  EXPECT_STREQ(candidates[2]->text, "カンジ");
  EXPECT_EQ(candidates[2]->corresponding_count, 3);

  LearnCandidate(1);
  LearnCandidate(10);
  EXPECT_STREQ(ShrinkText(2), "じ");
}

TEST_F(BridgeApiTest, LoadConfig) {
  ASSERT_OK(FileUtil::SetContents(
      SystemUtil::GetSettingsFilePath(),
      R"({"dictionary": {"entries": [{"word": "蔵", "reading": "くら"}]}})"));
  LoadConfig();
  AppendText("kura", nullptr);
  size_t length = 0;
  const FfiCandidate *const *candidates = GetComposedText(&length);
  ASSERT_GE(length, 1);
  EXPECT_STREQ(candidates[0]->text, "蔵");
}

TEST_F(BridgeApiTest, EngineStatus) {
  char *status = GetEngineStatus();
  ASSERT_NE(status, nullptr);
  EXPECT_THAT(std::string(status), HasSubstr("minimal"));
  FreeString(status);
}

TEST_F(BridgeApiTest, FreeArena) {
  AppendText("a", nullptr);
  FreeArena();
  size_t length = 1;
  EXPECT_EQ(GetComposedText(&length), nullptr);
  EXPECT_EQ(length, 0);
}

TEST_F(BridgeApiTest, InitializeReplacesSession) {
  int cursor = -1;
  EXPECT_STREQ(AppendText("ka", &cursor), "か");
  Initialize(profile_dir().c_str(), false);
  EXPECT_STREQ(AppendText("a", &cursor), "あ");
  EXPECT_EQ(cursor, 1);
}

TEST_F(BridgeApiTest, ShutdownTwice) {
  Shutdown();
  Shutdown();
  size_t length = 1;
  EXPECT_NE(GetComposedText(&length), nullptr);
  EXPECT_EQ(length, 0);
}

TEST_F(BridgeApiTest, CallsAfterShutdownUseDefaultSession) {
  Shutdown();
  int cursor = -1;
  EXPECT_STREQ(AppendText("ka", &cursor), "か");
  EXPECT_EQ(cursor, 1);
  ResetLearningMemory();
}

}  // namespace
}  // namespace kanabridge
