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

#ifndef KANABRIDGE_TESTING_KANABRIDGE_TEST_H_
#define KANABRIDGE_TESTING_KANABRIDGE_TEST_H_

#include <string>

#include "base/file/temp_dir.h"
#include "testing/gunit.h"

namespace kanabridge {
namespace testing {

// Creates a new scratch directory, or terminates the test on failure.
TempDirectory MakeTempDirectoryOrDie();

// A test base fixture class for tests that use the user profile directory.
// During the construction, it sets the user profile directory to a unique
// temporary directory, which is deleted at the end of the test.
// Derive your test fixtures from TestWithTempUserProfile instead of
// ::testing::Test.
class TestWithTempUserProfile : public ::testing::Test {
 protected:
  TestWithTempUserProfile();
  ~TestWithTempUserProfile() override;

  const std::string &profile_dir() const { return temp_dir_.path(); }

 private:
  TempDirectory temp_dir_;
  std::string original_dir_;
};

}  // namespace testing
}  // namespace kanabridge

#endif  // KANABRIDGE_TESTING_KANABRIDGE_TEST_H_
