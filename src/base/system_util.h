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

#ifndef KANABRIDGE_BASE_SYSTEM_UTIL_H_
#define KANABRIDGE_BASE_SYSTEM_UTIL_H_

#include <string>

namespace kanabridge {

// Paths owned by the current user.
class SystemUtil {
 public:
  SystemUtil() = delete;
  SystemUtil(const SystemUtil&) = delete;
  SystemUtil& operator=(const SystemUtil&) = delete;

  // Returns "$XDG_CONFIG_HOME/kanabridge", or "$HOME/.config/kanabridge" when
  // XDG_CONFIG_HOME is not set. The directory is created on first access.
  static std::string GetUserProfileDirectory();

  // Overrides the user profile directory. Mainly for unit tests.
  static void SetUserProfileDirectory(const std::string& path);

  // Returns the path of settings.json under the user profile directory.
  static std::string GetSettingsFilePath();

  // Returns the directory the conversion engine keeps its learning data in.
  static std::string GetLearningMemoryDirectory();
};

}  // namespace kanabridge

#endif  // KANABRIDGE_BASE_SYSTEM_UTIL_H_
