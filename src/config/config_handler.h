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

// Handler of kanabridge configuration.

#ifndef KANABRIDGE_CONFIG_CONFIG_HANDLER_H_
#define KANABRIDGE_CONFIG_CONFIG_HANDLER_H_

#include <memory>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "config/user_dictionary.h"
#include "protocol/config.pb.h"

namespace kanabridge {
namespace config {

// Holds the current Config and the UserDictionary built from it. Both are
// replaced as a whole, so readers may keep the returned shared_ptr while
// another config is being loaded.
class ConfigHandler {
 public:
  // Uses SystemUtil::GetSettingsFilePath().
  ConfigHandler();
  explicit ConfigHandler(std::string settings_path);

  ConfigHandler(const ConfigHandler &) = delete;
  ConfigHandler &operator=(const ConfigHandler &) = delete;

  std::shared_ptr<const Config> GetSharedConfig() const
      ABSL_LOCKS_EXCLUDED(mutex_);
  std::shared_ptr<const UserDictionary> GetSharedUserDictionary() const
      ABSL_LOCKS_EXCLUDED(mutex_);

  // Replaces the in-memory config. The settings file is not touched.
  void SetConfig(Config config) ABSL_LOCKS_EXCLUDED(mutex_);

  // Reloads the settings file. When the file is missing or broken, the
  // current config is kept and the error is returned.
  absl::Status Reload() ABSL_LOCKS_EXCLUDED(mutex_);

  const std::string &settings_path() const { return settings_path_; }

  static const Config &DefaultConfig();

  // Converts the contents of a settings file to Config. Accepts the legacy
  // layout {"zenzai": {"enable": ..., "profile": ...}} too.
  static absl::StatusOr<Config> ParseSettings(absl::string_view json);

  // Renders `config` in the settings file format.
  static std::string SerializeSettings(const Config &config);

 private:
  const std::string settings_path_;
  std::shared_ptr<const Config> config_ ABSL_GUARDED_BY(mutex_);
  std::shared_ptr<const UserDictionary> dictionary_ ABSL_GUARDED_BY(mutex_);
  mutable absl::Mutex mutex_;
};

}  // namespace config
}  // namespace kanabridge

#endif  // KANABRIDGE_CONFIG_CONFIG_HANDLER_H_
