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

#include "base/system_util.h"

#include <pwd.h>
#include <unistd.h>

#include <cstdlib>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "base/file_util.h"
#include "base/singleton.h"

namespace kanabridge {
namespace {

constexpr char kProductDirName[] = "kanabridge";
constexpr char kSettingsFileName[] = "settings.json";
constexpr char kMemoryDirName[] = "memory";

std::string GetEnv(const char *name) {
  const char *value = std::getenv(name);
  return value == nullptr ? "" : value;
}

class UserProfileDirectoryImpl final {
 public:
  UserProfileDirectoryImpl() = default;
  ~UserProfileDirectoryImpl() = default;

  std::string GetDir();
  void SetDir(const std::string &dir);

 private:
  static std::string GetDefaultDirectory();

  std::string dir_ ABSL_GUARDED_BY(mutex_);
  absl::Mutex mutex_;
};

std::string UserProfileDirectoryImpl::GetDir() {
  absl::MutexLock l(&mutex_);
  if (!dir_.empty()) {
    return dir_;
  }
  const std::string dir = GetDefaultDirectory();
  if (absl::Status s = FileUtil::CreateDirectory(dir); !s.ok()) {
    LOG(ERROR) << "Failed to create directory: " << dir << ": " << s;
  }
  dir_ = dir;
  return dir_;
}

void UserProfileDirectoryImpl::SetDir(const std::string &dir) {
  absl::MutexLock l(&mutex_);
  dir_ = dir;
}

std::string UserProfileDirectoryImpl::GetDefaultDirectory() {
  // https://specifications.freedesktop.org/basedir-spec/basedir-spec-latest.html
  const std::string xdg_config_home = GetEnv("XDG_CONFIG_HOME");
  if (!xdg_config_home.empty()) {
    return FileUtil::JoinPath(xdg_config_home, kProductDirName);
  }
  std::string home = GetEnv("HOME");
  if (home.empty()) {
    char buf[1024];
    struct passwd pw, *ppw = nullptr;
    if (getpwuid_r(geteuid(), &pw, buf, sizeof(buf), &ppw) != 0 ||
        ppw == nullptr) {
      LOG(ERROR) << "Can't get passwd entry for uid " << geteuid();
      return kProductDirName;
    }
    home = pw.pw_dir;
  }
  const std::string config_dir = FileUtil::JoinPath(home, ".config");
  if (absl::Status s = FileUtil::CreateDirectory(config_dir); !s.ok()) {
    LOG(ERROR) << s;
  }
  return FileUtil::JoinPath(config_dir, kProductDirName);
}

}  // namespace

std::string SystemUtil::GetUserProfileDirectory() {
  return Singleton<UserProfileDirectoryImpl>::get()->GetDir();
}

void SystemUtil::SetUserProfileDirectory(const std::string &path) {
  Singleton<UserProfileDirectoryImpl>::get()->SetDir(path);
}

std::string SystemUtil::GetSettingsFilePath() {
  return FileUtil::JoinPath(GetUserProfileDirectory(), kSettingsFileName);
}

std::string SystemUtil::GetLearningMemoryDirectory() {
  const std::string dir =
      FileUtil::JoinPath(GetUserProfileDirectory(), kMemoryDirName);
  if (absl::Status s = FileUtil::CreateDirectory(dir); !s.ok()) {
    LOG(ERROR) << "Failed to create learning memory directory: " << s;
  }
  return dir;
}

}  // namespace kanabridge
