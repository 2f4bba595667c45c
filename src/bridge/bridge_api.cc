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
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <utility>

#include "absl/base/const_init.h"
#include "absl/base/thread_annotations.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "base/vlog.h"
#include "session/ffi_candidate.h"
#include "session/session.h"

namespace kanabridge {
namespace {

using ::kanabridge::session::Session;

absl::Mutex g_mutex(absl::kConstInit);
std::unique_ptr<Session> g_session ABSL_GUARDED_BY(g_mutex);

Session &GetSession() ABSL_EXCLUSIVE_LOCKS_REQUIRED(g_mutex) {
  if (g_session == nullptr) {
    KANABRIDGE_VLOG(1) << "Creating the default session";
    g_session = std::make_unique<Session>();
  }
  return *g_session;
}

void ResetSession(std::unique_ptr<Session> session)
    ABSL_EXCLUSIVE_LOCKS_REQUIRED(g_mutex) {
  g_session = std::move(session);
}

absl::string_view ToStringView(const char *str, absl::string_view name) {
  if (str == nullptr) {
    LOG(WARNING) << name << " is null";
    return absl::string_view();
  }
  return str;
}

}  // namespace
}  // namespace kanabridge

using ::kanabridge::g_mutex;
using ::kanabridge::GetSession;

void Initialize(const char *path, bool use_engine) {
  const std::string install_dir(kanabridge::ToStringView(path, "path"));
  absl::MutexLock lock(&g_mutex);
  kanabridge::ResetSession(
      kanabridge::session::Session::Create(install_dir, use_engine));
}

void LoadConfig(void) {
  absl::MutexLock lock(&g_mutex);
  // Failures are logged by the config handler.
  GetSession().LoadConfig().IgnoreError();
}

const char *AppendText(const char *input, int *cursor) {
  absl::MutexLock lock(&g_mutex);
  return GetSession().AppendText(kanabridge::ToStringView(input, "input"),
                                 cursor);
}

const char *RemoveText(int *cursor) {
  absl::MutexLock lock(&g_mutex);
  return GetSession().RemoveText(cursor);
}

const char *MoveCursor(int32_t offset, int *cursor) {
  absl::MutexLock lock(&g_mutex);
  return GetSession().MoveCursor(offset, cursor);
}

void ClearText(void) {
  absl::MutexLock lock(&g_mutex);
  GetSession().ClearText();
}

const FfiCandidate *const *GetComposedText(size_t *length) {
  size_t size = 0;
  const FfiCandidate *const *candidates;
  {
    absl::MutexLock lock(&g_mutex);
    candidates = GetSession().GetComposedText(&size);
  }
  if (length != nullptr) {
    *length = size;
  }
  return candidates;
}

const char *ShrinkText(int32_t offset) {
  absl::MutexLock lock(&g_mutex);
  return GetSession().ShrinkText(offset);
}

void SetContext(const char *context) {
  absl::MutexLock lock(&g_mutex);
  GetSession().SetContext(kanabridge::ToStringView(context, "context"));
}

void LearnCandidate(int32_t index) {
  absl::MutexLock lock(&g_mutex);
  GetSession().LearnCandidate(index);
}

void ResetLearningMemory(void) {
  absl::MutexLock lock(&g_mutex);
  GetSession().ResetLearningMemory();
}

char *GetEngineStatus(void) {
  std::string status;
  {
    absl::MutexLock lock(&g_mutex);
    status = GetSession().GetEngineStatus();
  }
  return strdup(status.c_str());
}

void FreeString(char *str) { std::free(str); }

void FreeArena(void) {
  absl::MutexLock lock(&g_mutex);
  GetSession().FreeArena();
}

void Shutdown(void) {
  absl::MutexLock lock(&g_mutex);
  kanabridge::ResetSession(nullptr);
}
