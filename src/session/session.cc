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

#include "session/session.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "base/file_util.h"
#include "base/system_util.h"
#include "base/vlog.h"
#include "composer/composing_text.h"
#include "config/config_handler.h"
#include "converter/candidate.h"
#include "converter/candidate_synthesizer.h"
#include "engine/engine_factory.h"
#include "engine/engine_interface.h"
#include "engine/minimal_engine.h"
#include "request/conversion_request.h"
#include "session/ffi_candidate.h"

namespace kanabridge {
namespace session {
namespace {

constexpr absl::string_view kDictionaryDirName = "Dictionary";
// Converted once on start up so that the engine loads its models.
constexpr absl::string_view kWarmUpKey = "あ";

}  // namespace

Session::Session()
    : Session(std::make_unique<MinimalEngine>(),
              std::make_unique<config::ConfigHandler>(),
              ConversionRequest::Options()) {
  // Failures are logged by the handler; the default config is used then.
  LoadConfig().IgnoreError();
}

Session::Session(std::unique_ptr<EngineInterface> engine,
                 std::unique_ptr<config::ConfigHandler> config_handler,
                 ConversionRequest::Options options)
    : engine_(std::move(engine)),
      config_handler_(std::move(config_handler)),
      options_(std::move(options)),
      synthesizer_(engine_.get()),
      learning_session_(engine_.get()) {
  CHECK(engine_);
  CHECK(config_handler_);
}

std::unique_ptr<Session> Session::Create(const std::string &install_dir,
                                         const bool use_library) {
  auto config_handler = std::make_unique<config::ConfigHandler>();
  config_handler->Reload().IgnoreError();

  ConversionRequest::Options options;
  options.dictionary_dir = FileUtil::JoinPath(install_dir, kDictionaryDirName);
  options.memory_dir = SystemUtil::GetLearningMemoryDirectory();
  if (absl::Status s = FileUtil::DirectoryExists(options.dictionary_dir);
      !s.ok()) {
    LOG(WARNING) << "Dictionary directory is not available: " << s;
  }

  std::unique_ptr<EngineInterface> engine =
      EngineFactory::Create(use_library, install_dir, options);
  auto session = std::make_unique<Session>(
      std::move(engine), std::move(config_handler), std::move(options));
  session->WarmUp();
  LOG(INFO) << "Session is initialized: " << session->GetEngineStatus();
  return session;
}

void Session::WarmUp() {
  const ConversionRequest request =
      ConversionRequestBuilder()
          .SetKey(kWarmUpKey)
          .SetOptions(options_)
          .SetConfig(*config_handler_->GetSharedConfig())
          .Build();
  if (absl::StatusOr<std::vector<EngineCandidate>> result =
          engine_->RequestCandidates(request);
      !result.ok()) {
    LOG(WARNING) << "Warm-up request failed: " << result.status();
  }
  learning_session_.EndComposition();
}

absl::Status Session::LoadConfig() { return config_handler_->Reload(); }

const char *Session::WriteText(int *cursor) {
  if (cursor != nullptr) {
    *cursor = static_cast<int>(composing_text_.cursor());
  }
  return arena_.WriteTransient(composing_text_.GetString());
}

const char *Session::AppendText(const absl::string_view input, int *cursor) {
  composing_text_.Append(input);
  return WriteText(cursor);
}

const char *Session::RemoveText(int *cursor) {
  composing_text_.DeleteBackward(1);
  return WriteText(cursor);
}

const char *Session::MoveCursor(const int offset, int *cursor) {
  const size_t previous = composing_text_.cursor();
  composing_text_.MoveCursor(offset);
  KANABRIDGE_VLOG(2) << "offset: " << offset << ", cursor: " << previous
                     << " -> " << composing_text_.cursor();
  return WriteText(cursor);
}

void Session::ClearText() {
  composing_text_.Clear();
  learning_session_.EndComposition();
}

ConversionRequest Session::MakeRequest() const {
  return ConversionRequestBuilder()
      .SetComposingText(composing_text_)
      .SetLeftContext(left_context_)
      .SetOptions(options_)
      .SetConfig(*config_handler_->GetSharedConfig())
      .Build();
}

const FfiCandidate *const *Session::GetComposedText(size_t *size) {
  DCHECK(size);
  *size = 0;
  if (arena_.released()) {
    LOG(WARNING) << "GetComposedText is called after FreeArena";
    return nullptr;
  }

  const std::shared_ptr<const config::UserDictionary> dictionary =
      config_handler_->GetSharedUserDictionary();
  converter::CandidateSynthesizer::Result result = synthesizer_.Synthesize(
      composing_text_, *dictionary, MakeRequest(), arena_.slot_count());
  learning_session_.Retain(std::move(result.engine_candidates));

  const std::vector<converter::Candidate> &candidates = result.candidates;
  for (size_t i = 0; i < candidates.size(); ++i) {
    const converter::Candidate &candidate = candidates[i];
    arena_.WriteCandidate(i, candidate.value, candidate.remainder,
                          candidate.key,
                          static_cast<int32_t>(candidate.consumed_count));
  }
  *size = candidates.size();
  return arena_.Snapshot(candidates.size());
}

const char *Session::ShrinkText(const int count) {
  composing_text_.AcceptPrefix(static_cast<size_t>(std::max(count, 0)));
  learning_session_.EndComposition();
  return WriteText(nullptr);
}

void Session::SetContext(const absl::string_view context) {
  left_context_ = std::string(context);
}

void Session::LearnCandidate(const int index) {
  if (absl::Status s = learning_session_.Accept(index); !s.ok()) {
    LOG(ERROR) << "Failed to learn candidate " << index << ": " << s;
  }
}

void Session::ResetLearningMemory() {
  if (absl::Status s = learning_session_.Reset(); !s.ok()) {
    LOG(ERROR) << "Failed to reset learning memory: " << s;
  }
}

std::string Session::GetEngineStatus() const { return engine_->GetStatus(); }

void Session::FreeArena() { arena_.Release(); }

}  // namespace session
}  // namespace kanabridge
