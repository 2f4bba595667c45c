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

#include "engine/minimal_engine.h"

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "base/strings/japanese.h"
#include "base/strings/unicode.h"
#include "engine/engine_interface.h"
#include "request/conversion_request.h"

namespace kanabridge {
namespace {

EngineCandidate MakeAsIsCandidate(const absl::string_view key,
                                  const absl::string_view value) {
  EngineCandidate candidate;
  candidate.text = std::string(value);
  candidate.data.push_back({std::string(value), std::string(key)});
  candidate.consumed_count = strings::CharsLen(key);
  return candidate;
}

}  // namespace

absl::StatusOr<std::vector<EngineCandidate>> MinimalEngine::RequestCandidates(
    const ConversionRequest &request) {
  ++request_count_;
  std::vector<EngineCandidate> candidates;
  const std::string &key = request.key();
  if (key.empty()) {
    return candidates;
  }
  candidates.push_back(MakeAsIsCandidate(key, key));
  const std::string katakana = japanese::HiraganaToKatakana(key);
  if (katakana != key) {
    candidates.push_back(MakeAsIsCandidate(key, katakana));
  }
  return candidates;
}

absl::Status MinimalEngine::UpdateLearningData(
    const EngineCandidate &candidate) {
  return absl::OkStatus();
}

absl::Status MinimalEngine::CommitUpdateLearningData() {
  return absl::OkStatus();
}

absl::Status MinimalEngine::ResetMemory() { return absl::OkStatus(); }

std::string MinimalEngine::GetStatus() const {
  return absl::StrFormat(R"({"engine":"minimal","requests":%d})",
                         request_count_);
}

}  // namespace kanabridge
