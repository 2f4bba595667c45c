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

#include "session/learning_session.h"

#include <cstddef>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "base/vlog.h"
#include "engine/engine_interface.h"

namespace kanabridge {
namespace session {

LearningSession::LearningSession(EngineInterface *engine) : engine_(engine) {
  DCHECK(engine_);
}

void LearningSession::Retain(std::vector<EngineCandidate> candidates) {
  retained_ = std::move(candidates);
}

absl::Status LearningSession::Accept(const int index) {
  if (index < 0 || static_cast<size_t>(index) >= retained_.size()) {
    LOG(WARNING) << "Candidate index out of range: " << index << " (size "
                 << retained_.size() << ")";
    return absl::OkStatus();
  }
  const EngineCandidate &candidate = retained_[index];
  KANABRIDGE_VLOG(1) << "Learning " << candidate.text;
  if (absl::Status status = engine_->UpdateLearningData(candidate);
      !status.ok()) {
    return status;
  }
  return engine_->CommitUpdateLearningData();
}

absl::Status LearningSession::Reset() {
  retained_.clear();
  return engine_->ResetMemory();
}

void LearningSession::EndComposition() { engine_->StopComposition(); }

}  // namespace session
}  // namespace kanabridge
