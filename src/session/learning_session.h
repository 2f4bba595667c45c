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

#ifndef KANABRIDGE_SESSION_LEARNING_SESSION_H_
#define KANABRIDGE_SESSION_LEARNING_SESSION_H_

#include <cstddef>
#include <vector>

#include "absl/status/status.h"
#include "engine/engine_interface.h"

namespace kanabridge {
namespace session {

// Reports user choices and composition boundaries to the engine. Only
// engine candidates are learnable; they are referred to by their index in
// the list last passed to Retain().
class LearningSession {
 public:
  // Does not take the ownership of `engine`.
  explicit LearningSession(EngineInterface *engine);

  LearningSession(const LearningSession &) = delete;
  LearningSession &operator=(const LearningSession &) = delete;

  // Keeps the engine output of the latest conversion.
  void Retain(std::vector<EngineCandidate> candidates);

  // Feeds the retained candidate at `index` to the engine and commits it.
  // An out of range index is logged and ignored.
  absl::Status Accept(int index);

  // Forgets everything the engine has learned.
  absl::Status Reset();

  // Tells the engine that the current composition is over, so that its
  // per-composition caches are dropped.
  void EndComposition();

  const std::vector<EngineCandidate> &retained() const { return retained_; }

 private:
  EngineInterface *engine_;
  std::vector<EngineCandidate> retained_;
};

}  // namespace session
}  // namespace kanabridge

#endif  // KANABRIDGE_SESSION_LEARNING_SESSION_H_
