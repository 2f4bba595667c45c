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

#ifndef KANABRIDGE_ENGINE_ENGINE_INTERFACE_H_
#define KANABRIDGE_ENGINE_ENGINE_INTERFACE_H_

#include <cstddef>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "request/conversion_request.h"

namespace kanabridge {

// A conversion result of the engine.
struct EngineCandidate {
  // A word and the part of the key it was converted from.
  struct Fragment {
    std::string word;
    std::string ruby;
  };

  // Converted text as given by the engine.
  std::string text;
  std::vector<Fragment> data;
  // Number of characters of the key this candidate accounts for.
  size_t consumed_count = 0;
};

// The kana-kanji conversion engine. Implementations keep per-composition
// caches and learned data; callers report composition boundaries with
// StopComposition().
class EngineInterface {
 public:
  EngineInterface(const EngineInterface &) = delete;
  EngineInterface &operator=(const EngineInterface &) = delete;

  virtual ~EngineInterface() = default;

  // Returns the candidates for `request.key()`, best first.
  virtual absl::StatusOr<std::vector<EngineCandidate>> RequestCandidates(
      const ConversionRequest &request) = 0;

  // Feeds an accepted candidate to the learning data. The update becomes
  // effective on CommitUpdateLearningData().
  virtual absl::Status UpdateLearningData(const EngineCandidate &candidate) = 0;
  virtual absl::Status CommitUpdateLearningData() = 0;

  // Forgets everything learned so far.
  virtual absl::Status ResetMemory() = 0;

  // Drops the caches bound to the current composition.
  virtual void StopComposition() = 0;

  // Returns diagnostic information as a JSON object.
  virtual std::string GetStatus() const = 0;

 protected:
  EngineInterface() = default;
};

}  // namespace kanabridge

#endif  // KANABRIDGE_ENGINE_ENGINE_INTERFACE_H_
