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

#ifndef KANABRIDGE_ENGINE_ENGINE_MOCK_H_
#define KANABRIDGE_ENGINE_ENGINE_MOCK_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "engine/engine_interface.h"
#include "request/conversion_request.h"
#include "testing/gmock.h"

namespace kanabridge {

class MockEngine : public EngineInterface {
 public:
  MOCK_METHOD(absl::StatusOr<std::vector<EngineCandidate>>, RequestCandidates,
              (const ConversionRequest &request), (override));
  MOCK_METHOD(absl::Status, UpdateLearningData,
              (const EngineCandidate &candidate), (override));
  MOCK_METHOD(absl::Status, CommitUpdateLearningData, (), (override));
  MOCK_METHOD(absl::Status, ResetMemory, (), (override));
  MOCK_METHOD(void, StopComposition, (), (override));
  MOCK_METHOD(std::string, GetStatus, (), (const, override));
};

}  // namespace kanabridge

#endif  // KANABRIDGE_ENGINE_ENGINE_MOCK_H_
