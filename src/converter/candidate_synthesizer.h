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

// Builds the candidate list shown for the current composition.
//
// Candidates come from four sources and are ordered by source:
//   1. words registered in the user dictionary under the whole composition,
//   2. words registered under a strict prefix of the composition,
//   3. date and time renderings of temporal keywords,
//   4. the conversion engine.
// The order within a source is kept.

#ifndef KANABRIDGE_CONVERTER_CANDIDATE_SYNTHESIZER_H_
#define KANABRIDGE_CONVERTER_CANDIDATE_SYNTHESIZER_H_

#include <cstddef>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "composer/composing_text.h"
#include "config/user_dictionary.h"
#include "converter/candidate.h"
#include "engine/engine_interface.h"
#include "request/conversion_request.h"

namespace kanabridge {
namespace converter {

class CandidateSynthesizer {
 public:
  struct Result {
    std::vector<Candidate> candidates;
    // The engine output the ENGINE candidates were made from. Kept for
    // learning.
    std::vector<EngineCandidate> engine_candidates;
  };

  // Does not take the ownership of `engine`.
  explicit CandidateSynthesizer(EngineInterface *engine);

  CandidateSynthesizer(const CandidateSynthesizer &) = delete;
  CandidateSynthesizer &operator=(const CandidateSynthesizer &) = delete;

  // Returns at most `max_size` candidates for `composing_text`.
  // `request.key()` must be the phonetic text of `composing_text`. The
  // composing text is not modified. An engine failure only drops the engine
  // candidates.
  Result Synthesize(const composer::ComposingText &composing_text,
                    const config::UserDictionary &dictionary,
                    const ConversionRequest &request, size_t max_size) const;

  static std::vector<Candidate> GetUserDictionaryExactCandidates(
      absl::string_view key, const config::UserDictionary &dictionary);
  static std::vector<Candidate> GetUserDictionaryPrefixCandidates(
      absl::string_view key, const config::UserDictionary &dictionary);
  static std::vector<Candidate> GetCalendarCandidates(absl::string_view key);
  static std::vector<Candidate> GetEngineCandidates(
      const composer::ComposingText &composing_text,
      absl::Span<const EngineCandidate> engine_candidates);

  // Joins the words of `candidate` while its readings fit in `key`. When the
  // rest of the key is shorter than the next reading, the rest is appended
  // as is. Falls back to `candidate.text` when the engine gave no words.
  static std::string BuildCandidateValue(const EngineCandidate &candidate,
                                         absl::string_view key);

  // Sorts by source rank, keeping the order within a source, and drops the
  // candidates beyond `max_size`.
  static void MergeCandidates(size_t max_size,
                              std::vector<Candidate> *candidates);

 private:
  EngineInterface *engine_;
};

}  // namespace converter
}  // namespace kanabridge

#endif  // KANABRIDGE_CONVERTER_CANDIDATE_SYNTHESIZER_H_
