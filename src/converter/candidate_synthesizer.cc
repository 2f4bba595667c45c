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

#include "converter/candidate_synthesizer.h"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "base/strings/unicode.h"
#include "base/vlog.h"
#include "composer/composing_text.h"
#include "config/user_dictionary.h"
#include "converter/candidate.h"
#include "engine/engine_interface.h"
#include "request/conversion_request.h"
#include "rewriter/date_rewriter.h"

namespace kanabridge {
namespace converter {
namespace {

void AppendCandidates(std::vector<Candidate> from, std::vector<Candidate> *to) {
  to->insert(to->end(), std::make_move_iterator(from.begin()),
             std::make_move_iterator(from.end()));
}

}  // namespace

CandidateSynthesizer::CandidateSynthesizer(EngineInterface *engine)
    : engine_(engine) {
  DCHECK(engine_);
}

CandidateSynthesizer::Result CandidateSynthesizer::Synthesize(
    const composer::ComposingText &composing_text,
    const config::UserDictionary &dictionary, const ConversionRequest &request,
    const size_t max_size) const {
  const std::string &key = request.key();
  DCHECK_EQ(key, composing_text.GetString());

  Result result;
  // The engine is asked even for an empty key so that it sees every
  // composition state.
  absl::StatusOr<std::vector<EngineCandidate>> engine_candidates =
      engine_->RequestCandidates(request);
  if (!engine_candidates.ok()) {
    LOG(WARNING) << "Engine request failed: " << engine_candidates.status();
  } else if (!key.empty()) {
    result.engine_candidates = *std::move(engine_candidates);
  }

  std::vector<Candidate> &candidates = result.candidates;
  AppendCandidates(GetUserDictionaryExactCandidates(key, dictionary),
                   &candidates);
  AppendCandidates(GetUserDictionaryPrefixCandidates(key, dictionary),
                   &candidates);
  AppendCandidates(GetCalendarCandidates(key), &candidates);
  AppendCandidates(
      GetEngineCandidates(composing_text, result.engine_candidates),
      &candidates);
  MergeCandidates(max_size, &candidates);

  KANABRIDGE_VLOG(1) << "Synthesized " << candidates.size()
                     << " candidates for \"" << key << "\" ("
                     << result.engine_candidates.size() << " from engine)";
  return result;
}

std::vector<Candidate> CandidateSynthesizer::GetUserDictionaryExactCandidates(
    const absl::string_view key, const config::UserDictionary &dictionary) {
  std::vector<Candidate> results;
  const size_t length = strings::CharsLen(key);
  for (const std::string &word : dictionary.LookupExact(key)) {
    Candidate candidate;
    candidate.value = word;
    candidate.key = std::string(key);
    candidate.consumed_count = length;
    candidate.source = Candidate::USER_DICTIONARY_EXACT;
    results.push_back(std::move(candidate));
  }
  return results;
}

std::vector<Candidate> CandidateSynthesizer::GetUserDictionaryPrefixCandidates(
    const absl::string_view key, const config::UserDictionary &dictionary) {
  std::vector<Candidate> results;
  for (config::UserDictionary::Entry &entry : dictionary.LookupPrefix(key)) {
    Candidate candidate;
    candidate.value = std::move(entry.word);
    candidate.remainder = std::string(key.substr(entry.reading.size()));
    candidate.consumed_count = strings::CharsLen(entry.reading);
    candidate.key = std::move(entry.reading);
    candidate.source = Candidate::USER_DICTIONARY_PREFIX;
    results.push_back(std::move(candidate));
  }
  return results;
}

std::vector<Candidate> CandidateSynthesizer::GetCalendarCandidates(
    const absl::string_view key) {
  std::vector<Candidate> results;
  const size_t length = strings::CharsLen(key);
  for (std::string &value : DateRewriter::Rewrite(key)) {
    Candidate candidate;
    candidate.value = std::move(value);
    candidate.key = std::string(key);
    candidate.consumed_count = length;
    candidate.source = Candidate::CALENDAR;
    results.push_back(std::move(candidate));
  }
  return results;
}

std::vector<Candidate> CandidateSynthesizer::GetEngineCandidates(
    const composer::ComposingText &composing_text,
    const absl::Span<const EngineCandidate> engine_candidates) {
  std::vector<Candidate> results;
  const std::string key = composing_text.GetString();
  const size_t length = composing_text.GetLength();
  for (size_t i = 0; i < engine_candidates.size(); ++i) {
    const EngineCandidate &engine_candidate = engine_candidates[i];
    Candidate candidate;
    candidate.value = BuildCandidateValue(engine_candidate, key);
    candidate.key = key;
    candidate.consumed_count = std::min(engine_candidate.consumed_count, length);

    composer::ComposingText after = composing_text;
    after.AcceptPrefix(candidate.consumed_count);
    candidate.remainder = after.GetString();

    candidate.source = Candidate::ENGINE;
    candidate.engine_index = static_cast<int>(i);
    results.push_back(std::move(candidate));
  }
  return results;
}

std::string CandidateSynthesizer::BuildCandidateValue(
    const EngineCandidate &candidate, const absl::string_view key) {
  if (candidate.data.empty()) {
    return candidate.text;
  }
  std::string result;
  absl::string_view rest = key;
  for (const EngineCandidate::Fragment &fragment : candidate.data) {
    const size_t ruby_length = strings::CharsLen(fragment.ruby);
    if (strings::CharsLen(rest) < ruby_length) {
      absl::StrAppend(&result, rest);
      break;
    }
    rest = strings::Utf8Substring(rest, ruby_length);
    absl::StrAppend(&result, fragment.word);
  }
  return result;
}

void CandidateSynthesizer::MergeCandidates(const size_t max_size,
                                           std::vector<Candidate> *candidates) {
  std::stable_sort(candidates->begin(), candidates->end(),
                   [](const Candidate &lhs, const Candidate &rhs) {
                     return lhs.source < rhs.source;
                   });
  if (candidates->size() > max_size) {
    KANABRIDGE_VLOG(1) << "Dropping " << candidates->size() - max_size
                       << " candidates";
    candidates->resize(max_size);
  }
}

}  // namespace converter
}  // namespace kanabridge
