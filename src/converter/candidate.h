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

#ifndef KANABRIDGE_CONVERTER_CANDIDATE_H_
#define KANABRIDGE_CONVERTER_CANDIDATE_H_

#include <cstddef>
#include <ostream>
#include <string>

#include "absl/strings/string_view.h"

namespace kanabridge {
namespace converter {

class Candidate {
 public:
  // Where the candidate comes from. Sources ranked earlier are shown first.
  enum Source {
    USER_DICTIONARY_EXACT = 0,
    USER_DICTIONARY_PREFIX,
    CALENDAR,
    ENGINE,
  };

  Candidate() = default;

  std::string value;      // text to display and commit
  std::string remainder;  // phonetic text left after accepting this
  std::string key;        // reading
  // Number of phonetic units of the composition this candidate accounts
  // for, counted from the front.
  size_t consumed_count = 0;
  Source source = ENGINE;
  // Index in the engine result for ENGINE candidates, -1 otherwise.
  int engine_index = -1;

  static absl::string_view SourceName(Source source);

  std::string DebugString() const;

  friend std::ostream &operator<<(std::ostream &os,
                                  const Candidate &candidate) {
    return os << candidate.DebugString();
  }
};

}  // namespace converter
}  // namespace kanabridge

#endif  // KANABRIDGE_CONVERTER_CANDIDATE_H_
