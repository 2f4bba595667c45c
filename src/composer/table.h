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

// Rule table for Romaji (or Kana) to phonetic text transliteration.

#ifndef KANABRIDGE_COMPOSER_TABLE_H_
#define KANABRIDGE_COMPOSER_TABLE_H_

#include <cstddef>
#include <istream>
#include <memory>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/strings/string_view.h"

namespace kanabridge {
namespace composer {

// A single transliteration rule. `input` is replaced with `result`, and
// `pending` is carried over as the beginning of the next input.
// e.g. {"kk", "っ", "k"}, {"ka", "か", ""}.
class Entry final {
 public:
  Entry(absl::string_view input, absl::string_view result,
        absl::string_view pending);

  constexpr const std::string &input() const { return input_; }
  constexpr const std::string &result() const { return result_; }
  constexpr const std::string &pending() const { return pending_; }

 private:
  const std::string input_;
  const std::string result_;
  const std::string pending_;
};

class Table final {
 public:
  Table();
  Table(const Table &) = delete;
  Table &operator=(const Table &) = delete;

  // Adds a rule. An existing rule with the same input is replaced. Returns
  // nullptr if the rule is invalid.
  const Entry *AddRule(absl::string_view input, absl::string_view output,
                       absl::string_view pending);

  // Loads tab separated rules: "input<TAB>output[<TAB>pending]". Lines
  // starting with '#' are comments.
  bool LoadFromString(const std::string &str);
  bool LoadFromFile(const std::string &filepath);

  // Returns the rule whose input equals `input`, or nullptr.
  const Entry *LookUp(absl::string_view input) const;

  // Returns true if some rule has `input` as a strict prefix of its input,
  // i.e. `input` may still grow into another rule.
  bool HasSubRules(absl::string_view input) const;

  size_t size() const { return entries_.size(); }

  // Returns the built-in romaji to hiragana table.
  static const Table &GetDefaultTable();

  // Returns the built-in table as a shared pointer.
  static std::shared_ptr<const Table> GetSharedDefaultTable();

 private:
  bool LoadFromStream(std::istream *is);

  // Input alphabet characters are normalized to lower characters.
  static std::string Normalize(absl::string_view input);

  absl::flat_hash_map<std::string, std::unique_ptr<Entry>> entries_;
  // Every strict prefix of every registered input.
  absl::flat_hash_set<std::string> prefixes_;
};

}  // namespace composer
}  // namespace kanabridge

#endif  // KANABRIDGE_COMPOSER_TABLE_H_
