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

#ifndef KANABRIDGE_CONFIG_USER_DICTIONARY_H_
#define KANABRIDGE_CONFIG_USER_DICTIONARY_H_

#include <cstddef>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "protocol/config.pb.h"

namespace kanabridge {
namespace config {

// Words registered by the user, indexed by reading. The dictionary is
// immutable once built; a config reload builds a new one.
class UserDictionary {
 public:
  struct Entry {
    std::string reading;
    std::string word;
  };

  UserDictionary() = default;
  explicit UserDictionary(const UserDictionaryConfig &config);

  UserDictionary(const UserDictionary &) = default;
  UserDictionary &operator=(const UserDictionary &) = default;
  UserDictionary(UserDictionary &&) = default;
  UserDictionary &operator=(UserDictionary &&) = default;

  // Words registered under `reading`, in registration order.
  absl::Span<const std::string> LookupExact(absl::string_view reading) const;

  // Entries whose reading is a strict, non-empty prefix of `key`. Shorter
  // readings come first (which is also the lexicographic order of the
  // readings); words of one reading keep their registration order.
  std::vector<Entry> LookupPrefix(absl::string_view key) const;

  // Number of (reading, word) pairs.
  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }

  // Number of registered readings which are not hiragana. They are kept
  // and matched like any other reading.
  size_t invalid_reading_count() const { return invalid_reading_count_; }

 private:
  // Returns false if the entry is empty or already registered.
  bool AddEntry(absl::string_view reading, absl::string_view word);

  absl::btree_map<std::string, std::vector<std::string>> words_;
  size_t size_ = 0;
  size_t invalid_reading_count_ = 0;
};

}  // namespace config
}  // namespace kanabridge

#endif  // KANABRIDGE_CONFIG_USER_DICTIONARY_H_
