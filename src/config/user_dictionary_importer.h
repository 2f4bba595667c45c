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

// Importer of user dictionaries exported from other IMEs.

#ifndef KANABRIDGE_CONFIG_USER_DICTIONARY_IMPORTER_H_
#define KANABRIDGE_CONFIG_USER_DICTIONARY_IMPORTER_H_

#include <cstddef>

#include "absl/strings/string_view.h"
#include "protocol/config.pb.h"

namespace kanabridge {
namespace config {

struct AtokImportOptions {
  // Skips face marks and similar entries registered under "@" readings.
  bool skip_emoticons = true;
  // Skips words ATOK registered automatically (POS ending with '$').
  bool skip_auto_registered = false;
};

struct AtokImportStats {
  size_t imported = 0;
  size_t emoticons = 0;
  size_t auto_registered = 0;
  size_t invalid_reading = 0;
  size_t duplicates = 0;
};

// Reads an ATOK word list export: "reading<TAB>word<TAB>pos[<TAB>...]" per
// line, UTF-8 or UTF-16LE with a byte order mark. Header lines ("!!...") and
// comment lines ("#...") are ignored. Full-width alphanumerics in readings
// are narrowed, and entries whose reading is still not hiragana are dropped.
// `stats` may be nullptr.
UserDictionaryConfig ImportFromAtokText(absl::string_view text,
                                        const AtokImportOptions &options,
                                        AtokImportStats *stats);

// Appends the entries of `from` which are not in `to` yet, and returns the
// number of appended entries.
size_t MergeUserDictionary(const UserDictionaryConfig &from,
                           UserDictionaryConfig *to);

}  // namespace config
}  // namespace kanabridge

#endif  // KANABRIDGE_CONFIG_USER_DICTIONARY_IMPORTER_H_
