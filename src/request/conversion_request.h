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

#ifndef KANABRIDGE_REQUEST_CONVERSION_REQUEST_H_
#define KANABRIDGE_REQUEST_CONVERSION_REQUEST_H_

#include <string>
#include <utility>

#include "absl/log/check.h"
#include "absl/strings/string_view.h"
#include "composer/composing_text.h"
#include "protocol/config.pb.h"

namespace kanabridge {

// Everything the engine needs for one conversion: the phonetic key, the text
// preceding the composition, and the engine options derived from the config.
class ConversionRequest {
 public:
  struct Options {
    // Use the language model backed conversion.
    bool llm_enabled = false;
    int inference_limit = 1;
    // Free form text describing the user, for the language model.
    std::string profile;

    // Directory of the system dictionary.
    std::string dictionary_dir;
    // Directory the engine stores learned data in.
    std::string memory_dir;
  };

  ConversionRequest() = default;
  ConversionRequest(const ConversionRequest &) = default;
  ConversionRequest &operator=(const ConversionRequest &) = default;

  // Hiragana text to be converted. May end with unresolved romaji, e.g.
  // "とうk".
  const std::string &key() const { return key_; }
  const std::string &left_context() const { return left_context_; }
  const Options &options() const { return options_; }

 private:
  friend class ConversionRequestBuilder;

  std::string key_;
  std::string left_context_;
  Options options_;
};

class ConversionRequestBuilder {
 public:
  ConversionRequest Build() {
    DCHECK(!built_);
    built_ = true;
    return request_;
  }

  ConversionRequestBuilder &SetKey(absl::string_view key) {
    request_.key_ = std::string(key);
    return *this;
  }
  ConversionRequestBuilder &SetComposingText(
      const composer::ComposingText &composing_text) {
    request_.key_ = composing_text.GetString();
    return *this;
  }
  ConversionRequestBuilder &SetLeftContext(absl::string_view left_context) {
    request_.left_context_ = std::string(left_context);
    return *this;
  }
  ConversionRequestBuilder &SetOptions(ConversionRequest::Options options) {
    request_.options_ = std::move(options);
    return *this;
  }
  // Copies the engine settings of `config`. The directories are kept.
  ConversionRequestBuilder &SetConfig(const config::Config &config) {
    request_.options_.llm_enabled = config.engine().enabled();
    request_.options_.inference_limit = config.engine().inference_limit();
    request_.options_.profile = config.engine().profile();
    return *this;
  }

 private:
  ConversionRequest request_;
  bool built_ = false;
};

}  // namespace kanabridge

#endif  // KANABRIDGE_REQUEST_CONVERSION_REQUEST_H_
