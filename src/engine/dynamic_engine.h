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

// Engine backed by a conversion library loaded at run time.
//
// The library exports the following C functions. Strings are UTF-8 and
// NUL-terminated. Strings returned by the library are released with
// kb_engine_free_string().
//
//   void *kb_engine_create(const char *options_json);
//       {"dictionary_dir": "...", "memory_dir": "..."}. NULL on failure.
//   char *kb_engine_request(void *engine, const char *request_json);
//       {"key", "left_context", "llm_enabled", "profile", "inference_limit"}.
//       Returns [{"text": "...", "correspondingCount": N,
//                 "data": [{"word": "...", "ruby": "..."}]}], NULL on failure.
//   int kb_engine_learn(void *engine, const char *candidate_json);
//   int kb_engine_commit(void *engine);
//   int kb_engine_reset_memory(void *engine);
//       0 on success.
//   void kb_engine_stop_composition(void *engine);
//   void kb_engine_free_string(char *str);
//   void kb_engine_destroy(void *engine);

#ifndef KANABRIDGE_ENGINE_DYNAMIC_ENGINE_H_
#define KANABRIDGE_ENGINE_DYNAMIC_ENGINE_H_

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "engine/engine_interface.h"
#include "request/conversion_request.h"

namespace kanabridge {

class DynamicEngine : public EngineInterface {
 public:
  // File name of the conversion library in the install directory.
  static constexpr absl::string_view kLibraryName = "libkanabridge_engine.so";

  // Loads `library_path` and creates an engine instance with the
  // directories of `options`.
  static absl::StatusOr<std::unique_ptr<DynamicEngine>> Create(
      const std::string &library_path,
      const ConversionRequest::Options &options);

  ~DynamicEngine() override;

  absl::StatusOr<std::vector<EngineCandidate>> RequestCandidates(
      const ConversionRequest &request) override;
  absl::Status UpdateLearningData(const EngineCandidate &candidate) override;
  absl::Status CommitUpdateLearningData() override;
  absl::Status ResetMemory() override;
  void StopComposition() override;
  std::string GetStatus() const override;

  // Converts the result of kb_engine_request(). A correspondingCount of 0,
  // or one larger than `key_length`, means the whole key.
  static absl::StatusOr<std::vector<EngineCandidate>> ParseCandidates(
      absl::string_view json, size_t key_length);

  static std::string SerializeRequest(const ConversionRequest &request);
  static std::string SerializeCandidate(const EngineCandidate &candidate);

 private:
  struct Functions;

  DynamicEngine(std::string library_path, void *handle,
                std::unique_ptr<Functions> functions, void *engine);

  // Takes the ownership of `str` allocated by the library.
  std::string TakeString(char *str) const;

  const std::string library_path_;
  void *handle_;
  const std::unique_ptr<Functions> functions_;
  void *engine_;
  int request_count_ = 0;
  int failure_count_ = 0;
};

}  // namespace kanabridge

#endif  // KANABRIDGE_ENGINE_DYNAMIC_ENGINE_H_
