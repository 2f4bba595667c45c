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

// Session class of the kanabridge. Holds every piece of state shared by the
// exported calls: the composition, the config, the engine, and the buffers
// handed to the caller.

#ifndef KANABRIDGE_SESSION_SESSION_H_
#define KANABRIDGE_SESSION_SESSION_H_

#include <cstddef>
#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "composer/composing_text.h"
#include "config/config_handler.h"
#include "converter/candidate_synthesizer.h"
#include "engine/engine_interface.h"
#include "request/conversion_request.h"
#include "session/candidate_arena.h"
#include "session/ffi_candidate.h"
#include "session/learning_session.h"

namespace kanabridge {
namespace session {

// Strings returned as `const char *` live in the session's arena. They stay
// valid until the next call returning a string of the same kind and must
// not be freed by the caller.
class Session {
 public:
  // Uses the minimal engine and the settings in the user profile directory.
  Session();
  // `options` supplies the engine directories for every request.
  Session(std::unique_ptr<EngineInterface> engine,
          std::unique_ptr<config::ConfigHandler> config_handler,
          ConversionRequest::Options options);

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  // Loads the config and the engine installed under `install_dir`, then
  // warms up the engine. The conversion library is loaded only when
  // `use_library` is true.
  static std::unique_ptr<Session> Create(const std::string &install_dir,
                                         bool use_library);

  // Re-reads the settings file. The previous config is kept on failure.
  absl::Status LoadConfig();

  // Inserts `input` at the cursor. Returns the phonetic text and stores the
  // cursor to `cursor` when it is not null.
  const char *AppendText(absl::string_view input, int *cursor);
  // Deletes one character before the cursor.
  const char *RemoveText(int *cursor);
  const char *MoveCursor(int offset, int *cursor);
  void ClearText();

  // Converts the current composition. Returns `*size` records, valid until
  // the next call.
  const FfiCandidate *const *GetComposedText(size_t *size);

  // Removes `count` characters from the front of the composition after a
  // candidate is accepted. Returns the remaining phonetic text.
  const char *ShrinkText(int count);

  void SetContext(absl::string_view context);
  void LearnCandidate(int index);
  void ResetLearningMemory();
  std::string GetEngineStatus() const;

  // Frees the arena. Every later call returning candidates or text returns
  // an empty result.
  void FreeArena();

  const composer::ComposingText &composing_text() const {
    return composing_text_;
  }
  const std::string &left_context() const { return left_context_; }

 private:
  const char *WriteText(int *cursor);
  ConversionRequest MakeRequest() const;
  void WarmUp();

  std::unique_ptr<EngineInterface> engine_;
  std::unique_ptr<config::ConfigHandler> config_handler_;
  const ConversionRequest::Options options_;
  composer::ComposingText composing_text_;
  std::string left_context_;
  converter::CandidateSynthesizer synthesizer_;
  LearningSession learning_session_;
  CandidateArena arena_;
};

}  // namespace session
}  // namespace kanabridge

#endif  // KANABRIDGE_SESSION_SESSION_H_
