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

// C interface of the kanabridge shared library.
//
// All calls are serialized by one lock and act on a process wide session.
// Calls made before Initialize() use a session with the fallback engine and
// the settings in the user profile directory.
//
// Strings and candidate arrays returned by the bridge are owned by it. They
// stay valid until the next call of the same kind and must not be freed,
// except the result of GetEngineStatus(), which is released by FreeString().

#ifndef KANABRIDGE_BRIDGE_BRIDGE_API_H_
#define KANABRIDGE_BRIDGE_BRIDGE_API_H_

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#include "session/ffi_candidate.h"

#define KANABRIDGE_EXPORT __attribute__((visibility("default")))

#ifdef __cplusplus
extern "C" {
#endif  // __cplusplus

// Loads the settings and the conversion engine installed in `path`. The
// conversion library is loaded only when `use_engine` is true.
KANABRIDGE_EXPORT void Initialize(const char *path, bool use_engine);

// Re-reads the settings file.
KANABRIDGE_EXPORT void LoadConfig(void);

// Edits the composition. Each call returns the phonetic text and stores the
// cursor position, in characters, to `cursor`.
KANABRIDGE_EXPORT const char *AppendText(const char *input, int *cursor);
KANABRIDGE_EXPORT const char *RemoveText(int *cursor);
KANABRIDGE_EXPORT const char *MoveCursor(int32_t offset, int *cursor);
KANABRIDGE_EXPORT void ClearText(void);

// Converts the composition. Stores the number of candidates to `length`.
KANABRIDGE_EXPORT const FfiCandidate *const *GetComposedText(size_t *length);

// Removes `offset` characters from the front of the composition. Returns the
// remaining phonetic text.
KANABRIDGE_EXPORT const char *ShrinkText(int32_t offset);

// Sets the text preceding the composition.
KANABRIDGE_EXPORT void SetContext(const char *context);

// Learns the `index`-th candidate returned by the conversion engine in the
// last GetComposedText().
KANABRIDGE_EXPORT void LearnCandidate(int32_t index);
KANABRIDGE_EXPORT void ResetLearningMemory(void);

// Returns the engine diagnostics as JSON. Release with FreeString().
KANABRIDGE_EXPORT char *GetEngineStatus(void);
KANABRIDGE_EXPORT void FreeString(char *str);

// Frees the candidate buffers. No candidate is returned afterwards.
KANABRIDGE_EXPORT void FreeArena(void);

// Destroys the session and unloads the engine.
KANABRIDGE_EXPORT void Shutdown(void);

#ifdef __cplusplus
}  // extern "C"
#endif  // __cplusplus

#endif  // KANABRIDGE_BRIDGE_BRIDGE_API_H_
