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

#ifndef KANABRIDGE_SESSION_CANDIDATE_ARENA_H_
#define KANABRIDGE_SESSION_CANDIDATE_ARENA_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "absl/strings/string_view.h"
#include "session/ffi_candidate.h"

namespace kanabridge {
namespace session {

// Fixed pool of candidate records whose strings are read by foreign callers.
// Every buffer is allocated in the constructor and reused until Release(), so
// the addresses handed out stay valid between two writes and the caller never
// frees them. Strings longer than the capacity are truncated at a UTF-8
// character boundary.
//
// Usage:
//   CandidateArena arena;
//   arena.WriteCandidate(0, "漢字", "", "かんじ", 3);
//   const FfiCandidate *const *candidates = arena.Snapshot(1);
class CandidateArena {
 public:
  static constexpr size_t kDefaultSlotCount = 100;
  static constexpr size_t kDefaultStringCapacity = 256;
  static constexpr size_t kDefaultTransientCapacity = 1024;

  CandidateArena();
  // Capacities are in bytes and include the terminating NUL.
  CandidateArena(size_t slot_count, size_t string_capacity,
                 size_t transient_capacity);

  CandidateArena(const CandidateArena &) = delete;
  CandidateArena &operator=(const CandidateArena &) = delete;

  ~CandidateArena() = default;

  // Overwrites the slot at `index`. Returns false when the slot does not
  // exist or the arena is released.
  bool WriteCandidate(size_t index, absl::string_view text,
                      absl::string_view subtext, absl::string_view hiragana,
                      int32_t corresponding_count);

  // Returns the addresses of the first `count` slots, clamped to the slot
  // count. The array is owned by the arena and overwritten by the next call.
  // Returns nullptr after Release().
  const FfiCandidate *const *Snapshot(size_t count);

  // Copies `text` to the transient buffer and returns it. The previous
  // contents are overwritten. Returns an empty string after Release().
  const char *WriteTransient(absl::string_view text);

  // Frees every buffer. Calling it again only logs.
  void Release();

  bool released() const { return released_; }
  size_t slot_count() const { return slots_.size(); }
  size_t string_capacity() const { return string_capacity_; }
  size_t transient_capacity() const { return transient_capacity_; }

 private:
  struct Slot {
    std::unique_ptr<char[]> text;
    std::unique_ptr<char[]> subtext;
    std::unique_ptr<char[]> hiragana;
    FfiCandidate record;
  };

  const size_t string_capacity_;
  const size_t transient_capacity_;
  // Never resized until Release(), so the records do not move.
  std::vector<Slot> slots_;
  std::vector<const FfiCandidate *> snapshot_;
  std::unique_ptr<char[]> transient_;
  bool released_ = false;
};

}  // namespace session
}  // namespace kanabridge

#endif  // KANABRIDGE_SESSION_CANDIDATE_ARENA_H_
