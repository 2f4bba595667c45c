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

#include "session/candidate_arena.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <vector>

#include "absl/log/check.h"
#include "absl/log/log.h"
#include "absl/strings/string_view.h"
#include "base/strings/unicode.h"
#include "base/vlog.h"
#include "session/ffi_candidate.h"

namespace kanabridge {
namespace session {
namespace {

// Copies `src` into `dest` of `capacity` bytes, always NUL terminated.
void CopyTruncated(absl::string_view src, char *dest, size_t capacity) {
  DCHECK_GT(capacity, 0);
  const absl::string_view fitted = strings::Utf8TruncateBytes(src, capacity - 1);
  if (fitted.size() < src.size()) {
    KANABRIDGE_VLOG(2) << "Truncated " << src.size() << " bytes to "
                       << fitted.size();
  }
  std::memcpy(dest, fitted.data(), fitted.size());
  dest[fitted.size()] = '\0';
}

std::unique_ptr<char[]> AllocateString(size_t capacity) {
  // Value-initialized, i.e. an empty string.
  return std::make_unique<char[]>(capacity);
}

}  // namespace

CandidateArena::CandidateArena()
    : CandidateArena(kDefaultSlotCount, kDefaultStringCapacity,
                     kDefaultTransientCapacity) {}

CandidateArena::CandidateArena(const size_t slot_count,
                               const size_t string_capacity,
                               const size_t transient_capacity)
    : string_capacity_(std::max<size_t>(string_capacity, 1)),
      transient_capacity_(std::max<size_t>(transient_capacity, 1)),
      slots_(slot_count),
      transient_(AllocateString(transient_capacity_)) {
  snapshot_.reserve(slot_count);
  for (Slot &slot : slots_) {
    slot.text = AllocateString(string_capacity_);
    slot.subtext = AllocateString(string_capacity_);
    slot.hiragana = AllocateString(string_capacity_);
    slot.record.text = slot.text.get();
    slot.record.subtext = slot.subtext.get();
    slot.record.hiragana = slot.hiragana.get();
    slot.record.corresponding_count = 0;
  }
}

bool CandidateArena::WriteCandidate(const size_t index,
                                    const absl::string_view text,
                                    const absl::string_view subtext,
                                    const absl::string_view hiragana,
                                    const int32_t corresponding_count) {
  if (released_) {
    LOG(WARNING) << "WriteCandidate is called after Release";
    return false;
  }
  if (index >= slots_.size()) {
    DLOG(ERROR) << "Slot index out of range: " << index;
    return false;
  }
  Slot &slot = slots_[index];
  CopyTruncated(text, slot.text.get(), string_capacity_);
  CopyTruncated(subtext, slot.subtext.get(), string_capacity_);
  CopyTruncated(hiragana, slot.hiragana.get(), string_capacity_);
  slot.record.corresponding_count = corresponding_count;
  return true;
}

const FfiCandidate *const *CandidateArena::Snapshot(size_t count) {
  if (released_) {
    LOG(WARNING) << "Snapshot is called after Release";
    return nullptr;
  }
  count = std::min(count, slots_.size());
  // Capacity is reserved in the constructor; no allocation happens here.
  snapshot_.clear();
  for (size_t i = 0; i < count; ++i) {
    snapshot_.push_back(&slots_[i].record);
  }
  return snapshot_.data();
}

const char *CandidateArena::WriteTransient(const absl::string_view text) {
  if (released_) {
    LOG(WARNING) << "WriteTransient is called after Release";
    return "";
  }
  CopyTruncated(text, transient_.get(), transient_capacity_);
  return transient_.get();
}

void CandidateArena::Release() {
  if (released_) {
    LOG(WARNING) << "CandidateArena is already released";
    return;
  }
  released_ = true;
  std::vector<Slot>().swap(slots_);
  std::vector<const FfiCandidate *>().swap(snapshot_);
  transient_.reset();
  KANABRIDGE_VLOG(1) << "CandidateArena is released";
}

}  // namespace session
}  // namespace kanabridge
