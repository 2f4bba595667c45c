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

#ifndef KANABRIDGE_BASE_SINGLETON_H_
#define KANABRIDGE_BASE_SINGLETON_H_

#include <atomic>

#include "absl/base/attributes.h"
#include "absl/base/no_destructor.h"

namespace kanabridge {

// Process wide instance of T, created on first use and never destroyed.
template <typename T>
class Singleton {
 public:
  Singleton() = delete;

  static T *get() {
    static absl::NoDestructor<T> instance;
    return instance.get();
  }
};

// Like Singleton<Impl>, but tests may install another implementation of
// Interface with SetMock(). SetMock(nullptr) restores Impl.
template <class Interface, class Impl>
class SingletonMockable {
 public:
  SingletonMockable() = delete;

  static Interface *Get() {
    if (Interface *mock = mock_.load(std::memory_order_acquire)) {
      return mock;
    }
    return Singleton<Impl>::get();
  }

  static void SetMock(Interface *mock) {
    mock_.store(mock, std::memory_order_release);
  }

 private:
  ABSL_CONST_INIT static inline std::atomic<Interface *> mock_ = nullptr;
};

}  // namespace kanabridge

#endif  // KANABRIDGE_BASE_SINGLETON_H_
