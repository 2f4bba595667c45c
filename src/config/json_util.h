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

// Conversion between JSON values and protocol buffer messages.
//
// Field names are the proto field names. int64 and uint64 values are written
// as strings, and read from either strings or numbers. Enum values are
// written as their names.

#ifndef KANABRIDGE_CONFIG_JSON_UTIL_H_
#define KANABRIDGE_CONFIG_JSON_UTIL_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"
#include <json/json.h>

namespace kanabridge {
namespace config {

class JsonUtil {
 public:
  JsonUtil() = delete;
  JsonUtil(const JsonUtil &) = delete;
  JsonUtil &operator=(const JsonUtil &) = delete;

  static absl::Status ProtobufMessageToJsonValue(
      const google::protobuf::Message &message, Json::Value *value);

  // Fills `message` from a JSON object. Keys without a matching field are
  // skipped. Returns an error if a value does not fit its field; the other
  // fields are still filled in that case.
  static absl::Status JsonValueToProtobufMessage(
      const Json::Value &value, google::protobuf::Message *message);

  static absl::StatusOr<Json::Value> ParseJson(absl::string_view json);
  static std::string WriteJson(const Json::Value &value);
};

}  // namespace config
}  // namespace kanabridge

#endif  // KANABRIDGE_CONFIG_JSON_UTIL_H_
