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

#include "config/json_util.h"

#include <cstdint>
#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/message.h"
#include <json/json.h>
#include "base/vlog.h"

namespace kanabridge {
namespace config {
namespace {

using ::google::protobuf::Descriptor;
using ::google::protobuf::EnumValueDescriptor;
using ::google::protobuf::FieldDescriptor;
using ::google::protobuf::Message;
using ::google::protobuf::Reflection;

absl::Status TypeError(const FieldDescriptor &field, absl::string_view type,
                       const Json::Value &value) {
  return absl::InvalidArgumentError(
      absl::StrCat("\"", field.name(), "\" expects ", type, " but got ",
                   JsonUtil::WriteJson(value)));
}

// Stores the value of a singular field, or the `index`-th element of a
// repeated field, into `value`.
absl::Status FieldValueToJsonValue(const Message &message,
                                   const FieldDescriptor &field, int index,
                                   Json::Value *value) {
  const Reflection &reflection = *message.GetReflection();
  const bool repeated = field.is_repeated();
  switch (field.cpp_type()) {
    case FieldDescriptor::CPPTYPE_INT32:
      *value = repeated ? reflection.GetRepeatedInt32(message, &field, index)
                        : reflection.GetInt32(message, &field);
      return absl::OkStatus();
    case FieldDescriptor::CPPTYPE_INT64:
      *value = absl::StrCat(
          repeated ? reflection.GetRepeatedInt64(message, &field, index)
                   : reflection.GetInt64(message, &field));
      return absl::OkStatus();
    case FieldDescriptor::CPPTYPE_UINT32:
      *value = repeated ? reflection.GetRepeatedUInt32(message, &field, index)
                        : reflection.GetUInt32(message, &field);
      return absl::OkStatus();
    case FieldDescriptor::CPPTYPE_UINT64:
      *value = absl::StrCat(
          repeated ? reflection.GetRepeatedUInt64(message, &field, index)
                   : reflection.GetUInt64(message, &field));
      return absl::OkStatus();
    case FieldDescriptor::CPPTYPE_FLOAT:
      *value = repeated ? reflection.GetRepeatedFloat(message, &field, index)
                        : reflection.GetFloat(message, &field);
      return absl::OkStatus();
    case FieldDescriptor::CPPTYPE_DOUBLE:
      *value = repeated ? reflection.GetRepeatedDouble(message, &field, index)
                        : reflection.GetDouble(message, &field);
      return absl::OkStatus();
    case FieldDescriptor::CPPTYPE_BOOL:
      *value = repeated ? reflection.GetRepeatedBool(message, &field, index)
                        : reflection.GetBool(message, &field);
      return absl::OkStatus();
    case FieldDescriptor::CPPTYPE_ENUM:
      *value = std::string(
          (repeated ? reflection.GetRepeatedEnum(message, &field, index)
                    : reflection.GetEnum(message, &field))
              ->name());
      return absl::OkStatus();
    case FieldDescriptor::CPPTYPE_STRING:
      *value = repeated ? reflection.GetRepeatedString(message, &field, index)
                        : reflection.GetString(message, &field);
      return absl::OkStatus();
    case FieldDescriptor::CPPTYPE_MESSAGE:
      return JsonUtil::ProtobufMessageToJsonValue(
          repeated ? reflection.GetRepeatedMessage(message, &field, index)
                   : reflection.GetMessage(message, &field),
          value);
  }
  return absl::InternalError(
      absl::StrCat("unsupported field type: ", field.cpp_type_name()));
}

// Sets a singular field, or appends to a repeated field.
absl::Status JsonValueToFieldValue(const Json::Value &value,
                                   const FieldDescriptor &field,
                                   Message *message) {
  const Reflection &reflection = *message->GetReflection();
  const bool repeated = field.is_repeated();
  switch (field.cpp_type()) {
    case FieldDescriptor::CPPTYPE_INT32: {
      if (!value.isInt()) {
        return TypeError(field, "int32", value);
      }
      if (repeated) {
        reflection.AddInt32(message, &field, value.asInt());
      } else {
        reflection.SetInt32(message, &field, value.asInt());
      }
      return absl::OkStatus();
    }
    case FieldDescriptor::CPPTYPE_INT64: {
      int64_t int_value = 0;
      if (value.isInt64()) {
        int_value = value.asInt64();
      } else if (!value.isString() ||
                 !absl::SimpleAtoi(value.asString(), &int_value)) {
        return TypeError(field, "int64", value);
      }
      if (repeated) {
        reflection.AddInt64(message, &field, int_value);
      } else {
        reflection.SetInt64(message, &field, int_value);
      }
      return absl::OkStatus();
    }
    case FieldDescriptor::CPPTYPE_UINT32: {
      if (!value.isUInt()) {
        return TypeError(field, "uint32", value);
      }
      if (repeated) {
        reflection.AddUInt32(message, &field, value.asUInt());
      } else {
        reflection.SetUInt32(message, &field, value.asUInt());
      }
      return absl::OkStatus();
    }
    case FieldDescriptor::CPPTYPE_UINT64: {
      uint64_t uint_value = 0;
      if (value.isUInt64()) {
        uint_value = value.asUInt64();
      } else if (!value.isString() ||
                 !absl::SimpleAtoi(value.asString(), &uint_value)) {
        return TypeError(field, "uint64", value);
      }
      if (repeated) {
        reflection.AddUInt64(message, &field, uint_value);
      } else {
        reflection.SetUInt64(message, &field, uint_value);
      }
      return absl::OkStatus();
    }
    case FieldDescriptor::CPPTYPE_FLOAT: {
      if (!value.isNumeric()) {
        return TypeError(field, "float", value);
      }
      if (repeated) {
        reflection.AddFloat(message, &field, value.asFloat());
      } else {
        reflection.SetFloat(message, &field, value.asFloat());
      }
      return absl::OkStatus();
    }
    case FieldDescriptor::CPPTYPE_DOUBLE: {
      if (!value.isNumeric()) {
        return TypeError(field, "double", value);
      }
      if (repeated) {
        reflection.AddDouble(message, &field, value.asDouble());
      } else {
        reflection.SetDouble(message, &field, value.asDouble());
      }
      return absl::OkStatus();
    }
    case FieldDescriptor::CPPTYPE_BOOL: {
      if (!value.isBool()) {
        return TypeError(field, "bool", value);
      }
      if (repeated) {
        reflection.AddBool(message, &field, value.asBool());
      } else {
        reflection.SetBool(message, &field, value.asBool());
      }
      return absl::OkStatus();
    }
    case FieldDescriptor::CPPTYPE_ENUM: {
      const EnumValueDescriptor *enum_value =
          value.isString()
              ? field.enum_type()->FindValueByName(value.asString())
              : nullptr;
      if (enum_value == nullptr) {
        return TypeError(field, field.enum_type()->full_name(), value);
      }
      if (repeated) {
        reflection.AddEnum(message, &field, enum_value);
      } else {
        reflection.SetEnum(message, &field, enum_value);
      }
      return absl::OkStatus();
    }
    case FieldDescriptor::CPPTYPE_STRING: {
      if (!value.isString()) {
        return TypeError(field, "string", value);
      }
      if (repeated) {
        reflection.AddString(message, &field, value.asString());
      } else {
        reflection.SetString(message, &field, value.asString());
      }
      return absl::OkStatus();
    }
    case FieldDescriptor::CPPTYPE_MESSAGE: {
      if (!value.isObject()) {
        return TypeError(field, "object", value);
      }
      return JsonUtil::JsonValueToProtobufMessage(
          value, repeated ? reflection.AddMessage(message, &field)
                          : reflection.MutableMessage(message, &field));
    }
  }
  return absl::InternalError(
      absl::StrCat("unsupported field type: ", field.cpp_type_name()));
}

}  // namespace

absl::Status JsonUtil::ProtobufMessageToJsonValue(const Message &message,
                                                  Json::Value *value) {
  *value = Json::Value(Json::objectValue);
  const Descriptor &descriptor = *message.GetDescriptor();
  const Reflection &reflection = *message.GetReflection();
  absl::Status result;
  for (int i = 0; i < descriptor.field_count(); ++i) {
    const FieldDescriptor &field = *descriptor.field(i);
    if (field.is_repeated()) {
      Json::Value &items = (*value)[std::string(field.name())];
      items = Json::Value(Json::arrayValue);
      const int size = reflection.FieldSize(message, &field);
      for (int j = 0; j < size; ++j) {
        result.Update(FieldValueToJsonValue(message, field, j, &items[j]));
      }
    } else if (reflection.HasField(message, &field) || field.is_required()) {
      result.Update(FieldValueToJsonValue(
          message, field, -1, &(*value)[std::string(field.name())]));
    }
  }
  return result;
}

absl::Status JsonUtil::JsonValueToProtobufMessage(const Json::Value &value,
                                                  Message *message) {
  if (!value.isObject()) {
    return absl::InvalidArgumentError(
        absl::StrCat("not an object: ", WriteJson(value)));
  }
  const Descriptor &descriptor = *message->GetDescriptor();
  absl::Status result;
  for (const std::string &name : value.getMemberNames()) {
    const FieldDescriptor *field = descriptor.FindFieldByName(name);
    if (field == nullptr) {
      KANABRIDGE_VLOG(1) << "Unknown field in " << descriptor.full_name()
                         << ": \"" << name << "\"";
      continue;
    }
    const Json::Value &member = value[name];
    if (member.isNull()) {
      continue;
    }
    if (!field->is_repeated()) {
      result.Update(JsonValueToFieldValue(member, *field, message));
      continue;
    }
    if (!member.isArray()) {
      result.Update(absl::InvalidArgumentError(
          absl::StrCat("\"", name, "\" is repeated but not an array")));
      continue;
    }
    for (const Json::Value &item : member) {
      result.Update(JsonValueToFieldValue(item, *field, message));
    }
  }
  return result;
}

absl::StatusOr<Json::Value> JsonUtil::ParseJson(const absl::string_view json) {
  Json::CharReaderBuilder builder;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value value;
  std::string errors;
  if (!reader->parse(json.data(), json.data() + json.size(), &value,
                     &errors)) {
    return absl::InvalidArgumentError(errors);
  }
  return value;
}

std::string JsonUtil::WriteJson(const Json::Value &value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

}  // namespace config
}  // namespace kanabridge
