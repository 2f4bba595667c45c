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

#include "engine/dynamic_engine.h"

#include <dlfcn.h>

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include <json/json.h>
#include "base/strings/unicode.h"
#include "base/vlog.h"
#include "config/json_util.h"
#include "engine/engine_interface.h"
#include "request/conversion_request.h"

namespace kanabridge {

struct DynamicEngine::Functions {
  void *(*create)(const char *) = nullptr;
  char *(*request)(void *, const char *) = nullptr;
  int (*learn)(void *, const char *) = nullptr;
  int (*commit)(void *) = nullptr;
  int (*reset_memory)(void *) = nullptr;
  void (*stop_composition)(void *) = nullptr;
  void (*free_string)(char *) = nullptr;
  void (*destroy)(void *) = nullptr;
};

namespace {

using config::JsonUtil;

template <typename T>
absl::Status LoadSymbol(void *handle, const char *name, T *function) {
  dlerror();
  void *symbol = dlsym(handle, name);
  if (symbol == nullptr) {
    const char *error = dlerror();
    return absl::NotFoundError(
        absl::StrCat("Cannot find ", name, ": ", error ? error : "null"));
  }
  *function = reinterpret_cast<T>(symbol);
  return absl::OkStatus();
}

absl::Status CheckResult(const int result, const absl::string_view name) {
  if (result != 0) {
    return absl::InternalError(
        absl::StrFormat("%s failed with %d", name, result));
  }
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<std::unique_ptr<DynamicEngine>> DynamicEngine::Create(
    const std::string &library_path,
    const ConversionRequest::Options &options) {
  void *handle = dlopen(library_path.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (handle == nullptr) {
    const char *error = dlerror();
    return absl::UnavailableError(absl::StrCat(
        "Cannot load ", library_path, ": ", error ? error : "null"));
  }

  auto functions = std::make_unique<Functions>();
  absl::Status status;
  status.Update(LoadSymbol(handle, "kb_engine_create", &functions->create));
  status.Update(LoadSymbol(handle, "kb_engine_request", &functions->request));
  status.Update(LoadSymbol(handle, "kb_engine_learn", &functions->learn));
  status.Update(LoadSymbol(handle, "kb_engine_commit", &functions->commit));
  status.Update(LoadSymbol(handle, "kb_engine_reset_memory",
                           &functions->reset_memory));
  status.Update(LoadSymbol(handle, "kb_engine_stop_composition",
                           &functions->stop_composition));
  status.Update(
      LoadSymbol(handle, "kb_engine_free_string", &functions->free_string));
  status.Update(LoadSymbol(handle, "kb_engine_destroy", &functions->destroy));
  if (!status.ok()) {
    dlclose(handle);
    return status;
  }

  Json::Value create_options(Json::objectValue);
  create_options["dictionary_dir"] = options.dictionary_dir;
  create_options["memory_dir"] = options.memory_dir;
  void *engine =
      functions->create(JsonUtil::WriteJson(create_options).c_str());
  if (engine == nullptr) {
    dlclose(handle);
    return absl::InternalError(
        absl::StrCat("kb_engine_create failed: ", library_path));
  }
  KANABRIDGE_VLOG(1) << "Loaded conversion library: " << library_path;
  return absl::WrapUnique(new DynamicEngine(library_path, handle,
                                            std::move(functions), engine));
}

DynamicEngine::DynamicEngine(std::string library_path, void *handle,
                             std::unique_ptr<Functions> functions,
                             void *engine)
    : library_path_(std::move(library_path)),
      handle_(handle),
      functions_(std::move(functions)),
      engine_(engine) {}

DynamicEngine::~DynamicEngine() {
  functions_->destroy(engine_);
  if (dlclose(handle_) != 0) {
    LOG(ERROR) << "dlclose failed: " << dlerror();
  }
}

std::string DynamicEngine::TakeString(char *str) const {
  std::string result(str);
  functions_->free_string(str);
  return result;
}

absl::StatusOr<std::vector<EngineCandidate>> DynamicEngine::RequestCandidates(
    const ConversionRequest &request) {
  ++request_count_;
  char *result =
      functions_->request(engine_, SerializeRequest(request).c_str());
  if (result == nullptr) {
    ++failure_count_;
    return absl::InternalError(
        absl::StrCat("kb_engine_request failed for ", request.key()));
  }
  absl::StatusOr<std::vector<EngineCandidate>> candidates =
      ParseCandidates(TakeString(result), strings::CharsLen(request.key()));
  if (!candidates.ok()) {
    ++failure_count_;
  }
  return candidates;
}

absl::Status DynamicEngine::UpdateLearningData(
    const EngineCandidate &candidate) {
  return CheckResult(
      functions_->learn(engine_, SerializeCandidate(candidate).c_str()),
      "kb_engine_learn");
}

absl::Status DynamicEngine::CommitUpdateLearningData() {
  return CheckResult(functions_->commit(engine_), "kb_engine_commit");
}

absl::Status DynamicEngine::ResetMemory() {
  return CheckResult(functions_->reset_memory(engine_),
                     "kb_engine_reset_memory");
}

void DynamicEngine::StopComposition() {
  functions_->stop_composition(engine_);
}

std::string DynamicEngine::GetStatus() const {
  Json::Value status(Json::objectValue);
  status["engine"] = "dynamic";
  status["library"] = library_path_;
  status["requests"] = request_count_;
  status["failures"] = failure_count_;
  return JsonUtil::WriteJson(status);
}

absl::StatusOr<std::vector<EngineCandidate>> DynamicEngine::ParseCandidates(
    const absl::string_view json, const size_t key_length) {
  absl::StatusOr<Json::Value> value = JsonUtil::ParseJson(json);
  if (!value.ok()) {
    return value.status();
  }
  if (!value->isArray()) {
    return absl::InvalidArgumentError("candidates must be an array");
  }

  std::vector<EngineCandidate> candidates;
  candidates.reserve(value->size());
  for (const Json::Value &item : *value) {
    if (!item.isObject() || !item["text"].isString()) {
      return absl::InvalidArgumentError(
          absl::StrCat("malformed candidate: ", JsonUtil::WriteJson(item)));
    }
    EngineCandidate candidate;
    candidate.text = item["text"].asString();
    const Json::Value &count = item["correspondingCount"];
    const size_t consumed = count.isUInt() ? count.asUInt() : 0;
    candidate.consumed_count =
        (consumed == 0 || consumed > key_length) ? key_length : consumed;
    for (const Json::Value &fragment : item["data"]) {
      if (!fragment.isObject()) {
        continue;
      }
      candidate.data.push_back({fragment.get("word", "").asString(),
                                fragment.get("ruby", "").asString()});
    }
    candidates.push_back(std::move(candidate));
  }
  return candidates;
}

std::string DynamicEngine::SerializeRequest(const ConversionRequest &request) {
  Json::Value value(Json::objectValue);
  value["key"] = request.key();
  value["left_context"] = request.left_context();
  value["llm_enabled"] = request.options().llm_enabled;
  value["profile"] = request.options().profile;
  value["inference_limit"] = request.options().inference_limit;
  return JsonUtil::WriteJson(value);
}

std::string DynamicEngine::SerializeCandidate(
    const EngineCandidate &candidate) {
  Json::Value value(Json::objectValue);
  value["text"] = candidate.text;
  value["correspondingCount"] =
      static_cast<Json::UInt64>(candidate.consumed_count);
  Json::Value &data = value["data"];
  data = Json::Value(Json::arrayValue);
  for (const EngineCandidate::Fragment &fragment : candidate.data) {
    Json::Value item(Json::objectValue);
    item["word"] = fragment.word;
    item["ruby"] = fragment.ruby;
    data.append(std::move(item));
  }
  return JsonUtil::WriteJson(value);
}

}  // namespace kanabridge
