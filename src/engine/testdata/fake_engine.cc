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

// A conversion library for tests. It converts the key to itself, then to
// its first character only, and records what it is told to learn.

#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

#include <json/json.h>

namespace {

struct FakeEngine {
  std::string last_key;
  std::string last_left_context;
  std::string learned;
  int commits = 0;
  int stops = 0;
};

char *CopyString(const std::string &str) {
  char *result = static_cast<char *>(std::malloc(str.size() + 1));
  std::memcpy(result, str.c_str(), str.size() + 1);
  return result;
}

std::string FirstChar(const std::string &str) {
  if (str.empty()) {
    return str;
  }
  size_t len = 1;
  while (len < str.size() && (static_cast<unsigned char>(str[len]) & 0xc0) ==
                                 0x80) {
    ++len;
  }
  return str.substr(0, len);
}

bool Parse(const char *json, Json::Value *value) {
  Json::CharReaderBuilder builder;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  return reader->parse(json, json + std::strlen(json), value, nullptr);
}

}  // namespace

extern "C" {

void *kb_engine_create(const char *options_json) {
  Json::Value options;
  if (!Parse(options_json, &options) ||
      options["dictionary_dir"].asString() == "fail") {
    return nullptr;
  }
  return new FakeEngine();
}

char *kb_engine_request(void *engine, const char *request_json) {
  FakeEngine *fake = static_cast<FakeEngine *>(engine);
  Json::Value request;
  if (!Parse(request_json, &request)) {
    return nullptr;
  }
  fake->last_key = request["key"].asString();
  fake->last_left_context = request["left_context"].asString();
  if (fake->last_key == "えらー") {
    return nullptr;
  }

  Json::Value result(Json::arrayValue);
  Json::Value whole(Json::objectValue);
  whole["text"] = fake->last_key;
  whole["correspondingCount"] = 0;
  whole["data"][0]["word"] = fake->last_key;
  whole["data"][0]["ruby"] = fake->last_key;
  result.append(whole);

  const std::string first = FirstChar(fake->last_key);
  Json::Value partial(Json::objectValue);
  partial["text"] = first;
  partial["correspondingCount"] = 1;
  partial["data"][0]["word"] = first;
  partial["data"][0]["ruby"] = first;
  result.append(partial);
  return CopyString(Json::writeString(Json::StreamWriterBuilder(), result));
}

int kb_engine_learn(void *engine, const char *candidate_json) {
  static_cast<FakeEngine *>(engine)->learned = candidate_json;
  return 0;
}

int kb_engine_commit(void *engine) {
  ++static_cast<FakeEngine *>(engine)->commits;
  return 0;
}

int kb_engine_reset_memory(void *engine) { return 3; }

void kb_engine_stop_composition(void *engine) {
  ++static_cast<FakeEngine *>(engine)->stops;
}

void kb_engine_free_string(char *str) { std::free(str); }

void kb_engine_destroy(void *engine) {
  delete static_cast<FakeEngine *>(engine);
}

}  // extern "C"
