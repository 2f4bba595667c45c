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

// Handler of kanabridge configuration.
#include "config/config_handler.h"

#include <memory>
#include <string>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include <json/json.h>
#include "base/file_util.h"
#include "base/system_util.h"
#include "base/vlog.h"
#include "config/json_util.h"
#include "config/user_dictionary.h"
#include "protocol/config.pb.h"

namespace kanabridge {
namespace config {
namespace {

constexpr char kEngineKey[] = "engine";
constexpr char kLegacyEngineKey[] = "zenzai";
constexpr char kEnabledKey[] = "enabled";
constexpr char kLegacyEnabledKey[] = "enable";

// Renames a legacy member in place. A member with the new name wins.
void RenameMember(const char *from, const char *to, Json::Value *value) {
  if (!value->isObject() || !value->isMember(from)) {
    return;
  }
  if (!value->isMember(to)) {
    (*value)[to] = (*value)[from];
  }
  value->removeMember(from);
}

void NormalizeConfig(Config *config) {
  if (config->engine().inference_limit() < 1) {
    config->mutable_engine()->set_inference_limit(1);
  }
  SetConfigVerboseLevel(config->verbose_level());
}

}  // namespace

ConfigHandler::ConfigHandler()
    : ConfigHandler(SystemUtil::GetSettingsFilePath()) {}

ConfigHandler::ConfigHandler(std::string settings_path)
    : settings_path_(std::move(settings_path)),
      config_(std::make_shared<Config>(DefaultConfig())),
      dictionary_(std::make_shared<UserDictionary>()) {}

std::shared_ptr<const Config> ConfigHandler::GetSharedConfig() const {
  absl::ReaderMutexLock lock(&mutex_);
  return config_;
}

std::shared_ptr<const UserDictionary> ConfigHandler::GetSharedUserDictionary()
    const {
  absl::ReaderMutexLock lock(&mutex_);
  return dictionary_;
}

void ConfigHandler::SetConfig(Config config) {
  NormalizeConfig(&config);
  auto dictionary = std::make_shared<UserDictionary>(config.dictionary());
  auto shared_config = std::make_shared<const Config>(std::move(config));
  absl::WriterMutexLock lock(&mutex_);
  config_ = std::move(shared_config);
  dictionary_ = std::move(dictionary);
}

absl::Status ConfigHandler::Reload() {
  KANABRIDGE_VLOG(1) << "Reloading config file: " << settings_path_;
  absl::StatusOr<std::string> contents = FileUtil::GetContents(settings_path_);
  if (!contents.ok()) {
    LOG(WARNING) << settings_path_ << " is not found: " << contents.status();
    return contents.status();
  }
  absl::StatusOr<Config> config = ParseSettings(*contents);
  if (!config.ok()) {
    LOG(ERROR) << settings_path_ << " is broken: " << config.status();
    return config.status();
  }
  SetConfig(*std::move(config));
  return absl::OkStatus();
}

const Config &ConfigHandler::DefaultConfig() {
  static const Config *default_config = [] {
    Config *config = new Config();
    config->mutable_engine()->set_enabled(false);
    config->mutable_engine()->set_profile("");
    config->mutable_engine()->set_inference_limit(1);
    return config;
  }();
  return *default_config;
}

absl::StatusOr<Config> ConfigHandler::ParseSettings(
    const absl::string_view json) {
  absl::StatusOr<Json::Value> value = JsonUtil::ParseJson(json);
  if (!value.ok()) {
    return value.status();
  }
  if (!value->isObject()) {
    return absl::InvalidArgumentError("settings must be a JSON object");
  }
  RenameMember(kLegacyEngineKey, kEngineKey, &*value);
  RenameMember(kLegacyEnabledKey, kEnabledKey, &(*value)[kEngineKey]);
  if ((*value)[kEngineKey].isNull()) {
    value->removeMember(kEngineKey);
  }

  Config config = DefaultConfig();
  const absl::Status status =
      JsonUtil::JsonValueToProtobufMessage(*value, &config);
  if (!status.ok()) {
    return status;
  }
  return config;
}

std::string ConfigHandler::SerializeSettings(const Config &config) {
  Json::Value value;
  const absl::Status status =
      JsonUtil::ProtobufMessageToJsonValue(config, &value);
  LOG_IF(ERROR, !status.ok()) << "Failed to serialize config: " << status;
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  builder["emitUTF8"] = true;
  return absl::StrCat(Json::writeString(builder, value), "\n");
}

}  // namespace config
}  // namespace kanabridge
