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

// Imports an ATOK word list into the user dictionary of settings.json.
//
// Usage:
//   atok_import_main --input=atok.txt [--settings=path] [--dry_run]

#include <cstddef>
#include <iostream>
#include <string>

#include "absl/flags/flag.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "base/file_util.h"
#include "base/init_kanabridge.h"
#include "base/system_util.h"
#include "config/config_handler.h"
#include "config/user_dictionary_importer.h"
#include "protocol/config.pb.h"

ABSL_FLAG(std::string, input, "", "ATOK word list to import");
ABSL_FLAG(std::string, settings, "",
          "Settings file to update. Defaults to the one in the user profile");
ABSL_FLAG(bool, skip_emoticons, true, "Skip face marks");
ABSL_FLAG(bool, skip_auto_registered, false,
          "Skip words registered automatically by ATOK");
ABSL_FLAG(bool, dry_run, false, "Print the result instead of writing it");

namespace kanabridge {
namespace {

absl::StatusOr<config::Config> LoadSettings(const std::string &path) {
  absl::StatusOr<std::string> contents = FileUtil::GetContents(path);
  if (absl::IsNotFound(contents.status())) {
    LOG(INFO) << path << " is not found. Creating a new one.";
    return config::ConfigHandler::DefaultConfig();
  }
  if (!contents.ok()) {
    return contents.status();
  }
  return config::ConfigHandler::ParseSettings(*contents);
}

int Run() {
  const std::string input = absl::GetFlag(FLAGS_input);
  if (input.empty()) {
    std::cerr << "--input is required" << std::endl;
    return 1;
  }
  std::string settings_path = absl::GetFlag(FLAGS_settings);
  if (settings_path.empty()) {
    settings_path = SystemUtil::GetSettingsFilePath();
  }

  absl::StatusOr<std::string> text = FileUtil::GetContents(input);
  if (!text.ok()) {
    LOG(ERROR) << text.status();
    return 1;
  }
  absl::StatusOr<config::Config> config = LoadSettings(settings_path);
  if (!config.ok()) {
    LOG(ERROR) << "Cannot load " << settings_path << ": " << config.status();
    return 1;
  }

  config::AtokImportOptions options;
  options.skip_emoticons = absl::GetFlag(FLAGS_skip_emoticons);
  options.skip_auto_registered = absl::GetFlag(FLAGS_skip_auto_registered);
  config::AtokImportStats stats;
  const config::UserDictionaryConfig imported =
      config::ImportFromAtokText(*text, options, &stats);
  const size_t added =
      config::MergeUserDictionary(imported, config->mutable_dictionary());

  std::cerr << "imported: " << stats.imported << ", added: " << added
            << ", emoticons: " << stats.emoticons
            << ", auto registered: " << stats.auto_registered
            << ", invalid reading: " << stats.invalid_reading
            << ", duplicates: " << stats.duplicates << std::endl;

  const std::string serialized =
      config::ConfigHandler::SerializeSettings(*config);
  if (absl::GetFlag(FLAGS_dry_run)) {
    std::cout << serialized;
    return 0;
  }
  if (absl::Status s = FileUtil::SetContents(settings_path, serialized);
      !s.ok()) {
    LOG(ERROR) << s;
    return 1;
  }
  return 0;
}

}  // namespace
}  // namespace kanabridge

int main(int argc, char **argv) {
  kanabridge::InitKanaBridge(argv[0], &argc, &argv);
  return kanabridge::Run();
}
