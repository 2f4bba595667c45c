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

// Interactive driver of the bridge API for manual testing.
//
// Reads one command per line from --input (or stdin):
//   append <raw>   remove   move <offset>   clear   convert
//   shrink <count> context <text>   learn <index>   reset   reload   status
// Lines starting with "##" are comments.

#include <cstddef>
#include <fstream>
#include <iostream>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <utility>

#include "absl/flags/flag.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "base/file_util.h"
#include "base/init_kanabridge.h"
#include "base/system_util.h"
#include "bridge/bridge_api.h"
#include "session/ffi_candidate.h"

ABSL_FLAG(std::string, input, "", "Input file");
ABSL_FLAG(std::string, install_dir, "",
          "Directory containing the conversion library and Dictionary/");
ABSL_FLAG(bool, engine_enabled, false, "Load the conversion library");
ABSL_FLAG(std::string, profile_dir, "", "Profile dir");

namespace kanabridge {
namespace {

void PrintText(const char *text, int cursor, std::ostream *output) {
  *output << text << " (cursor: " << cursor << ")" << std::endl;
}

void PrintCandidates(std::ostream *output) {
  size_t length = 0;
  const FfiCandidate *const *candidates = GetComposedText(&length);
  for (size_t i = 0; i < length; ++i) {
    const FfiCandidate &candidate = *candidates[i];
    *output << i << "\t" << candidate.text << "\t" << candidate.hiragana
            << "\t" << candidate.corresponding_count << "\t"
            << candidate.subtext << std::endl;
  }
}

bool ParseInt(absl::string_view arg, int *value) {
  if (!absl::SimpleAtoi(arg, value)) {
    LOG(ERROR) << "Not a number: " << arg;
    return false;
  }
  return true;
}

bool Execute(absl::string_view line, std::ostream *output) {
  std::pair<absl::string_view, absl::string_view> command =
      absl::StrSplit(line, absl::MaxSplits(' ', 1));
  const absl::string_view name = command.first;
  const std::string arg(absl::StripAsciiWhitespace(command.second));
  int cursor = 0;
  int value = 0;

  if (name == "append") {
    PrintText(AppendText(arg.c_str(), &cursor), cursor, output);
  } else if (name == "remove") {
    PrintText(RemoveText(&cursor), cursor, output);
  } else if (name == "move") {
    if (!ParseInt(arg, &value)) {
      return false;
    }
    PrintText(MoveCursor(value, &cursor), cursor, output);
  } else if (name == "clear") {
    ClearText();
  } else if (name == "convert") {
    PrintCandidates(output);
  } else if (name == "shrink") {
    if (!ParseInt(arg, &value)) {
      return false;
    }
    *output << ShrinkText(value) << std::endl;
  } else if (name == "context") {
    SetContext(arg.c_str());
  } else if (name == "learn") {
    if (!ParseInt(arg, &value)) {
      return false;
    }
    LearnCandidate(value);
  } else if (name == "reset") {
    ResetLearningMemory();
  } else if (name == "reload") {
    LoadConfig();
  } else if (name == "status") {
    char *status = GetEngineStatus();
    *output << status << std::endl;
    FreeString(status);
  } else {
    LOG(ERROR) << "Unknown command: " << name;
    return false;
  }
  return true;
}

void Loop(std::istream *input, std::ostream *output) {
  std::string line;
  while (std::getline(*input, line)) {
    const absl::string_view stripped = absl::StripAsciiWhitespace(line);
    if (stripped.empty() || absl::StartsWith(stripped, "##")) {
      continue;
    }
    if (!Execute(stripped, output)) {
      *output << "error: " << stripped << std::endl;
    }
  }
}

}  // namespace
}  // namespace kanabridge

int main(int argc, char **argv) {
  kanabridge::InitKanaBridge(argv[0], &argc, &argv);

  const std::string flags_profile_dir = absl::GetFlag(FLAGS_profile_dir);
  if (!flags_profile_dir.empty()) {
    if (absl::Status s = kanabridge::FileUtil::CreateDirectory(
            flags_profile_dir);
        !s.ok() && !absl::IsAlreadyExists(s)) {
      LOG(ERROR) << s;
      return 1;
    }
    kanabridge::SystemUtil::SetUserProfileDirectory(flags_profile_dir);
  }

  std::unique_ptr<std::ifstream> input_file;
  std::istream *input = &std::cin;
  const std::string flags_input = absl::GetFlag(FLAGS_input);
  if (!flags_input.empty()) {
    input_file = std::make_unique<std::ifstream>(flags_input);
    if (input_file->fail()) {
      LOG(ERROR) << "File not opened: " << flags_input;
      std::cerr << "File not opened: " << flags_input << std::endl;
      return 1;
    }
    input = input_file.get();
  }

  Initialize(absl::GetFlag(FLAGS_install_dir).c_str(),
             absl::GetFlag(FLAGS_engine_enabled));
  kanabridge::Loop(input, &std::cout);
  FreeArena();
  Shutdown();
  return 0;
}
