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

#include "base/file_util.h"

#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <fstream>
#include <iterator>
#include <string>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"

namespace kanabridge {
namespace {

constexpr char kFileDelimiter = '/';

int FtwDelete(const char *path, const struct stat *sb, int typeflag,
              struct FTW *ftwbuf) {
  switch (typeflag) {
    case FTW_DP:  // directory postorder
      [[fallthrough]];
    case FTW_DNR:  // directory which can't be read. will try anyways.
      if (::rmdir(path) != 0) {
        LOG(ERROR) << "Cannot remove directory " << path << ": errno = "
                   << errno;
      }
      break;
    default:
      if (::unlink(path) != 0) {
        LOG(ERROR) << "Cannot unlink " << path << ": errno = " << errno;
      }
      break;
  }
  return 0;
}

// iostreams do not promise to set errno on failure.
absl::Status StreamError(const int err, absl::string_view message) {
  if (err == 0) {
    return absl::UnknownError(message);
  }
  return absl::ErrnoToStatus(err, message);
}

}  // namespace

absl::Status FileUtil::CreateDirectory(const std::string &path) {
  if (DirectoryExists(path).ok()) {
    return absl::OkStatus();
  }
  if (::mkdir(path.c_str(), 0700) != 0) {
    const int err = errno;
    return absl::ErrnoToStatus(err, absl::StrCat("mkdir failed: ", path));
  }
  return absl::OkStatus();
}

absl::Status FileUtil::Unlink(const std::string &filename) {
  if (::unlink(filename.c_str()) != 0) {
    return absl::ErrnoToStatus(errno,
                               absl::StrCat("Cannot unlink ", filename));
  }
  return absl::OkStatus();
}

absl::Status FileUtil::DeleteRecursively(const std::string &path) {
  if (absl::IsNotFound(FileExists(path))) {
    return absl::OkStatus();
  }
  constexpr int kOpenFdLimit = 100;
  if (::nftw(path.c_str(), FtwDelete, kOpenFdLimit,
             FTW_DEPTH | FTW_PHYS | FTW_MOUNT) < 0) {
    return absl::ErrnoToStatus(errno, "nftw failed");
  }
  return absl::OkStatus();
}

absl::Status FileUtil::FileExists(const std::string &filename) {
  struct stat s;
  if (::stat(filename.c_str(), &s) == 0) {
    return absl::OkStatus();
  }
  const int err = errno;
  return absl::ErrnoToStatus(err, absl::StrCat("Cannot stat ", filename));
}

absl::Status FileUtil::DirectoryExists(const std::string &dirname) {
  struct stat s;
  if (::stat(dirname.c_str(), &s) == 0) {
    return S_ISDIR(s.st_mode)
               ? absl::OkStatus()
               : absl::NotFoundError("Path exists but it's not a directory");
  }
  const int err = errno;
  return absl::ErrnoToStatus(err, absl::StrCat("Cannot stat ", dirname));
}

std::string FileUtil::JoinPath(
    const absl::Span<const absl::string_view> components) {
  std::string output;
  for (const absl::string_view component : components) {
    if (component.empty()) {
      continue;
    }
    if (!output.empty() && output.back() != kFileDelimiter) {
      output.append(1, kFileDelimiter);
    }
    absl::StrAppend(&output, component);
  }
  return output;
}

std::string FileUtil::Basename(const std::string &filename) {
  const std::string::size_type p = filename.find_last_of(kFileDelimiter);
  if (p == std::string::npos) {
    return filename;
  }
  return filename.substr(p + 1);
}

absl::StatusOr<std::string> FileUtil::GetContents(const std::string &filename) {
  errno = 0;
  std::ifstream ifs(filename, std::ios::binary);
  if (ifs.fail()) {
    const int err = errno;
    return StreamError(err, absl::StrCat("Cannot open ", filename));
  }
  std::string content((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
  if (ifs.bad()) {
    return absl::DataLossError(absl::StrCat("Cannot read ", filename));
  }
  return content;
}

absl::Status FileUtil::SetContents(const std::string &filename,
                                   absl::string_view content) {
  errno = 0;
  std::ofstream ofs(filename, std::ios::binary | std::ios::trunc);
  if (ofs.fail()) {
    const int err = errno;
    return StreamError(err, absl::StrCat("Cannot open ", filename));
  }
  ofs << content;
  ofs.close();
  if (ofs.fail()) {
    const int err = errno;
    return StreamError(
        err,
        absl::StrCat("Cannot write ", content.size(), " bytes to ", filename));
  }
  return absl::OkStatus();
}

}  // namespace kanabridge
