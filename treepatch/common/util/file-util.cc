// Copyright 2017-2020 The Verible Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "treepatch/common/util/file-util.h"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "treepatch/common/util/logging.h"

namespace fs = std::filesystem;

namespace treepatch {
namespace file {

bool IsStdin(absl::string_view filename) {
  static constexpr absl::string_view kStdinFilename = "-";
  return filename == kStdinFilename;
}

// Create an error message derived from "sys_error" (which contains an errno
// number). The message includes the filename as prefix.
// If "sys_error" can not be resolved, creates an UNKNOWN message.
static absl::Status CreateErrorStatusFromSysError(absl::string_view filename,
                                                  int sys_error,
                                                  const char *fallback_msg) {
  const char *const system_msg =
      sys_error == 0 ? fallback_msg : strerror(sys_error);
  if (filename.empty()) filename = "<empty-filename>";
  std::string msg = absl::StrCat(filename, ": ", system_msg);
  switch (sys_error) {
    case EPERM:
    case EACCES:
      return {absl::StatusCode::kPermissionDenied, msg};
    case ENOENT:
      return {absl::StatusCode::kNotFound, msg};
    case EINVAL:
    case EISDIR:
      return {absl::StatusCode::kInvalidArgument, msg};
    default:
      absl::StrAppend(&msg, " (sys_error=", sys_error, ")");
      return {absl::StatusCode::kUnknown, msg};
  }
}

static absl::Status CreateErrorStatusFromErrno(absl::string_view filename,
                                               const char *fallback_msg) {
  return CreateErrorStatusFromSysError(filename, errno, fallback_msg);
}

absl::Status FileExists(const std::string &filename) {
  std::error_code err;
  const fs::file_status stat = fs::status(filename, err);

  if (err.value() != 0) {
    return CreateErrorStatusFromSysError(filename, err.value(),
                                         "file exists check");
  }

  if (fs::is_regular_file(stat) || fs::is_fifo(stat)) {
    return absl::OkStatus();
  }

  if (fs::is_directory(stat)) {
    return absl::InvalidArgumentError(
        absl::StrCat(filename, ": is a directory, not a file"));
  }
  return absl::InvalidArgumentError(
      absl::StrCat(filename, ": not a regular file."));
}

absl::StatusOr<std::string> GetContentAsString(absl::string_view filename) {
  std::string content;
  FILE *stream = nullptr;
  if (IsStdin(filename)) {
    stream = stdin;
  } else {
    const std::string filename_str = std::string{filename};
    if (absl::Status status = FileExists(filename_str); !status.ok()) {
      return status;  // Bail
    }
    stream = fopen(filename_str.c_str(), "rb");
    std::error_code err;
    const size_t prealloc = fs::file_size(filename_str, err);
    if (err.value() == 0) content.reserve(prealloc);
  }
  if (!stream) {
    return CreateErrorStatusFromErrno(filename, "can't read");
  }
  char buffer[4096];
  size_t bytes_read;
  do {
    bytes_read = fread(buffer, 1, sizeof(buffer), stream);
    content.append(buffer, bytes_read);
  } while (bytes_read > 0);
  if (stream != stdin) fclose(stream);

  VLOG(1) << __FUNCTION__ << ": read " << content.size() << " bytes from "
          << filename;
  return content;
}

absl::Status SetContents(absl::string_view filename,
                         absl::string_view content) {
  VLOG(1) << __FUNCTION__ << ": Writing file: " << filename;
  FILE *out = fopen(std::string(filename).c_str(), "wb");
  if (!out) return CreateErrorStatusFromErrno(filename, "can't write.");
  const int64_t expected_write = content.size();
  int64_t total_written = 0;
  while (!content.empty()) {
    const size_t w = fwrite(content.data(), 1, content.size(), out);
    if (w == 0) break;
    total_written += w;
    content.remove_prefix(w);
  }
  const bool written_completely = (total_written == expected_write);
  const bool closed_properly = (fclose(out) == 0);
  if (!closed_properly || !written_completely) {
    return CreateErrorStatusFromErrno(filename, "can't write.");
  }
  return absl::OkStatus();
}

}  // namespace file
}  // namespace treepatch
