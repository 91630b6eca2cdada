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

// -*- c++ -*-
// Filesystem utilities for reading tree input files.
#ifndef TREEPATCH_COMMON_UTIL_FILE_UTIL_H_
#define TREEPATCH_COMMON_UTIL_FILE_UTIL_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace treepatch {
namespace file {

// Check if the input filename corresponds to stdin.
// Convention: honor "-" as stdin
bool IsStdin(absl::string_view filename);

// Determines whether the given filename exists and is a regular file or pipe.
absl::Status FileExists(const std::string &filename);

// Read file "filename" and return its content as string.
// Error statuses are prefixed with the filename.
absl::StatusOr<std::string> GetContentAsString(absl::string_view filename);

// Create file "filename" and store given content in it.
absl::Status SetContents(absl::string_view filename, absl::string_view content);

}  // namespace file
}  // namespace treepatch

#endif  // TREEPATCH_COMMON_UTIL_FILE_UTIL_H_
