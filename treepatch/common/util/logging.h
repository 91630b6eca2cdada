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

// Single include point for LOG, VLOG and CHECK.
// Verbosity used across treepatch:
//   VLOG(1)  one summary line per Diff(), projection, file read or parse.
//   VLOG(2)  one line per recorded or applied patch.
// Levels are set at startup from TREEPATCH_VLOG_DETAIL, see
// init-command-line.h.

#ifndef TREEPATCH_COMMON_UTIL_LOGGING_H_
#define TREEPATCH_COMMON_UTIL_LOGGING_H_

#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-compare"
#endif
#include "absl/log/check.h"  // IWYU pragma: export
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif

#include "absl/log/die_if_null.h"  // IWYU pragma: export
#include "absl/log/log.h"          // IWYU pragma: export

#define CHECK_NOTNULL(p) (void)ABSL_DIE_IF_NULL(p)

#endif  // TREEPATCH_COMMON_UTIL_LOGGING_H_
