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

#include "treepatch/common/util/init-command-line.h"

#include <algorithm>
#include <cstdlib>
#include <string>
#include <vector>

#include "absl/base/log_severity.h"
#include "absl/debugging/failure_signal_handler.h"
#include "absl/debugging/symbolize.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/flags/usage_config.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/strings/numbers.h"
#include "absl/strings/string_view.h"

namespace treepatch {

std::string GetRepositoryVersion() {
#ifdef TREEPATCH_VERSION
  return TREEPATCH_VERSION;  // from the build system
#else
  return "<unknown repository version>";
#endif
}

static std::string GetBuildVersion() {
  std::string result;
  result.append("Version\t").append(GetRepositoryVersion()).append("\n");
  return result;
}

void SetLoggingLevelsFromEnvironment() {
  const char *const stderr_log_level = getenv("TREEPATCH_LOGTHRESHOLD");
  int log_level = 0;
  if (stderr_log_level && absl::SimpleAtoi(stderr_log_level, &log_level)) {
    absl::SetStderrThreshold(
        static_cast<absl::LogSeverityAtLeast>(std::clamp(log_level, 0, 3)));
  }

  const char *const vlog_level_env = getenv("TREEPATCH_VLOG_DETAIL");
  int vlog_level = 0;
  if (vlog_level_env && absl::SimpleAtoi(vlog_level_env, &vlog_level)) {
    absl::SetGlobalVLogLevel(vlog_level);
  }
}

// We might want to have argc edited in the future, hence non-const param.
std::vector<absl::string_view> InitCommandLine(
    absl::string_view usage,
    int *argc,  // NOLINT(readability-non-const-parameter)
    char ***argv) {
  absl::InitializeSymbolizer(*argv[0]);
  absl::FlagsUsageConfig usage_config;
  usage_config.version_string = GetBuildVersion;
  absl::SetFlagsUsageConfig(usage_config);
  absl::SetProgramUsageMessage(usage);  // copies usage string

  SetLoggingLevelsFromEnvironment();
  absl::InitializeLog();

#if !defined(__SANITIZE_ADDRESS__)
  absl::FailureSignalHandlerOptions options;
  absl::InstallFailureSignalHandler(options);
#endif

  const auto positional_parameters = absl::ParseCommandLine(*argc, *argv);
  return {positional_parameters.cbegin(), positional_parameters.cend()};
}

}  // namespace treepatch
