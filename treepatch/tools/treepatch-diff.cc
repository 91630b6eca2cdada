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

// treepatch-diff compares two trees written as indented text (two spaces per
// level, one node per line, optional trailing "@key").  Use '-' to read one
// of them from stdin.
// The patch set and/or the change-annotated projection of the second tree
// onto the first are printed to stdout.
// The program exits 0 if no differences are found, else non-zero.
//
// Example usage:
// treepatch-diff [options] before.tree after.tree

#include <iostream>
#include <string>

#include "absl/flags/flag.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "treepatch/common/util/file-util.h"
#include "treepatch/common/util/init-command-line.h"
#include "treepatch/common/util/logging.h"
#include "treepatch/tree/diff.h"
#include "treepatch/tree/node.h"
#include "treepatch/tree/patch.h"
#include "treepatch/tree/projection.h"
#include "treepatch/tree/text-tree-reader.h"

ABSL_FLAG(bool, print_patches, false,
          "Print the patch set, one operation per line, as "
          "'<position> <update|insert|remove> [value]'.");

ABSL_FLAG(bool, render, true,
          "Print the first tree with the patches applied, marking every "
          "inserted or replaced node with (*).");

using treepatch::NodeHandle;

static absl::StatusOr<NodeHandle<std::string>> ReadTree(
    absl::string_view filename) {
  const auto content_or = treepatch::file::GetContentAsString(filename);
  if (!content_or.ok()) return content_or.status();
  auto tree_or = treepatch::ParseIndentedTree(*content_or);
  if (!tree_or.ok()) {
    const absl::Status &status = tree_or.status();
    return absl::Status(status.code(),
                        absl::StrCat(filename, ": ", status.message()));
  }
  return tree_or;
}

int main(int argc, char **argv) {
  const auto usage = absl::StrCat("usage: ", argv[0],
                                  " [options] before.tree after.tree\n"
                                  "Use - as a file name to read from stdin.");
  const auto args = treepatch::InitCommandLine(usage, &argc, &argv);

  enum {
    // trees differ
    kInputDifferenceErrorCode = 1,

    // error with flags, or opening/reading/parsing one of the files
    kUserErrorCode = 2,
  };

  if (args.size() != 3) {
    std::cerr << "Program requires 2 positional arguments for input files."
              << std::endl;
    return kUserErrorCode;
  }
  if (treepatch::file::IsStdin(args[1]) && treepatch::file::IsStdin(args[2])) {
    std::cerr << "At most one input can be read from stdin." << std::endl;
    return kUserErrorCode;
  }

  const auto before_or = ReadTree(args[1]);
  if (!before_or.ok()) {
    std::cerr << before_or.status().message() << std::endl;
    return kUserErrorCode;
  }
  const auto after_or = ReadTree(args[2]);
  if (!after_or.ok()) {
    std::cerr << after_or.status().message() << std::endl;
    return kUserErrorCode;
  }

  const treepatch::PatchSet<std::string> patches =
      treepatch::Diff(*before_or, *after_or);
  VLOG(1) << args[1] << " -> " << args[2] << ": " << patches.size()
          << " patches";

  if (absl::GetFlag(FLAGS_print_patches)) {
    std::cout << treepatch::FormatPatchSet(patches);
  }
  if (absl::GetFlag(FLAGS_render)) {
    treepatch::ApplyAndRender(*before_or, patches);
  }
  std::cout << std::flush;

  return patches.empty() ? 0 : kInputDifferenceErrorCode;
}
