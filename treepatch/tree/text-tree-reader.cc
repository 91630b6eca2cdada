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

#include "treepatch/tree/text-tree-reader.h"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "treepatch/common/util/logging.h"
#include "treepatch/common/util/spacer.h"
#include "treepatch/common/util/status-macros.h"
#include "treepatch/tree/node.h"

namespace treepatch {

namespace {

constexpr char kKeyPrefix = '@';
constexpr char kCommentPrefix = '#';

// One node-bearing line of input.
struct TreeLine {
  size_t line_number;  // 1-based
  size_t depth;
  std::string value;
  std::optional<std::string> key;
};

absl::Status LineError(size_t line_number, absl::string_view message) {
  return absl::InvalidArgumentError(
      absl::StrCat("line ", line_number, ": ", message));
}

// Parses one line.  Blank and comment lines leave 'lines' unchanged.
absl::Status ParseLine(absl::string_view line, size_t line_number,
                       std::vector<TreeLine> *lines) {
  const absl::string_view body = absl::StripAsciiWhitespace(line);
  if (body.empty()) return absl::OkStatus();

  const size_t indent = line.find_first_not_of(" \t");
  const absl::string_view leading = line.substr(0, indent);
  if (leading.find('\t') != absl::string_view::npos) {
    return LineError(line_number, "tabs are not allowed in indentation");
  }
  if (body.front() == kCommentPrefix) return absl::OkStatus();
  if (indent % kIndentWidth != 0) {
    return LineError(line_number,
                     absl::StrCat("indentation of ", indent,
                                  " spaces is not a multiple of ",
                                  kIndentWidth));
  }

  TreeLine tree_line{line_number, indent / kIndentWidth, "", std::nullopt};
  absl::string_view value = body;
  const size_t last_space = body.find_last_of(" \t");
  const absl::string_view last_word = last_space == absl::string_view::npos
                                          ? body
                                          : body.substr(last_space + 1);
  if (last_word.front() == kKeyPrefix) {
    const absl::string_view key = last_word.substr(1);
    if (key.empty()) return LineError(line_number, "empty key after '@'");
    tree_line.key = std::string(key);
    value = last_space == absl::string_view::npos
                ? absl::string_view()
                : absl::StripTrailingAsciiWhitespace(
                      body.substr(0, last_space));
  }
  if (value.empty()) return LineError(line_number, "node has no value");
  tree_line.value = std::string(value);
  lines->push_back(std::move(tree_line));
  return absl::OkStatus();
}

// Checks that 'current' may follow 'previous' in pre-order.
absl::Status CheckDepth(const TreeLine *previous, const TreeLine &current) {
  if (previous == nullptr) {
    if (current.depth != 0) {
      return LineError(current.line_number, "root node must not be indented");
    }
    return absl::OkStatus();
  }
  if (current.depth == 0) {
    return LineError(current.line_number, "more than one root node");
  }
  if (current.depth > previous->depth + 1) {
    return LineError(current.line_number,
                     absl::StrCat("indentation jumps from depth ",
                                  previous->depth, " to ", current.depth));
  }
  return absl::OkStatus();
}

// Builds the subtree whose root is lines[*index], advancing *index past it.
NodeHandle<std::string> BuildSubtree(std::vector<TreeLine> *lines,
                                     size_t *index) {
  TreeLine &line = (*lines)[(*index)++];
  Node<std::string>::children_type children;
  while (*index < lines->size() && (*lines)[*index].depth == line.depth + 1) {
    children.push_back(BuildSubtree(lines, index));
  }
  return MakeNode<std::string>(std::move(line.value), std::move(line.key),
                               std::move(children));
}

}  // namespace

absl::StatusOr<NodeHandle<std::string>> ParseIndentedTree(
    absl::string_view text) {
  std::vector<TreeLine> lines;
  size_t line_number = 0;
  for (const absl::string_view line : absl::StrSplit(text, '\n')) {
    ++line_number;
    RETURN_IF_ERROR(ParseLine(line, line_number, &lines));
  }
  if (lines.empty()) {
    return absl::InvalidArgumentError("no tree nodes found");
  }

  const TreeLine *previous = nullptr;
  for (const TreeLine &line : lines) {
    RETURN_IF_ERROR(CheckDepth(previous, line));
    previous = &line;
  }

  size_t index = 0;
  NodeHandle<std::string> root = BuildSubtree(&lines, &index);
  CHECK_EQ(index, lines.size());
  VLOG(1) << "ParseIndentedTree: " << lines.size() << " nodes from "
          << line_number << " lines";
  return root;
}

}  // namespace treepatch
