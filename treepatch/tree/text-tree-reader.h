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

#ifndef TREEPATCH_TREE_TEXT_TREE_READER_H_
#define TREEPATCH_TREE_TEXT_TREE_READER_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "treepatch/tree/node.h"

namespace treepatch {

// Builds a tree of string values from indented text, the same layout that
// PrintTree() produces:
//
//   root
//     child1 @child1
//       child1-1
//     child2
//
// * One node per non-blank line.  Lines starting with '#' (after any
//   indentation) are comments.
// * Two spaces of indentation per depth level; tabs are rejected.
// * The first node is the root.  Only one root is allowed.
// * A node is exactly one level deeper than its parent.
// * A trailing word of the form "@name" is the node's key, not part of the
//   value.  The value is the remaining text with surrounding whitespace
//   removed.
//
// Returns InvalidArgumentError, citing the 1-based line number, on malformed
// input.
absl::StatusOr<NodeHandle<std::string>> ParseIndentedTree(
    absl::string_view text);

}  // namespace treepatch

#endif  // TREEPATCH_TREE_TEXT_TREE_READER_H_
