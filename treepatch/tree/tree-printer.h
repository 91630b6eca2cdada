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

#ifndef TREEPATCH_TREE_TREE_PRINTER_H_
#define TREEPATCH_TREE_TREE_PRINTER_H_

#include <cstddef>
#include <ostream>

#include "absl/strings/string_view.h"
#include "treepatch/common/util/spacer.h"
#include "treepatch/tree/node.h"

namespace treepatch {

// Suffix appended to every inserted or replaced node in a projection.
inline constexpr absl::string_view kChangeMarker = "(*)";

// Prints one line for 'node': indentation for 'depth', the value, and the
// change marker if 'changed'.
template <typename V>
std::ostream &PrintNodeLine(const Node<V> &node, size_t depth, bool changed,
                            std::ostream *stream) {
  *stream << Indentation(depth) << node.Value();
  if (changed) *stream << kChangeMarker;
  return *stream << '\n';
}

// Prints the tree rooted at 'node' in pre-order, one line per node, indented
// by depth relative to 'depth'.  Every line is marked as changed if 'changed'.
template <typename V>
std::ostream &PrintTree(const Node<V> &node, std::ostream *stream,
                        size_t depth = 0, bool changed = false) {
  PrintNodeLine(node, depth, changed, stream);
  for (const auto &child : node.Children()) {
    PrintTree(*child, stream, depth + 1, changed);
  }
  return *stream;
}

}  // namespace treepatch

#endif  // TREEPATCH_TREE_TREE_PRINTER_H_
