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

#ifndef TREEPATCH_TREE_TREE_TEST_UTIL_H_
#define TREEPATCH_TREE_TREE_TEST_UTIL_H_

#include <iosfwd>
#include <sstream>
#include <string>

#include "treepatch/tree/node.h"
#include "treepatch/tree/patch.h"
#include "treepatch/tree/projection.h"
#include "treepatch/tree/tree-printer.h"

namespace treepatch {
namespace testing {

using StringNode = NodeHandle<std::string>;

// Leaf (or small subtree) with a string value, for terse tree literals.
StringNode S(const char *value, Node<std::string>::children_type children = {});

// Same, with a key.
StringNode K(const char *value, const char *key,
             Node<std::string>::children_type children = {});

// Reference trees for the worked example:
//   before:                 after:
//   root                    root
//     child1 @child1          child1 @child1
//       child1-1              child2 @child2
//     child2 @child2            child2-2
//       child2-1                child2-1
//       child2-2                  child2-1-1
//     child3 @child3          child4 @child4
//                             child5 @child5
//                             child6 @child6
//                               child6-1
StringNode MakeExampleTreeBefore();
StringNode MakeExampleTreeAfter();

// Non-string payload, to exercise value types with their own equality and
// stream printing.
struct Widget {
  std::string kind;
  int id;

  bool operator==(const Widget &other) const {
    return kind == other.kind && id == other.id;
  }
};

std::ostream &operator<<(std::ostream &stream, const Widget &widget);

template <typename V>
std::string PrintToString(const NodeHandle<V> &root) {
  std::ostringstream stream;
  PrintTree(*root, &stream);
  return stream.str();
}

template <typename V>
std::string RenderToString(const NodeHandle<V> &root,
                           const PatchSet<V> &patches) {
  std::ostringstream stream;
  ApplyAndRender(root, patches, &stream);
  return stream.str();
}

template <typename V>
std::string PatchListing(const PatchSet<V> &patches) {
  std::ostringstream stream;
  stream << FormatPatchSet(patches);
  return stream.str();
}

}  // namespace testing
}  // namespace treepatch

#endif  // TREEPATCH_TREE_TREE_TEST_UTIL_H_
