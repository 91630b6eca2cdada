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

#include "treepatch/tree/tree-test-util.h"

#include <ostream>
#include <string>
#include <utility>

#include "treepatch/tree/node.h"

namespace treepatch {
namespace testing {

StringNode S(const char *value, Node<std::string>::children_type children) {
  return MakeNode<std::string>(value, std::move(children));
}

StringNode K(const char *value, const char *key,
             Node<std::string>::children_type children) {
  return MakeNode<std::string>(value, key, std::move(children));
}

StringNode MakeExampleTreeBefore() {
  return S("root", {
                       K("child1", "child1", {S("child1-1")}),
                       K("child2", "child2", {S("child2-1"), S("child2-2")}),
                       K("child3", "child3"),
                   });
}

StringNode MakeExampleTreeAfter() {
  return S("root", {
                       K("child1", "child1"),
                       K("child2", "child2",
                         {S("child2-2"), S("child2-1", {S("child2-1-1")})}),
                       K("child4", "child4"),
                       K("child5", "child5"),
                       K("child6", "child6", {S("child6-1")}),
                   });
}

std::ostream &operator<<(std::ostream &stream, const Widget &widget) {
  return stream << widget.kind << '#' << widget.id;
}

}  // namespace testing
}  // namespace treepatch
