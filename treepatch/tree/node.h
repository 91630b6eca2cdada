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

#ifndef TREEPATCH_TREE_NODE_H_
#define TREEPATCH_TREE_NODE_H_

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "treepatch/common/util/logging.h"

namespace treepatch {

template <typename V>
class Node;

// Shared handle to an immutable tree node.
// The same subtree may be referenced from any number of trees (and patch
// sets) at once; nothing is ever deep-copied.
template <typename V>
using NodeHandle = std::shared_ptr<const Node<V>>;

// Node is one vertex of a labeled, ordered tree.
// There are minimal constraints on the value type:
//   V needs operator== for Diff().
//   V needs operator<<(std::ostream&, const V&) for printing and projection.
//
// Nodes are immutable once constructed: a tree is built bottom-up from
// already-constructed children and is read-only afterwards.
//
// Example:
//   auto tree = MakeNode<std::string>("root", {
//       MakeNode<std::string>("child1", "child1", {}),
//       MakeNode<std::string>("child2", {}),
//   });
template <typename V>
class Node {
 public:
  using value_type = V;
  using handle_type = NodeHandle<V>;
  using children_type = std::vector<handle_type>;

  // Prefer MakeNode(), which returns a shared handle.
  Node(V value, std::optional<std::string> key, children_type children)
      : value_(std::move(value)),
        key_(std::move(key)),
        children_(std::move(children)) {
    for (const auto &child : children_) {
      CHECK(child != nullptr) << "null child handle";
    }
  }

  Node(const Node &) = delete;
  Node &operator=(const Node &) = delete;

  const V &Value() const { return value_; }

  // Optional identity label.  Carried along with the node, but not consulted
  // by Diff(), which pairs children purely by index.
  const std::optional<std::string> &Key() const { return key_; }

  const children_type &Children() const { return children_; }

  bool is_leaf() const { return children_.empty(); }

 private:
  const V value_;
  const std::optional<std::string> key_;
  const children_type children_;
};

// Constructs a node with an optional key and returns a shared handle to it.
template <typename V>
NodeHandle<V> MakeNode(V value, std::optional<std::string> key,
                       typename Node<V>::children_type children) {
  return std::make_shared<const Node<V>>(std::move(value), std::move(key),
                                         std::move(children));
}

// Constructs a node without a key.
template <typename V>
NodeHandle<V> MakeNode(V value, typename Node<V>::children_type children = {}) {
  return MakeNode<V>(std::move(value), std::nullopt, std::move(children));
}

// Returns the number of nodes in the tree rooted at 'node'.
template <typename V>
size_t CountNodes(const Node<V> &node) {
  size_t count = 1;
  for (const auto &child : node.Children()) count += CountNodes(*child);
  return count;
}

}  // namespace treepatch

#endif  // TREEPATCH_TREE_NODE_H_
