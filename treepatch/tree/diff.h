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

#ifndef TREEPATCH_TREE_DIFF_H_
#define TREEPATCH_TREE_DIFF_H_

#include <cstddef>
#include <utility>
#include <vector>

#include "treepatch/common/util/logging.h"
#include "treepatch/tree/node.h"
#include "treepatch/tree/patch.h"

namespace treepatch {

namespace internal {

// TreeDiffer walks two trees in lockstep, pairing children by index.
// One instance is used for exactly one Diff() call: 'position_' is the
// pre-order index of the current left-hand node, and is incremented right
// before each left-hand child is visited.  The projector in projection.h
// must count the same way.
template <typename V>
class TreeDiffer {
 public:
  TreeDiffer() = default;

  TreeDiffer(const TreeDiffer &) = delete;
  TreeDiffer &operator=(const TreeDiffer &) = delete;

  PatchSet<V> Run(const NodeHandle<V> &a, const NodeHandle<V> &b) && {
    Walk(a, b);
    VLOG(1) << "Diff: visited " << position_ + 1 << " positions, "
            << patches_.size() << " patches";
    return std::move(patches_);
  }

 private:
  void Walk(const NodeHandle<V> &a, const NodeHandle<V> &b) {
    if (a->Value() == b->Value()) {
      DiffChildren(a->Children(), b->Children());
    } else {
      // The whole subtree is replaced, so nothing below is compared.
      Record(UpdatePatch<V>{b});
    }
  }

  void DiffChildren(const typename Node<V>::children_type &a_children,
                    const typename Node<V>::children_type &b_children) {
    const Position parent_position = position_;
    const size_t a_size = a_children.size();
    const size_t b_size = b_children.size();
    for (size_t i = 0; i < a_size; ++i) {
      ++position_;
      if (i >= b_size) {
        // Descendants of a removed child are not counted.
        Record(RemovePatch{});
      } else {
        Walk(a_children[i], b_children[i]);
      }
    }
    if (b_size > a_size) {
      // Trailing new children are batched under their parent's position.
      std::vector<NodeHandle<V>> appended(b_children.begin() + a_size,
                                          b_children.end());
      Record(InsertPatch<V>{std::move(appended)}, parent_position);
    }
  }

  void Record(Patch<V> patch) { Record(std::move(patch), position_); }

  void Record(Patch<V> patch, Position position) {
    VLOG(2) << "Diff: " << GetPatchKind(patch) << " at " << position;
    const bool inserted = patches_.emplace(position, std::move(patch)).second;
    CHECK(inserted) << "duplicate patch at position " << position;
  }

  Position position_ = 0;
  PatchSet<V> patches_;
};

}  // namespace internal

// Computes the positional difference from tree 'a' to tree 'b'.
//
// Nodes are visited in pre-order and numbered by their position in 'a'.
// Nodes with equal values (keys and children are not part of the comparison)
// produce no patch and their children are compared pairwise by index.
// Unequal values produce an UpdatePatch holding 'b's subtree.
// Surplus children of 'a' produce RemovePatches at their own positions;
// surplus children of 'b' are collected into one InsertPatch at the parent's
// position.  No key matching, reorder or move detection is done.
//
// The returned patches share (not copy) subtrees of 'b'.
template <typename V>
PatchSet<V> Diff(const NodeHandle<V> &a, const NodeHandle<V> &b) {
  CHECK_NOTNULL(a);
  CHECK_NOTNULL(b);
  return internal::TreeDiffer<V>().Run(a, b);
}

}  // namespace treepatch

#endif  // TREEPATCH_TREE_DIFF_H_
