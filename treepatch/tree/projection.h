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

#ifndef TREEPATCH_TREE_PROJECTION_H_
#define TREEPATCH_TREE_PROJECTION_H_

#include <cstddef>
#include <iostream>
#include <variant>

#include "treepatch/common/util/logging.h"
#include "treepatch/tree/node.h"
#include "treepatch/tree/patch.h"
#include "treepatch/tree/tree-printer.h"

namespace treepatch {

namespace internal {

// PatchProjector re-walks the original tree with the same position counting
// as TreeDiffer, and prints what the tree looks like with the patches
// applied.  One instance is used for exactly one ApplyAndRender() call.
template <typename V>
class PatchProjector {
 public:
  PatchProjector(const PatchSet<V> &patches, std::ostream *stream)
      : patches_(patches), stream_(*stream) {}

  PatchProjector(const PatchProjector &) = delete;
  PatchProjector &operator=(const PatchProjector &) = delete;

  void Run(const Node<V> &root) {
    Apply(root, 0);
    VLOG(1) << "ApplyAndRender: visited " << position_ + 1 << " positions, "
            << lines_ << " lines";
  }

 private:
  // Visitor over the patch found at the current position.
  class PatchApplier {
   public:
    PatchApplier(PatchProjector *projector, const Node<V> &node, size_t depth)
        : projector_(*projector), node_(node), depth_(depth) {}

    void operator()(const UpdatePatch<V> &patch) const {
      // Positions under the replaced node are skipped, as in the diff.
      projector_.PrintChanged(*patch.replacement, depth_);
    }

    void operator()(const InsertPatch<V> &patch) const {
      projector_.PrintUnchangedAndDescend(node_, depth_);
      for (const auto &subtree : patch.subtrees) {
        projector_.PrintChanged(*subtree, depth_ + 1);
      }
    }

    void operator()(const RemovePatch &) const {}

   private:
    PatchProjector &projector_;
    const Node<V> &node_;
    const size_t depth_;
  };

  void Apply(const Node<V> &node, size_t depth) {
    const auto found = patches_.find(position_);
    if (found == patches_.end()) {
      PrintUnchangedAndDescend(node, depth);
      return;
    }
    VLOG(2) << "ApplyAndRender: " << GetPatchKind(found->second) << " at "
            << position_;
    std::visit(PatchApplier(this, node, depth), found->second);
  }

  void PrintUnchangedAndDescend(const Node<V> &node, size_t depth) {
    PrintNodeLine(node, depth, false, &stream_);
    ++lines_;
    for (const auto &child : node.Children()) {
      ++position_;
      Apply(*child, depth + 1);
    }
  }

  void PrintChanged(const Node<V> &subtree, size_t depth) {
    PrintTree(subtree, &stream_, depth, true);
    lines_ += CountNodes(subtree);
  }

  const PatchSet<V> &patches_;
  std::ostream &stream_;
  Position position_ = 0;
  size_t lines_ = 0;
};

}  // namespace internal

// Prints the tree that results from applying 'patches' to 'root', one line
// per node, indented two spaces per depth level.  Every node that was
// inserted or replaced (including its whole subtree) is suffixed with
// kChangeMarker.  Neither 'root' nor 'patches' is modified.
//
// Precondition: 'patches' was computed by Diff(root, other).  A patch set
// computed against a different tree prints a meaningless (but memory-safe)
// listing; this is not detected.
template <typename V>
void ApplyAndRender(const NodeHandle<V> &root, const PatchSet<V> &patches,
                    std::ostream *stream) {
  CHECK_NOTNULL(root);
  internal::PatchProjector<V>(patches, stream).Run(*root);
}

// Same as above, printing to stdout.
template <typename V>
void ApplyAndRender(const NodeHandle<V> &root, const PatchSet<V> &patches) {
  ApplyAndRender(root, patches, &std::cout);
}

}  // namespace treepatch

#endif  // TREEPATCH_TREE_PROJECTION_H_
