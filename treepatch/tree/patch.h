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

#ifndef TREEPATCH_TREE_PATCH_H_
#define TREEPATCH_TREE_PATCH_H_

#include <cstdint>
#include <map>
#include <ostream>
#include <variant>
#include <vector>

#include "treepatch/tree/node.h"

namespace treepatch {

// Pre-order index of a node in the original (left-hand) tree of a diff.
// Positions are only meaningful relative to the tree they were computed
// against, and only between one Diff() and the projection that consumes it.
using Position = uint32_t;

// The node at this position is replaced by 'replacement' and its subtree.
template <typename V>
struct UpdatePatch {
  NodeHandle<V> replacement;
};

// 'subtrees' are appended after the existing children of the node at this
// position.
template <typename V>
struct InsertPatch {
  std::vector<NodeHandle<V>> subtrees;
};

// The node at this position and its subtree are dropped.
struct RemovePatch {};

// One structural edit.  Consume with std::visit, handling every alternative.
template <typename V>
using Patch = std::variant<UpdatePatch<V>, InsertPatch<V>, RemovePatch>;

// At most one patch per position.
// Ordered only so that listings are deterministic; consumers look up
// positions on demand.
template <typename V>
using PatchSet = std::map<Position, Patch<V>>;

enum class PatchKind {
  kUpdate,
  kInsert,
  kRemove,
};

std::ostream &operator<<(std::ostream &, PatchKind);

namespace internal {
struct PatchKindVisitor {
  template <typename V>
  PatchKind operator()(const UpdatePatch<V> &) const {
    return PatchKind::kUpdate;
  }
  template <typename V>
  PatchKind operator()(const InsertPatch<V> &) const {
    return PatchKind::kInsert;
  }
  PatchKind operator()(const RemovePatch &) const { return PatchKind::kRemove; }
};
}  // namespace internal

template <typename V>
PatchKind GetPatchKind(const Patch<V> &patch) {
  return std::visit(internal::PatchKindVisitor(), patch);
}

// Stream printable adapter that lists a patch set, one line per operation in
// ascending position order:
//   <position> update <value>
//   <position> insert <value>      (one line per inserted subtree)
//   <position> remove
//
// usage: stream << FormatPatchSet(patches);
template <typename V>
struct PatchSetFormatter {
  const PatchSet<V> &patches;
};

template <typename V>
PatchSetFormatter<V> FormatPatchSet(const PatchSet<V> &patches) {
  return PatchSetFormatter<V>{patches};
}

namespace internal {
template <typename V>
class PatchLinePrinter {
 public:
  PatchLinePrinter(std::ostream *stream, Position position)
      : stream_(*stream), position_(position) {}

  void operator()(const UpdatePatch<V> &patch) const {
    stream_ << position_ << ' ' << PatchKind::kUpdate << ' '
            << patch.replacement->Value() << '\n';
  }

  void operator()(const InsertPatch<V> &patch) const {
    for (const auto &subtree : patch.subtrees) {
      stream_ << position_ << ' ' << PatchKind::kInsert << ' '
              << subtree->Value() << '\n';
    }
  }

  void operator()(const RemovePatch &) const {
    stream_ << position_ << ' ' << PatchKind::kRemove << '\n';
  }

 private:
  std::ostream &stream_;
  const Position position_;
};
}  // namespace internal

template <typename V>
std::ostream &operator<<(std::ostream &stream, const PatchSetFormatter<V> &f) {
  for (const auto &[position, patch] : f.patches) {
    std::visit(internal::PatchLinePrinter<V>(&stream, position), patch);
  }
  return stream;
}

}  // namespace treepatch

#endif  // TREEPATCH_TREE_PATCH_H_
