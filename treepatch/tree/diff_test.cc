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

#include "treepatch/tree/diff.h"

#include <string>
#include <variant>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "treepatch/tree/node.h"
#include "treepatch/tree/patch.h"
#include "treepatch/tree/tree-test-util.h"

namespace treepatch {
namespace {

using ::testing::ElementsAre;
using ::testing::Key;
using testing::K;
using testing::MakeExampleTreeAfter;
using testing::MakeExampleTreeBefore;
using testing::PatchListing;
using testing::S;
using testing::Widget;

TEST(DiffTest, SameTreeHasNoPatches) {
  const auto tree = MakeExampleTreeBefore();
  EXPECT_TRUE(Diff(tree, tree).empty());
}

TEST(DiffTest, EqualTreesHaveNoPatches) {
  // Distinct instances with the same structure.
  EXPECT_TRUE(Diff(MakeExampleTreeBefore(), MakeExampleTreeBefore()).empty());
  EXPECT_TRUE(Diff(MakeExampleTreeAfter(), MakeExampleTreeAfter()).empty());
}

TEST(DiffTest, RootReplacement) {
  const auto before = S("old");
  const auto after = S("new");
  const PatchSet<std::string> patches = Diff(before, after);
  ASSERT_EQ(patches.size(), 1);
  const auto found = patches.find(0);
  ASSERT_NE(found, patches.end());
  const auto *update = std::get_if<UpdatePatch<std::string>>(&found->second);
  ASSERT_NE(update, nullptr);
  EXPECT_EQ(update->replacement, after);  // shared, not copied
}

TEST(DiffTest, ReplacedSubtreeIsNotDescended) {
  // Children are identical, but the root value differs.
  const auto before = S("old", {S("a"), S("b", {S("c")})});
  const auto after = S("new", {S("a"), S("b", {S("c"), S("d")})});
  EXPECT_EQ(PatchListing(Diff(before, after)), "0 update new\n");
}

TEST(DiffTest, PureAppend) {
  const auto c1 = S("c1");
  const auto c2 = S("c2");
  const PatchSet<std::string> patches =
      Diff(S("root", {c1}), S("root", {c1, c2}));
  ASSERT_EQ(patches.size(), 1);
  const auto found = patches.find(0);  // keyed at the parent
  ASSERT_NE(found, patches.end());
  const auto *insert = std::get_if<InsertPatch<std::string>>(&found->second);
  ASSERT_NE(insert, nullptr);
  ASSERT_EQ(insert->subtrees.size(), 1);
  EXPECT_EQ(insert->subtrees[0], c2);
}

TEST(DiffTest, AppendToLeaf) {
  const auto patches = Diff(S("root"), S("root", {S("a"), S("b")}));
  EXPECT_EQ(PatchListing(patches), "0 insert a\n0 insert b\n");
}

TEST(DiffTest, PureRemoval) {
  const auto patches =
      Diff(S("root", {S("c1"), S("c2")}), S("root", {S("c1")}));
  EXPECT_THAT(patches, ElementsAre(Key(2)));
  EXPECT_EQ(GetPatchKind(patches.at(2)), PatchKind::kRemove);
}

TEST(DiffTest, RemoveAllChildren) {
  const auto patches =
      Diff(S("root", {S("a"), S("b"), S("c")}), S("root"));
  EXPECT_EQ(PatchListing(patches), "1 remove\n2 remove\n3 remove\n");
}

TEST(DiffTest, DescendantsOfRemovedChildAreNotCounted) {
  // 'b' is the third node of 'before' in pre-order, but 'a's children are
  // never visited, so 'b' is numbered 2.
  const auto before = S("root", {S("a", {S("x"), S("y")}), S("b")});
  EXPECT_EQ(PatchListing(Diff(before, S("root"))), "1 remove\n2 remove\n");
}

TEST(DiffTest, DescendantsOfMatchedChildAreCounted) {
  const auto before = S("root", {S("a", {S("x"), S("y")}), S("b")});
  const auto after = S("root", {S("a"), S("c")});
  EXPECT_EQ(PatchListing(Diff(before, after)),
            "2 remove\n"
            "3 remove\n"
            "4 update c\n");
}

TEST(DiffTest, DescendantsOfReplacedChildAreNotCounted) {
  const auto before = S("root", {S("a", {S("x"), S("y")}), S("b")});
  const auto after = S("root", {S("z", {S("x"), S("y")}), S("c")});
  EXPECT_EQ(PatchListing(Diff(before, after)), "1 update z\n2 update c\n");
}

TEST(DiffTest, KeysAreNotCompared) {
  const auto before = S("root", {K("a", "first"), K("b", "second")});
  const auto after = S("root", {K("a", "other"), S("b")});
  EXPECT_TRUE(Diff(before, after).empty());
}

TEST(DiffTest, ReorderIsNotAMove) {
  const auto before = S("root", {K("a", "a"), K("b", "b")});
  const auto after = S("root", {K("b", "b"), K("a", "a")});
  EXPECT_EQ(PatchListing(Diff(before, after)), "1 update b\n2 update a\n");
}

TEST(DiffTest, SiblingPatchesAreIndependent) {
  const auto before = S("root", {S("a"), S("b", {S("x")}), S("c")});
  const auto after = S("root", {S("a2"), S("b", {S("x"), S("y")}), S("c")});
  EXPECT_EQ(PatchListing(Diff(before, after)),
            "1 update a2\n"
            "2 insert y\n");
}

TEST(DiffTest, ExampleTrees) {
  const auto before = MakeExampleTreeBefore();
  const auto after = MakeExampleTreeAfter();
  const PatchSet<std::string> patches = Diff(before, after);
  EXPECT_EQ(PatchListing(patches),
            "0 insert child5\n"
            "0 insert child6\n"
            "2 remove\n"
            "4 update child2-2\n"
            "5 update child2-1\n"
            "6 update child4\n");

  // Replacements alias the nodes of 'after'.
  const auto &updated = std::get<UpdatePatch<std::string>>(patches.at(5));
  EXPECT_EQ(updated.replacement, after->Children()[1]->Children()[1]);
  const auto &inserted = std::get<InsertPatch<std::string>>(patches.at(0));
  EXPECT_THAT(inserted.subtrees,
              ElementsAre(after->Children()[3], after->Children()[4]));
}

TEST(DiffTest, NonStringValues) {
  const auto before = MakeNode<Widget>(
      {"panel", 1}, {MakeNode<Widget>({"button", 2}),
                     MakeNode<Widget>({"label", 3})});
  const auto after = MakeNode<Widget>(
      {"panel", 1}, {MakeNode<Widget>({"button", 2}),
                     MakeNode<Widget>({"label", 4}),
                     MakeNode<Widget>({"slider", 5})});
  EXPECT_EQ(PatchListing(Diff(before, after)),
            "0 insert slider#5\n"
            "2 update label#4\n");
}

TEST(DiffDeathTest, NullTree) {
  EXPECT_DEATH(Diff<std::string>(nullptr, S("root")), "");
}

}  // namespace
}  // namespace treepatch
