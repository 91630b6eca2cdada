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

#include "treepatch/common/util/file-util.h"

#include <filesystem>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "gtest/gtest.h"

#undef EXPECT_OK
#define EXPECT_OK(value)      \
  {                           \
    const auto &s = (value);  \
    EXPECT_TRUE(s.ok()) << s; \
  }
#undef ASSERT_OK
#define ASSERT_OK(value)      \
  {                           \
    const auto &s = (value);  \
    ASSERT_TRUE(s.ok()) << s; \
  }

namespace treepatch {
namespace {

std::string TempPath(absl::string_view name) {
  return absl::StrCat(::testing::TempDir(), "/", name);
}

TEST(FileUtil, IsStdin) {
  EXPECT_TRUE(file::IsStdin("-"));
  EXPECT_FALSE(file::IsStdin(""));
  EXPECT_FALSE(file::IsStdin("--"));
  EXPECT_FALSE(file::IsStdin("before.tree"));
}

TEST(FileUtil, ReadBackWrittenTree) {
  const std::string test_file = TempPath("read-back.tree");
  constexpr absl::string_view kTreeText =
      "root\n"
      "  child1 @child1\n"
      "  child2\n";
  ASSERT_OK(file::SetContents(test_file, kTreeText));
  const absl::StatusOr<std::string> content_or =
      file::GetContentAsString(test_file);
  ASSERT_OK(content_or.status());
  EXPECT_EQ(*content_or, kTreeText);
}

TEST(FileUtil, WritingAgainReplacesContent) {
  const std::string test_file = TempPath("rewrite.tree");
  ASSERT_OK(file::SetContents(test_file, "a much longer first version\n"));
  ASSERT_OK(file::SetContents(test_file, "short\n"));
  const absl::StatusOr<std::string> content_or =
      file::GetContentAsString(test_file);
  ASSERT_OK(content_or.status());
  EXPECT_EQ(*content_or, "short\n");
}

TEST(FileUtil, EmptyFile) {
  const std::string test_file = TempPath("empty.tree");
  ASSERT_OK(file::SetContents(test_file, ""));
  const absl::StatusOr<std::string> content_or =
      file::GetContentAsString(test_file);
  ASSERT_OK(content_or.status());
  EXPECT_TRUE(content_or->empty());
}

TEST(FileUtil, NonExistentFileIsNotFound) {
  const absl::StatusOr<std::string> content_or =
      file::GetContentAsString("does-not-exist");
  EXPECT_FALSE(content_or.ok());
  EXPECT_TRUE(absl::IsNotFound(content_or.status())) << content_or.status();
  EXPECT_TRUE(
      absl::StartsWith(content_or.status().message(), "does-not-exist:"))
      << "expect filename prefixed, but got " << content_or.status();
}

TEST(FileUtil, DirectoryIsNotAFile) {
  const std::string test_dir = TempPath("tree-dir");
  std::filesystem::create_directories(test_dir);
  EXPECT_TRUE(absl::IsInvalidArgument(file::FileExists(test_dir)));

  const absl::StatusOr<std::string> content_or =
      file::GetContentAsString(test_dir);
  EXPECT_FALSE(content_or.ok());
  EXPECT_TRUE(absl::IsInvalidArgument(content_or.status()));
  EXPECT_TRUE(absl::StartsWith(content_or.status().message(), test_dir))
      << "expect filename prefixed, but got " << content_or.status();
}

}  // namespace
}  // namespace treepatch
