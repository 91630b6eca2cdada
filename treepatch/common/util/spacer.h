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

#ifndef TREEPATCH_COMMON_UTIL_SPACER_H_
#define TREEPATCH_COMMON_UTIL_SPACER_H_

#include <cstddef>
#include <iosfwd>

namespace treepatch {

// Streamable print adapter that prints a number of spaces without allocating
// any temporary string.
struct Spacer {
  explicit Spacer(size_t n, char c = ' ') : repeat(n), repeated_char(c) {}
  size_t repeat;
  char repeated_char;
};

std::ostream &operator<<(std::ostream &, const Spacer &);

// Number of spaces per tree depth level in rendered tree listings.
inline constexpr size_t kIndentWidth = 2;

// Streamable indentation for a node at 'depth' in a tree listing.
// The root is at depth 0 and is not indented.
//
// usage: stream << Indentation(depth) << value << '\n';
struct Indentation {
  explicit Indentation(size_t depth, size_t width = kIndentWidth)
      : depth(depth), width(width) {}
  size_t depth;
  size_t width;  // spaces per level
};

std::ostream &operator<<(std::ostream &, const Indentation &);

}  // namespace treepatch

#endif  // TREEPATCH_COMMON_UTIL_SPACER_H_
