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

#include "treepatch/tree/patch.h"

#include <ostream>

#include "treepatch/common/util/logging.h"

namespace treepatch {

std::ostream &operator<<(std::ostream &stream, PatchKind kind) {
  switch (kind) {
    case PatchKind::kUpdate:
      return stream << "update";
    case PatchKind::kInsert:
      return stream << "insert";
    case PatchKind::kRemove:
      return stream << "remove";
  }
  LOG(FATAL) << "Unknown PatchKind: " << static_cast<int>(kind);
  return stream;
}

}  // namespace treepatch
