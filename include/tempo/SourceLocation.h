// Copyright (c) 2025 YiZhonghua<zhyi@dpai.com>. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include <cstdint>
#include <functional>

namespace tempo {

/// SourceLocation - A 32-bit offset into the virtual location space owned by
/// the SourceManager. Every loaded file occupies a disjoint slice of it.
class SourceLocation {
  uint32_t ID = 0;

public:
  SourceLocation() = default;
  explicit SourceLocation(uint32_t ID) : ID(ID) {}

  bool isValid() const { return ID != 0; }
  bool isInvalid() const { return ID == 0; }

  uint32_t getRawEncoding() const { return ID; }
  static SourceLocation getFromRawEncoding(uint32_t Encoding) {
    return SourceLocation(Encoding);
  }

  SourceLocation getLocWithOffset(int32_t Offset) const {
    return SourceLocation(static_cast<uint32_t>(ID + Offset));
  }

  bool operator==(const SourceLocation &RHS) const { return ID == RHS.ID; }
  bool operator!=(const SourceLocation &RHS) const { return ID != RHS.ID; }
  bool operator<(const SourceLocation &RHS) const { return ID < RHS.ID; }
  bool operator<=(const SourceLocation &RHS) const { return ID <= RHS.ID; }
};

/// SourceRange - A half-open [Begin, End) character range.
struct SourceRange {
  SourceLocation Begin;
  SourceLocation End;

  SourceRange() = default;
  SourceRange(SourceLocation B, SourceLocation E) : Begin(B), End(E) {}

  bool isValid() const { return Begin.isValid() && End.isValid(); }
  uint32_t size() const {
    return isValid() ? End.getRawEncoding() - Begin.getRawEncoding() : 0;
  }
  bool overlaps(const SourceRange &RHS) const {
    return Begin < RHS.End && RHS.Begin < End;
  }
};

/// FullSourceLoc - This represents a resolved source location, containing
/// filename, line, and column information.
struct FullSourceLoc {
  const char *FileName = "";
  unsigned Line = 0;
  unsigned Column = 0;

  bool isValid() const { return FileName && *FileName; }
};

} // namespace tempo

namespace std {
template <> struct hash<tempo::SourceLocation> {
  size_t operator()(const tempo::SourceLocation &Loc) const {
    return Loc.getRawEncoding();
  }
};
} // namespace std
