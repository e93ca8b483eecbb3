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

#include "tempo/Temporal.h"
#include "llvm/ADT/SmallVector.h"
#include <bitset>
#include <initializer_list>

namespace tempo {

/// Which `Target.from(source)` conversions always throw because the source
/// cannot supply the fields the target needs.
///
/// The relation is directional: Month.from(localDate) works,
/// LocalDate.from(month) does not. Tags absent from the data are never
/// flagged, and a tag is never incompatible with itself (that case is a
/// redundant conversion, not an impossible one).
class CompatibilityTable {
public:
  /// The process-wide table. Built on first use, immutable afterwards.
  static const CompatibilityTable &get();

  bool isKnownIncompatible(TemporalTag Target, TemporalTag Source) const {
    return m_Incompatible[getTagIndex(Target)].test(getTagIndex(Source));
  }

  /// Sources from which \p Target can never be built.
  llvm::SmallVector<TemporalTag, 8>
  getIncompatibleSources(TemporalTag Target) const;

  /// Targets that can never be built from \p Source.
  llvm::SmallVector<TemporalTag, 8>
  getUnconstructibleTargets(TemporalTag Source) const;

  unsigned getNumIncompatiblePairs() const;

private:
  CompatibilityTable();

  /// Records that every `Target.from(source)` in \p Targets always throws.
  void put(TemporalTag Source, std::initializer_list<TemporalTag> Targets);

  // m_Incompatible[Target][Source]
  std::bitset<NumTemporalTags> m_Incompatible[NumTemporalTags];
};

} // namespace tempo
