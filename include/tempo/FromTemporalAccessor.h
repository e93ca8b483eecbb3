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

#include "tempo/BugChecker.h"
#include "tempo/CompatibilityTable.h"
#include "tempo/Type.h"

namespace tempo {

/// Flags `Target.from(accessor)` calls that provably always throw a
/// DateTimeException (LocalDate.from(month)) or provably return their
/// argument (Instant.from(instant)).
///
/// Only exact static types are used. Whenever the argument's concrete type
/// is unknown, the call is left alone.
class FromTemporalAccessor : public BugChecker {
public:
  static const BugPatternInfo Info;

  explicit FromTemporalAccessor(const TypeResolver &Types);

  const BugPatternInfo &getInfo() const override { return Info; }

  /// Pure function of \p Call; evaluating the same call twice gives the
  /// same verdict.
  Verdict evaluate(const CallSite &Call) const;

  llvm::Optional<Finding> matchCall(const CallSite &Call) const override;

private:
  const TypeResolver &m_Types;
  const CompatibilityTable &m_Table;

  llvm::Optional<TemporalTag> getTag(const Type *T) const;
  std::string getDisplayName(const Type *T) const;
};

} // namespace tempo
