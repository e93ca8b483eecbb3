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

#include "tempo/CallSite.h"
#include "tempo/DiagnosticEngine.h"
#include "tempo/SourceLocation.h"
#include "llvm/ADT/Optional.h"
#include <string>
#include <vector>

namespace tempo {

/// Static description of a check, shown by --list-checks and --explain.
struct BugPatternInfo {
  const char *Name;
  const char *Summary;
  const char *Explanation;
  DiagLevel DefaultSeverity;
};

/// Replace the half-open source range with Text.
struct Replacement {
  SourceRange Range;
  std::string Text;
};

struct SuggestedFix {
  std::vector<Replacement> Replacements;

  bool empty() const { return Replacements.empty(); }
  void replace(SourceRange Range, std::string Text) {
    Replacements.push_back({Range, std::move(Text)});
  }
};

/// One problem found by a check.
struct Finding {
  const BugPatternInfo *Pattern = nullptr;
  DiagID ID = DiagID::NUM_DIAGNOSTICS;
  Verdict::Kind Kind = Verdict::NoFinding;
  std::string Message;
  SourceRange Range;
  SuggestedFix Fix;
};

/// A check that looks at method calls.
class BugChecker {
public:
  virtual ~BugChecker() = default;

  virtual const BugPatternInfo &getInfo() const = 0;

  /// Returns a finding for \p Call, or None when the call is fine.
  virtual llvm::Optional<Finding> matchCall(const CallSite &Call) const = 0;
};

} // namespace tempo
