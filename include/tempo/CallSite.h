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

#include "tempo/SourceLocation.h"
#include <string>

namespace tempo {

class Type;

/// Read-only view of one method call, as a check sees it. The checker builds
/// one per call expression; tests build them from plain values.
class CallSite {
public:
  virtual ~CallSite() = default;

  /// True when the call invokes a static method named \p Name whose only
  /// parameter is declared as the class \p ParamType.
  virtual bool isStaticCallTo(const char *Name,
                              const char *ParamType) const = 0;

  /// Package of the compilation unit containing the call; empty for the
  /// default package.
  virtual std::string getEnclosingPackage() const = 0;

  /// The class the method was looked up in: the qualifier's type for
  /// `Type.m()` and `expr.m()`, the declaring class otherwise.
  virtual const Type *getReceiverType() const = 0;

  /// Static type of the sole argument; null when there is none.
  virtual const Type *getArgumentType() const = 0;

  /// Static type of the call expression itself.
  virtual const Type *getResultType() const = 0;

  /// The argument exactly as written in the source.
  virtual std::string getArgumentSource() const = 0;

  /// False when the argument text needs parentheses to stand where the
  /// whole call stood, as in `Instant.from(a ? b : c).getNano()`.
  virtual bool isArgumentPrimary() const { return true; }

  virtual SourceRange getCallRange() const = 0;
  virtual SourceRange getArgumentRange() const = 0;
};

/// Outcome of evaluating a check on one call site.
struct Verdict {
  enum Kind { NoFinding, AlwaysRedundant, AlwaysInvalid };

  Kind VerdictKind = NoFinding;
  std::string ReplacementText; // only for AlwaysRedundant

  static Verdict none() { return Verdict(); }
  static Verdict invalid() {
    Verdict v;
    v.VerdictKind = AlwaysInvalid;
    return v;
  }
  static Verdict redundant(std::string Replacement) {
    Verdict v;
    v.VerdictKind = AlwaysRedundant;
    v.ReplacementText = std::move(Replacement);
    return v;
  }

  bool isFinding() const { return VerdictKind != NoFinding; }
  bool operator==(const Verdict &Other) const {
    return VerdictKind == Other.VerdictKind &&
           ReplacementText == Other.ReplacementText;
  }
};

} // namespace tempo
