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
#include "tempo/FromTemporalAccessor.h"
#include "tempo/Temporal.h"

namespace tempo {

const BugPatternInfo FromTemporalAccessor::Info = {
    "FromTemporalAccessor",
    "Certain combinations of javaTimeType.from(TemporalAccessor) will always "
    "throw a DateTimeException or return the parameter directly.",
    "Not all java.time types can be created via from(TemporalAccessor). For "
    "example, you can create a Month from a LocalDate (Month.from(localDate)) "
    "because a LocalDate consists of a year, month, and day. However, you "
    "cannot create a LocalDate from a Month (since it doesn't have the year "
    "or day information). Instead of throwing a DateTimeException at "
    "runtime, this checker validates the type transformations at compile "
    "time using static type information.",
    DiagLevel::Error};

FromTemporalAccessor::FromTemporalAccessor(const TypeResolver &Types)
    : m_Types(Types), m_Table(CompatibilityTable::get()) {}

llvm::Optional<TemporalTag>
FromTemporalAccessor::getTag(const Type *T) const {
  if (m_Types.isUnresolved(T))
    return llvm::None;
  std::string name = m_Types.getQualifiedName(T);
  if (name.empty())
    return llvm::None;
  return lookupTemporalTag(name);
}

std::string FromTemporalAccessor::getDisplayName(const Type *T) const {
  if (llvm::Optional<TemporalTag> Tag = getTag(T))
    return getTemporalSimpleName(*Tag).str();
  std::string name = m_Types.getQualifiedName(T);
  size_t dot = name.rfind('.');
  return dot == std::string::npos ? name : name.substr(dot + 1);
}

Verdict FromTemporalAccessor::evaluate(const CallSite &Call) const {
  // Almost every call in a program is rejected here.
  if (!Call.isStaticCallTo("from", TemporalAccessorName))
    return Verdict::none();

  // The libraries themselves are allowed to do what they like.
  if (isTrustedTemporalPackage(Call.getEnclosingPackage()))
    return Verdict::none();

  // Untagged library classes such as ZoneId are not in the table, but a
  // same-type call on them is still redundant.
  const Type *Receiver = Call.getReceiverType();
  llvm::Optional<TemporalTag> Target = getTag(Receiver);
  if (!Target && (m_Types.isUnresolved(Receiver) ||
                  !isTemporalLibraryClass(m_Types.getQualifiedName(Receiver))))
    return Verdict::none();

  const Type *ArgType = Call.getArgumentType();
  if (m_Types.isUnresolved(ArgType)) {
    // Unresolved argument: nothing can be proven about it.
    return Verdict::none();
  }
  if (m_Types.isNamedType(ArgType, TemporalAccessorName))
    return Verdict::none();

  if (m_Types.isSameType(Call.getResultType(), ArgType)) {
    std::string Text = Call.getArgumentSource();
    if (!Call.isArgumentPrimary())
      Text = "(" + Text + ")";
    return Verdict::redundant(std::move(Text));
  }

  llvm::Optional<TemporalTag> Source = getTag(ArgType);
  if (!Target || !Source)
    return Verdict::none();
  if (m_Table.isKnownIncompatible(*Target, *Source))
    return Verdict::invalid();
  return Verdict::none();
}

llvm::Optional<Finding>
FromTemporalAccessor::matchCall(const CallSite &Call) const {
  Verdict V = evaluate(Call);
  if (!V.isFinding())
    return llvm::None;

  Finding F;
  F.Pattern = &Info;
  F.Kind = V.VerdictKind;
  F.Range = Call.getCallRange();

  std::string target = getDisplayName(Call.getReceiverType());
  std::string source = getDisplayName(Call.getArgumentType());
  if (V.VerdictKind == Verdict::AlwaysRedundant) {
    F.ID = DiagID::ERR_FROM_TEMPORAL_ACCESSOR_REDUNDANT;
    F.Fix.replace(Call.getCallRange(), V.ReplacementText);
  } else {
    F.ID = DiagID::ERR_FROM_TEMPORAL_ACCESSOR_INVALID;
  }
  F.Message = DiagnosticEngine::formatMessage(F.ID, Info.Summary, target,
                                              source);
  return F;
}

} // namespace tempo
