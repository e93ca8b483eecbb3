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
#include "tempo/LibraryModel.h"
#include "tempo/Temporal.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"

#include <cstring>
#include <iostream>
#include <string>

using namespace tempo;

namespace {

static bool require_(bool cond, const std::string &msg) {
  if (cond)
    return true;
  std::cerr << "  - " << msg << "\n";
  return false;
}

/// A call site built from plain values: `Receiver.from(Arg)` inside Package.
class FakeCallSite : public CallSite {
public:
  bool IsStaticFrom = true;
  std::string Package = "com.example";
  const Type *Receiver = nullptr;
  const Type *Argument = nullptr;
  const Type *Result = nullptr;
  std::string ArgumentSource = "value";
  bool ArgumentIsPrimary = true;

  bool isStaticCallTo(const char *Name, const char *ParamType) const override {
    return IsStaticFrom && std::strcmp(Name, "from") == 0 &&
           std::strcmp(ParamType, TemporalAccessorName) == 0;
  }
  std::string getEnclosingPackage() const override { return Package; }
  const Type *getReceiverType() const override { return Receiver; }
  const Type *getArgumentType() const override { return Argument; }
  const Type *getResultType() const override { return Result; }
  std::string getArgumentSource() const override { return ArgumentSource; }
  bool isArgumentPrimary() const override { return ArgumentIsPrimary; }
  SourceRange getCallRange() const override {
    return SourceRange(SourceLocation(10), SourceLocation(30));
  }
  SourceRange getArgumentRange() const override {
    return SourceRange(SourceLocation(24), SourceLocation(29));
  }
};

struct Fixture {
  TypeContext Ctx;
  FromTemporalAccessor Check;

  Fixture() : Check(Ctx) { loadLibraryModel(Ctx); }

  const Type *tag(TemporalTag Tag) {
    return Ctx.getTypeByName(getTemporalTypeName(Tag));
  }

  FakeCallSite call(TemporalTag Target, TemporalTag Source) {
    FakeCallSite site;
    site.Receiver = tag(Target);
    site.Result = site.Receiver;
    site.Argument = tag(Source);
    return site;
  }
};

static std::string pair_(TemporalTag Target, TemporalTag Source) {
  return getTemporalSimpleName(Target).str() + ".from(" +
         getTemporalSimpleName(Source).str() + ")";
}

/// Targets that can never be built from each source, one row per source.
static const struct {
  const char *Source;
  const char *Targets;
} Unconstructible[] = {
      {"DayOfWeek",
       "Instant LocalDate LocalDateTime LocalTime Month MonthDay "
       "OffsetDateTime OffsetTime Year YearMonth ZonedDateTime "
       "ZoneOffset AmPm DayOfMonth DayOfYear Quarter YearQuarter "
       "YearWeek"},
      {"Instant",
       "DayOfWeek LocalDate LocalDateTime LocalTime Month MonthDay "
       "OffsetDateTime OffsetTime Year YearMonth ZonedDateTime "
       "ZoneOffset AmPm DayOfMonth DayOfYear Quarter YearQuarter "
       "YearWeek"},
      {"LocalDate",
       "Instant LocalDateTime LocalTime OffsetDateTime OffsetTime "
       "ZonedDateTime ZoneOffset AmPm"},
      {"LocalDateTime",
       "Instant OffsetDateTime OffsetTime ZonedDateTime ZoneOffset"},
      {"LocalTime",
       "DayOfWeek Instant LocalDate LocalDateTime Month MonthDay "
       "OffsetDateTime OffsetTime Year YearMonth ZonedDateTime "
       "ZoneOffset DayOfMonth DayOfYear Quarter YearQuarter YearWeek"},
      {"Month",
       "DayOfWeek Instant LocalDate LocalDateTime LocalTime MonthDay "
       "OffsetDateTime OffsetTime Year YearMonth ZonedDateTime "
       "ZoneOffset AmPm DayOfMonth DayOfYear YearQuarter YearWeek"},
      {"MonthDay",
       "DayOfWeek Instant LocalDate LocalDateTime LocalTime "
       "OffsetDateTime OffsetTime Year YearMonth ZonedDateTime "
       "ZoneOffset AmPm DayOfYear YearQuarter YearWeek"},
      {"OffsetDateTime",
       ""},
      {"OffsetTime",
       "DayOfWeek Instant LocalDate LocalDateTime Month MonthDay "
       "OffsetDateTime Year YearMonth ZonedDateTime DayOfMonth "
       "DayOfYear Quarter YearQuarter YearWeek"},
      {"Year",
       "DayOfWeek Instant LocalDate LocalDateTime LocalTime Month "
       "MonthDay OffsetDateTime OffsetTime YearMonth ZonedDateTime "
       "ZoneOffset AmPm DayOfMonth DayOfYear Quarter YearQuarter "
       "YearWeek"},
      {"YearMonth",
       "DayOfWeek Instant LocalDate LocalDateTime LocalTime MonthDay "
       "OffsetDateTime OffsetTime ZonedDateTime ZoneOffset AmPm "
       "DayOfMonth DayOfYear YearWeek"},
      {"ZonedDateTime",
       ""},
      {"ZoneOffset",
       "DayOfWeek Instant LocalDate LocalDateTime LocalTime Month "
       "MonthDay OffsetDateTime OffsetTime Year YearMonth "
       "ZonedDateTime AmPm DayOfMonth DayOfYear Quarter YearQuarter "
       "YearWeek"},
      {"AmPm",
       "DayOfWeek Instant LocalDate LocalDateTime LocalTime Month "
       "MonthDay OffsetDateTime OffsetTime Year YearMonth "
       "ZonedDateTime ZoneOffset DayOfMonth DayOfYear Quarter "
       "YearQuarter YearWeek"},
      {"DayOfMonth",
       "DayOfWeek Instant LocalDate LocalDateTime LocalTime Month "
       "MonthDay OffsetDateTime OffsetTime Year YearMonth "
       "ZonedDateTime ZoneOffset AmPm DayOfYear Quarter YearQuarter "
       "YearWeek"},
      {"DayOfYear",
       "DayOfWeek Instant LocalDate LocalDateTime LocalTime Month "
       "MonthDay OffsetDateTime OffsetTime Year YearMonth "
       "ZonedDateTime ZoneOffset AmPm DayOfMonth Quarter YearQuarter "
       "YearWeek"},
      {"Quarter",
       "DayOfWeek Instant LocalDate LocalDateTime LocalTime Month "
       "MonthDay OffsetDateTime OffsetTime Year YearMonth "
       "ZonedDateTime ZoneOffset AmPm DayOfMonth DayOfYear "
       "YearQuarter YearWeek"},
      {"YearQuarter",
       "DayOfWeek Instant LocalDate LocalDateTime LocalTime Month "
       "MonthDay OffsetDateTime OffsetTime YearMonth ZonedDateTime "
       "ZoneOffset AmPm DayOfMonth DayOfYear YearWeek"},
      {"YearWeek",
       "DayOfWeek Instant LocalDate LocalDateTime LocalTime Month "
       "MonthDay OffsetDateTime OffsetTime Year YearMonth "
       "ZonedDateTime ZoneOffset AmPm DayOfMonth DayOfYear Quarter "
       "YearQuarter"},
};

static bool isListed_(TemporalTag Target, TemporalTag Source) {
  for (const auto &Row : Unconstructible) {
    if (getTemporalSimpleName(Source) != Row.Source)
      continue;
    llvm::SmallVector<llvm::StringRef, 20> targets;
    llvm::StringRef(Row.Targets).split(targets, ' ', -1, false);
    for (llvm::StringRef T : targets)
      if (getTemporalSimpleName(Target) == T)
        return true;
  }
  return false;
}

static bool test_every_listed_pair_is_invalid_() {
  Fixture f;
  const CompatibilityTable &table = CompatibilityTable::get();
  bool ok = true;
  unsigned flagged = 0;
  for (TemporalTag Target : getAllTemporalTags()) {
    for (TemporalTag Source : getAllTemporalTags()) {
      if (Target == Source)
        continue;
      Verdict v = f.Check.evaluate(f.call(Target, Source));
      bool expected = isListed_(Target, Source);
      ok &= require_(table.isKnownIncompatible(Target, Source) == expected,
                     pair_(Target, Source) + " disagrees with the table");
      if (expected) {
        flagged++;
        ok &= require_(v.VerdictKind == Verdict::AlwaysInvalid,
                       pair_(Target, Source) + " must be invalid");
      } else {
        ok &= require_(!v.isFinding(),
                       pair_(Target, Source) + " must not be flagged");
      }
    }
  }
  ok &= require_(flagged == 269, "269 pairs must be flagged");
  return ok;
}

static bool test_same_type_is_redundant_() {
  Fixture f;
  bool ok = true;
  for (TemporalTag Tag : getAllTemporalTags()) {
    FakeCallSite site = f.call(Tag, Tag);
    site.ArgumentSource = "this.start";
    Verdict v = f.Check.evaluate(site);
    ok &= require_(v == Verdict::redundant("this.start"),
                   pair_(Tag, Tag) + " must be redundant with the argument");
  }

  FakeCallSite site = f.call(TemporalTag::Instant, TemporalTag::Instant);
  site.ArgumentSource = "early ? a : b";
  site.ArgumentIsPrimary = false;
  ok &= require_(f.Check.evaluate(site) == Verdict::redundant("(early ? a : b)"),
                 "compound arguments are parenthesized");
  return ok;
}

static bool test_examples_() {
  Fixture f;
  bool ok = true;
  ok &= require_(
      f.Check.evaluate(f.call(TemporalTag::LocalDate, TemporalTag::Month))
              .VerdictKind == Verdict::AlwaysInvalid,
      "LocalDate.from(month)");
  ok &= require_(
      !f.Check.evaluate(f.call(TemporalTag::Month, TemporalTag::LocalDate))
           .isFinding(),
      "Month.from(localDate)");
  ok &= require_(!f.Check
                      .evaluate(f.call(TemporalTag::LocalDate,
                                       TemporalTag::ZonedDateTime))
                      .isFinding(),
                 "LocalDate.from(zonedDateTime)");
  ok &= require_(
      f.Check.evaluate(f.call(TemporalTag::YearQuarter, TemporalTag::Quarter))
              .VerdictKind == Verdict::AlwaysInvalid,
      "YearQuarter.from(quarter)");
  return ok;
}

static bool test_accessor_argument_is_unknown_() {
  Fixture f;
  bool ok = true;
  for (TemporalTag Target : getAllTemporalTags()) {
    FakeCallSite site;
    site.Receiver = f.tag(Target);
    site.Result = site.Receiver;
    site.Argument = f.Ctx.getTypeByName(TemporalAccessorName);
    ok &= require_(!f.Check.evaluate(site).isFinding(),
                   getTemporalSimpleName(Target).str() +
                       ".from(accessor) must not be flagged");
  }
  return ok;
}

static bool test_trusted_packages_are_skipped_() {
  Fixture f;
  bool ok = true;
  const char *const packages[] = {"java.time", "java.time.chrono",
                                  "org.threeten.extra",
                                  "tck.java.time.zone"};
  for (const char *pkg : packages) {
    FakeCallSite invalid = f.call(TemporalTag::LocalDate, TemporalTag::Month);
    invalid.Package = pkg;
    FakeCallSite redundant = f.call(TemporalTag::Instant, TemporalTag::Instant);
    redundant.Package = pkg;
    ok &= require_(!f.Check.evaluate(invalid).isFinding(),
                   std::string("invalid pair inside ") + pkg);
    ok &= require_(!f.Check.evaluate(redundant).isFinding(),
                   std::string("redundant pair inside ") + pkg);
  }

  FakeCallSite outside = f.call(TemporalTag::LocalDate, TemporalTag::Month);
  outside.Package = "java.timex";
  ok &= require_(f.Check.evaluate(outside).isFinding(),
                 "java.timex is not trusted");
  outside.Package = "";
  ok &= require_(f.Check.evaluate(outside).isFinding(),
                 "the default package is not trusted");
  return ok;
}

static bool test_unresolved_types_are_skipped_() {
  Fixture f;
  bool ok = true;

  FakeCallSite noArg = f.call(TemporalTag::LocalDate, TemporalTag::Month);
  noArg.Argument = nullptr;
  ok &= require_(!f.Check.evaluate(noArg).isFinding(), "missing argument type");

  FakeCallSite errorArg = f.call(TemporalTag::Instant, TemporalTag::Instant);
  errorArg.Argument = f.Ctx.getError();
  errorArg.Result = f.Ctx.getError();
  ok &= require_(!f.Check.evaluate(errorArg).isFinding(),
                 "error-typed argument and result");

  FakeCallSite errorReceiver = f.call(TemporalTag::LocalDate, TemporalTag::Month);
  errorReceiver.Receiver = f.Ctx.getError();
  ok &= require_(!f.Check.evaluate(errorReceiver).isFinding(),
                 "error-typed receiver");

  FakeCallSite userArg = f.call(TemporalTag::LocalDate, TemporalTag::Month);
  userArg.Argument = f.Ctx.getOrCreateClass("com.example.MyAccessor");
  ok &= require_(!f.Check.evaluate(userArg).isFinding(),
                 "argument of a type outside the table");
  return ok;
}

static bool test_non_temporal_receiver_is_skipped_() {
  Fixture f;
  bool ok = true;

  FakeCallSite zone;
  zone.Receiver = f.Ctx.getTypeByName("java.time.ZoneId");
  zone.Result = zone.Receiver;
  zone.Argument = f.tag(TemporalTag::LocalDate);
  ok &= require_(!f.Check.evaluate(zone).isFinding(), "ZoneId.from(localDate)");

  FakeCallSite own;
  own.Receiver = f.Ctx.getOrCreateClass("com.example.Period");
  own.Result = f.tag(TemporalTag::Month);
  own.Argument = f.tag(TemporalTag::Month);
  ok &= require_(!f.Check.evaluate(own).isFinding(),
                 "user class with its own from(TemporalAccessor)");

  FakeCallSite other = f.call(TemporalTag::LocalDate, TemporalTag::Month);
  other.IsStaticFrom = false;
  ok &= require_(!f.Check.evaluate(other).isFinding(),
                 "a call that is not from(TemporalAccessor)");
  return ok;
}

static bool test_untagged_library_class_is_redundant_() {
  Fixture f;
  bool ok = true;

  FakeCallSite zone;
  zone.Receiver = f.Ctx.getTypeByName("java.time.ZoneId");
  zone.Result = zone.Receiver;
  zone.Argument = zone.Receiver;
  zone.ArgumentSource = "ZoneId.systemDefault()";
  ok &= require_(f.Check.evaluate(zone) ==
                     Verdict::redundant("ZoneId.systemDefault()"),
                 "ZoneId.from(zoneId) returns its argument");
  llvm::Optional<Finding> finding = f.Check.matchCall(zone);
  ok &= require_(finding.hasValue() &&
                     finding->Message.find("ZoneId.from(ZoneId) returns") !=
                         std::string::npos,
                 "message names ZoneId");

  FakeCallSite hijrah;
  hijrah.Receiver = f.Ctx.getOrCreateClass("java.time.chrono.HijrahDate");
  hijrah.Result = hijrah.Receiver;
  hijrah.Argument = hijrah.Receiver;
  ok &= require_(f.Check.evaluate(hijrah).VerdictKind ==
                     Verdict::AlwaysRedundant,
                 "chrono dates count as library classes");

  FakeCallSite lookalike;
  lookalike.Receiver = f.Ctx.getOrCreateClass("java.timex.ZoneId");
  lookalike.Result = lookalike.Receiver;
  lookalike.Argument = lookalike.Receiver;
  ok &= require_(!f.Check.evaluate(lookalike).isFinding(),
                 "java.timex is not java.time");

  FakeCallSite mine;
  mine.Receiver = f.Ctx.getOrCreateClass("com.example.Period");
  mine.Result = mine.Receiver;
  mine.Argument = mine.Receiver;
  ok &= require_(!f.Check.evaluate(mine).isFinding(),
                 "user classes are never judged");

  FakeCallSite offset;
  offset.Receiver = zone.Receiver;
  offset.Result = zone.Receiver;
  offset.Argument = f.tag(TemporalTag::ZoneOffset);
  ok &= require_(!f.Check.evaluate(offset).isFinding(),
                 "ZoneId.from(zoneOffset) is a real conversion");
  return ok;
}

static bool test_evaluate_is_idempotent_() {
  Fixture f;
  bool ok = true;
  FakeCallSite sites[] = {
      f.call(TemporalTag::LocalDate, TemporalTag::Month),
      f.call(TemporalTag::Month, TemporalTag::LocalDate),
      f.call(TemporalTag::Instant, TemporalTag::Instant),
  };
  for (const FakeCallSite &site : sites) {
    Verdict first = f.Check.evaluate(site);
    Verdict second = f.Check.evaluate(site);
    ok &= require_(first == second, "verdicts must not change between calls");
  }
  return ok;
}

static bool test_invalid_finding_() {
  Fixture f;
  bool ok = true;
  llvm::Optional<Finding> finding =
      f.Check.matchCall(f.call(TemporalTag::LocalDate, TemporalTag::Month));
  ok &= require_(finding.hasValue(), "LocalDate.from(month) must be reported");
  if (!finding)
    return false;

  ok &= require_(finding->ID == DiagID::ERR_FROM_TEMPORAL_ACCESSOR_INVALID,
                 "invalid finding id");
  ok &= require_(finding->Pattern == &FromTemporalAccessor::Info,
                 "finding must point at the pattern");
  ok &= require_(finding->Fix.empty(), "invalid calls have no fix");
  ok &= require_(finding->Range.Begin == SourceLocation(10) &&
                     finding->Range.End == SourceLocation(30),
                 "finding covers the call");
  ok &= require_(finding->Message.find(
                     "LocalDate.from(Month) always throws") !=
                     std::string::npos,
                 "message names the conversion: " + finding->Message);
  ok &= require_(finding->Message.rfind(FromTemporalAccessor::Info.Summary,
                                        0) == 0,
                 "message starts with the summary");
  return ok;
}

static bool test_redundant_finding_() {
  Fixture f;
  bool ok = true;
  FakeCallSite site = f.call(TemporalTag::YearWeek, TemporalTag::YearWeek);
  site.ArgumentSource = "weeks.get(0)";
  llvm::Optional<Finding> finding = f.Check.matchCall(site);
  ok &= require_(finding.hasValue(), "YearWeek.from(yearWeek) is reported");
  if (!finding)
    return false;

  ok &= require_(finding->ID == DiagID::ERR_FROM_TEMPORAL_ACCESSOR_REDUNDANT,
                 "redundant finding id");
  ok &= require_(finding->Fix.Replacements.size() == 1,
                 "redundant calls carry one replacement");
  if (finding->Fix.Replacements.size() == 1) {
    const Replacement &r = finding->Fix.Replacements.front();
    ok &= require_(r.Text == "weeks.get(0)", "fix is the argument text");
    ok &= require_(r.Range.Begin == SourceLocation(10) &&
                       r.Range.End == SourceLocation(30),
                   "fix replaces the whole call");
  }
  ok &= require_(finding->Message.find("YearWeek.from(YearWeek) returns") !=
                     std::string::npos,
                 "message names the conversion: " + finding->Message);

  ok &= require_(!f.Check
                      .matchCall(f.call(TemporalTag::Month,
                                        TemporalTag::LocalDate))
                      .hasValue(),
                 "valid calls produce nothing");
  return ok;
}

} // namespace

int main() {
  struct Case {
    const char *name;
    bool (*fn)();
  };

  const Case cases[] = {
      {"every_listed_pair_is_invalid", test_every_listed_pair_is_invalid_},
      {"same_type_is_redundant", test_same_type_is_redundant_},
      {"examples", test_examples_},
      {"accessor_argument_is_unknown", test_accessor_argument_is_unknown_},
      {"trusted_packages_are_skipped", test_trusted_packages_are_skipped_},
      {"unresolved_types_are_skipped", test_unresolved_types_are_skipped_},
      {"non_temporal_receiver_is_skipped",
       test_non_temporal_receiver_is_skipped_},
      {"untagged_library_class_is_redundant",
       test_untagged_library_class_is_redundant_},
      {"evaluate_is_idempotent", test_evaluate_is_idempotent_},
      {"invalid_finding", test_invalid_finding_},
      {"redundant_finding", test_redundant_finding_},
  };

  int failed = 0;
  for (const auto &c : cases) {
    std::cout << "[TEST] " << c.name << "\n";
    if (!c.fn()) {
      ++failed;
      std::cout << "  -> FAIL\n";
    } else {
      std::cout << "  -> PASS\n";
    }
  }

  if (failed != 0) {
    std::cout << "\nFAILED " << failed << " test(s)\n";
    return 1;
  }
  std::cout << "\nALL TESTS PASSED\n";
  return 0;
}
